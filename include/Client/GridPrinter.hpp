// =============================================================================
// BLOCKFORGE - GRID PRINTER
// ASCII layer-by-layer dump of a build grid
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Shared/BlockRegistry.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace blockforge::client {

class GridPrinter {
public:
    static constexpr char EMPTY_SYMBOL = '.';
    static constexpr char INVALID_SYMBOL = 'x';

    // One symbol per block, in catalog order: A-Z, a-w, 0-9, then '?'
    explicit GridPrinter(const BlockRegistry& blocks);

    [[nodiscard]] char symbol_for(std::string_view block_name) const;

    // Top layer first; within a layer one row per Z, back (z = 0) first
    [[nodiscard]] std::string render(const server::BuildGrid& grid,
                                     const std::vector<GridPosition>& invalid = {}) const;

    // "A = Wall" lines, catalog order
    [[nodiscard]] std::string legend() const;

private:
    std::vector<std::pair<std::string, char>> m_order;
    std::unordered_map<std::string, char> m_symbols;
};

} // namespace blockforge::client
