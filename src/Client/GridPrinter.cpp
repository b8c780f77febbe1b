// =============================================================================
// BLOCKFORGE - GRID PRINTER IMPLEMENTATION
// =============================================================================

#include "Client/GridPrinter.hpp"

#include <sstream>
#include <unordered_set>

namespace blockforge::client {

namespace {

constexpr std::string_view SYMBOLS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvw"
    "0123456789";

} // namespace

GridPrinter::GridPrinter(const BlockRegistry& blocks) {
    std::size_t next = 0;
    for (const BlockDefinition& block : blocks.all()) {
        const char symbol = next < SYMBOLS.size() ? SYMBOLS[next] : '?';
        ++next;
        m_order.emplace_back(block.name, symbol);
        m_symbols.emplace(block.name, symbol);
    }
}

char GridPrinter::symbol_for(std::string_view block_name) const {
    auto it = m_symbols.find(std::string(block_name));
    return it != m_symbols.end() ? it->second : '?';
}

std::string GridPrinter::render(const server::BuildGrid& grid, const std::vector<GridPosition>& invalid) const {
    const std::unordered_set<GridPosition> invalid_set(invalid.begin(), invalid.end());
    const GridDimensions& dims = grid.dims();

    std::ostringstream out;
    for (GridCoord y = dims.y - 1; y >= 0; --y) {
        out << "y = " << y << "\n";
        for (GridCoord z = 0; z < dims.z; ++z) {
            out << "  ";
            for (GridCoord x = 0; x < dims.x; ++x) {
                const GridPosition pos{x, y, z};
                if (const server::PlacedBlock* placed = grid.block_at(pos)) {
                    out << symbol_for(placed->name());
                } else if (invalid_set.count(pos) != 0) {
                    out << INVALID_SYMBOL;
                } else {
                    out << EMPTY_SYMBOL;
                }
            }
            out << "\n";
        }
    }
    return out.str();
}

std::string GridPrinter::legend() const {
    std::ostringstream out;
    for (const auto& [name, symbol] : m_order) {
        out << "  " << symbol << " = " << name << "\n";
    }
    out << "  " << EMPTY_SYMBOL << " = empty, " << INVALID_SYMBOL << " = unfillable\n";
    return out.str();
}

} // namespace blockforge::client
