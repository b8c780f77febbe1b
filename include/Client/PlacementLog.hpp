// =============================================================================
// BLOCKFORGE - PLACEMENT LOG
// Recording placement sink; writes a plain-text placement listing
// =============================================================================
#pragma once

#include "Server/StructureGenerator.hpp"
#include "Shared/Types.hpp"

#include <string>
#include <vector>

namespace blockforge::client {

class PlacementLog final : public server::PlacementSink {
public:
    struct Entry {
        enum class Kind { Place, Clear };

        Kind kind = Kind::Place;
        GridPosition position;
        std::string block;                  // Empty for clears
        Rotation rotation = Rotation::R0;
        std::string mesh;
    };

    bool on_place(const GridPosition& pos, const server::PlacedBlock& placed) override;
    void on_clear(const GridPosition& pos) override;

    // A refusing log still records, but reports failure to the generator
    void set_accepting(bool accepting) noexcept { m_accepting = accepting; }

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] std::size_t placements() const noexcept;

    // "place <block> <x> <y> <z> <degrees> <mesh>" / "clear <x> <y> <z>", one per line
    [[nodiscard]] std::string to_text() const;
    bool write(const std::string& path) const;

    void clear() { m_entries.clear(); }

private:
    std::vector<Entry> m_entries;
    bool m_accepting = true;
};

} // namespace blockforge::client
