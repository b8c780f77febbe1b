// =============================================================================
// BLOCKFORGE - PLACEMENT LOG IMPLEMENTATION
// =============================================================================

#include "Client/PlacementLog.hpp"
#include "Shared/Logger.hpp"

#include <fstream>
#include <sstream>

namespace blockforge::client {

bool PlacementLog::on_place(const GridPosition& pos, const server::PlacedBlock& placed) {
    Entry entry;
    entry.kind = Entry::Kind::Place;
    entry.position = pos;
    entry.block = placed.name();
    entry.rotation = placed.rotation;
    entry.mesh = placed.block->mesh;
    m_entries.push_back(std::move(entry));
    return m_accepting;
}

void PlacementLog::on_clear(const GridPosition& pos) {
    Entry entry;
    entry.kind = Entry::Kind::Clear;
    entry.position = pos;
    m_entries.push_back(std::move(entry));
}

std::size_t PlacementLog::placements() const noexcept {
    std::size_t count = 0;
    for (const Entry& e : m_entries) {
        if (e.kind == Entry::Kind::Place) ++count;
    }
    return count;
}

std::string PlacementLog::to_text() const {
    std::ostringstream out;
    for (const Entry& e : m_entries) {
        const GridPosition& p = e.position;
        if (e.kind == Entry::Kind::Place) {
            out << "place " << e.block << " " << p.x << " " << p.y << " " << p.z << " "
                << rotation::to_degrees(e.rotation);
            if (!e.mesh.empty()) out << " " << e.mesh;
            out << "\n";
        } else {
            out << "clear " << p.x << " " << p.y << " " << p.z << "\n";
        }
    }
    return out.str();
}

bool PlacementLog::write(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        BLOCKFORGE_ERROR("PlacementLog", "Failed to open: ", path);
        return false;
    }
    file << to_text();
    return static_cast<bool>(file);
}

} // namespace blockforge::client
