// =============================================================================
// BLOCKFORGE - BUILD GRID
// Fixed-size 3D cell array with bidirectionally mirrored socket state
// =============================================================================
#pragma once

#include "Shared/BlockRegistry.hpp"
#include "Shared/Orientation.hpp"
#include "Shared/Settings.hpp"
#include "Shared/Types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace blockforge::server {

// =============================================================================
// PLACED BLOCK (a definition plus its committed rotation)
// =============================================================================
struct PlacedBlock {
    const BlockDefinition* block = nullptr;
    Rotation rotation = Rotation::R0;
    SocketSet sockets;                      // Rotated, in world directions

    [[nodiscard]] const std::string& name() const noexcept { return block->name; }
};

// =============================================================================
// GRID CELL
// `sockets` holds the effective label per face: the placed block's own
// socket, or the socket a neighbor exposes toward this cell, or ground.
// =============================================================================
struct GridCell {
    bool occupied = false;
    std::optional<PlacedBlock> placed;
    SocketSet sockets;
};

// =============================================================================
// GRID CONFIGURATION
// =============================================================================
struct GridConfig {
    GridDimensions dims{10, 5, 10};
    SocketLabel ground_socket = "ground";

    // Row-major over (z, x); empty means every column has ground
    std::vector<bool> ground_mask;

    // Empty result means valid
    [[nodiscard]] std::vector<std::string> validate() const;

    // [grid] size_x / size_y / size_z / ground_socket / ground_rows
    bool load(const Settings& settings);
};

// =============================================================================
// BUILD GRID
// =============================================================================
class BuildGrid {
public:
    // Placed cells point into the registry, which must outlive the grid
    explicit BuildGrid(GridConfig config);

    // =============================================================================
    // QUERY
    // =============================================================================

    [[nodiscard]] const GridDimensions& dims() const noexcept { return m_config.dims; }
    [[nodiscard]] const GridConfig& config() const noexcept { return m_config; }

    [[nodiscard]] bool contains(const GridPosition& pos) const noexcept {
        return m_config.dims.contains(pos);
    }

    // nullptr when out of bounds
    [[nodiscard]] const GridCell* cell(const GridPosition& pos) const noexcept;

    [[nodiscard]] bool is_occupied(const GridPosition& pos) const noexcept;

    [[nodiscard]] const PlacedBlock* block_at(const GridPosition& pos) const noexcept;

    // Effective socket of a cell face; empty label when out of bounds
    [[nodiscard]] const SocketLabel& socket_at(const GridPosition& pos, Direction d) const noexcept;

    // Ground label under column (x, z), or empty when that column has no ground
    [[nodiscard]] const SocketLabel& ground_socket_at(GridCoord x, GridCoord z) const noexcept;

    [[nodiscard]] bool has_ground(GridCoord x, GridCoord z) const noexcept;

    // In-bounds empty neighbors, order -X, +X, -Z, +Z, -Y, +Y
    [[nodiscard]] std::vector<GridPosition> empty_neighbors(const GridPosition& pos) const;

    [[nodiscard]] std::size_t occupied_count() const noexcept { return m_occupied; }

    // Layer by layer, X fastest
    [[nodiscard]] std::vector<GridPosition> occupied_positions() const;

    void for_each_occupied(const std::function<void(const GridPosition&, const PlacedBlock&)>& fn) const;

    // =============================================================================
    // MUTATION
    // =============================================================================

    // Commits without socket checks; fails only when out of bounds or occupied
    bool place(const BlockDefinition& block, const GridPosition& pos, Rotation rotation);

    // Returns false if the cell was already empty or out of bounds
    bool clear(const GridPosition& pos);

    void clear_all();

    void set_ground(GridCoord x, GridCoord z, bool has_ground);
    void set_all_ground(bool has_ground);

private:
    [[nodiscard]] GridCell* cell_mut(const GridPosition& pos) noexcept;
    [[nodiscard]] std::size_t column_index(GridCoord x, GridCoord z) const noexcept;
    void reset_cells();

    GridConfig m_config;
    std::vector<GridCell> m_cells;
    std::size_t m_occupied = 0;
};

} // namespace blockforge::server
