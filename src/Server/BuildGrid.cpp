// =============================================================================
// BLOCKFORGE - BUILD GRID IMPLEMENTATION
// Placement, clearing and neighbor socket mirroring
// =============================================================================

#include "Server/BuildGrid.hpp"
#include "Shared/Logger.hpp"

#include <array>
#include <utility>

namespace blockforge::server {

namespace {

const SocketLabel EMPTY_LABEL{};

// Empty-neighbor search order
constexpr std::array<Direction, 6> NEIGHBOR_ORDER = {
    Direction::Left, Direction::Right,
    Direction::Back, Direction::Front,
    Direction::Down, Direction::Up,
};

} // namespace

// =============================================================================
// GRID CONFIGURATION
// =============================================================================

std::vector<std::string> GridConfig::validate() const {
    std::vector<std::string> problems;
    if (!dims.is_valid()) {
        problems.push_back("grid dimensions must be positive, got " +
                           std::to_string(dims.x) + "x" + std::to_string(dims.y) + "x" + std::to_string(dims.z));
    }
    if (ground_socket.empty()) {
        problems.push_back("ground socket label is empty");
    }
    if (!ground_mask.empty() && dims.is_valid() &&
        ground_mask.size() != static_cast<std::size_t>(dims.x) * static_cast<std::size_t>(dims.z)) {
        problems.push_back("ground mask has " + std::to_string(ground_mask.size()) +
                           " entries, expected " + std::to_string(dims.x * dims.z));
    }
    return problems;
}

bool GridConfig::load(const Settings& settings) {
    bool ok = true;
    for (const auto& [key, value] : {std::pair<const char*, GridCoord*>{"grid.size_x", &dims.x},
                                     {"grid.size_y", &dims.y},
                                     {"grid.size_z", &dims.z}}) {
        if (!settings.read(key, *value)) {
            BLOCKFORGE_ERROR("Grid", key, " is not an integer: ", settings.get_string(key));
            ok = false;
        }
    }
    if (!ok) return false;

    ground_socket = settings.get_string("grid.ground_socket", ground_socket);

    // One string per Z row, one character per X column: '#' ground, '.' none
    const std::vector<std::string> rows = settings.get_string_list("grid.ground_rows");
    if (rows.empty()) {
        ground_mask.clear();
        return true;
    }

    if (rows.size() != static_cast<std::size_t>(dims.z)) {
        BLOCKFORGE_ERROR("Grid", "ground_rows has ", rows.size(), " rows, expected ", dims.z);
        return false;
    }

    ground_mask.assign(static_cast<std::size_t>(dims.x) * static_cast<std::size_t>(dims.z), true);
    for (std::size_t z = 0; z < rows.size(); ++z) {
        const std::string& row = rows[z];
        if (row.size() != static_cast<std::size_t>(dims.x)) {
            BLOCKFORGE_ERROR("Grid", "ground_rows[", z, "] has ", row.size(), " columns, expected ", dims.x);
            return false;
        }
        for (std::size_t x = 0; x < row.size(); ++x) {
            const char c = row[x];
            if (c != '#' && c != '.') {
                BLOCKFORGE_ERROR("Grid", "ground_rows[", z, "] has invalid character '", c, "'");
                return false;
            }
            ground_mask[z * row.size() + x] = (c == '#');
        }
    }
    return true;
}

// =============================================================================
// CONSTRUCTION
// =============================================================================

BuildGrid::BuildGrid(GridConfig config)
    : m_config(std::move(config))
{
    const std::size_t columns = m_config.dims.is_valid()
        ? static_cast<std::size_t>(m_config.dims.x) * static_cast<std::size_t>(m_config.dims.z)
        : 0;
    if (m_config.ground_mask.size() != columns) {
        m_config.ground_mask.assign(columns, true);
    }
    reset_cells();
}

void BuildGrid::reset_cells() {
    m_cells.assign(m_config.dims.volume(), GridCell{});
    m_occupied = 0;

    // Ground shows up on the Down face of the bottom layer
    for (GridCoord z = 0; z < m_config.dims.z; ++z) {
        for (GridCoord x = 0; x < m_config.dims.x; ++x) {
            if (GridCell* c = cell_mut({x, 0, z})) {
                c->sockets.set(Direction::Down, ground_socket_at(x, z));
            }
        }
    }
}

// =============================================================================
// QUERY
// =============================================================================

const GridCell* BuildGrid::cell(const GridPosition& pos) const noexcept {
    if (!contains(pos)) return nullptr;
    return &m_cells[m_config.dims.index_of(pos)];
}

GridCell* BuildGrid::cell_mut(const GridPosition& pos) noexcept {
    if (!contains(pos)) return nullptr;
    return &m_cells[m_config.dims.index_of(pos)];
}

bool BuildGrid::is_occupied(const GridPosition& pos) const noexcept {
    const GridCell* c = cell(pos);
    return c != nullptr && c->occupied;
}

const PlacedBlock* BuildGrid::block_at(const GridPosition& pos) const noexcept {
    const GridCell* c = cell(pos);
    if (c == nullptr || !c->placed) return nullptr;
    return &*c->placed;
}

const SocketLabel& BuildGrid::socket_at(const GridPosition& pos, Direction d) const noexcept {
    const GridCell* c = cell(pos);
    if (c == nullptr) return EMPTY_LABEL;
    return c->sockets.get(d);
}

std::size_t BuildGrid::column_index(GridCoord x, GridCoord z) const noexcept {
    return static_cast<std::size_t>(z) * static_cast<std::size_t>(m_config.dims.x) + static_cast<std::size_t>(x);
}

bool BuildGrid::has_ground(GridCoord x, GridCoord z) const noexcept {
    if (x < 0 || x >= m_config.dims.x || z < 0 || z >= m_config.dims.z) return false;
    return m_config.ground_mask[column_index(x, z)];
}

const SocketLabel& BuildGrid::ground_socket_at(GridCoord x, GridCoord z) const noexcept {
    return has_ground(x, z) ? m_config.ground_socket : EMPTY_LABEL;
}

std::vector<GridPosition> BuildGrid::empty_neighbors(const GridPosition& pos) const {
    std::vector<GridPosition> out;
    out.reserve(NEIGHBOR_ORDER.size());
    for (Direction d : NEIGHBOR_ORDER) {
        const GridPosition n = pos.neighbor(d);
        if (contains(n) && !is_occupied(n)) {
            out.push_back(n);
        }
    }
    return out;
}

std::vector<GridPosition> BuildGrid::occupied_positions() const {
    std::vector<GridPosition> out;
    out.reserve(m_occupied);
    for_each_occupied([&out](const GridPosition& pos, const PlacedBlock&) {
        out.push_back(pos);
    });
    return out;
}

void BuildGrid::for_each_occupied(const std::function<void(const GridPosition&, const PlacedBlock&)>& fn) const {
    const GridDimensions& d = m_config.dims;
    for (GridCoord y = 0; y < d.y; ++y) {
        for (GridCoord z = 0; z < d.z; ++z) {
            for (GridCoord x = 0; x < d.x; ++x) {
                const GridCell& c = m_cells[d.index_of({x, y, z})];
                if (c.occupied && c.placed) {
                    fn({x, y, z}, *c.placed);
                }
            }
        }
    }
}

// =============================================================================
// MUTATION
// =============================================================================

bool BuildGrid::place(const BlockDefinition& block, const GridPosition& pos, Rotation rotation) {
    GridCell* target = cell_mut(pos);
    if (target == nullptr || target->occupied) {
        return false;
    }

    PlacedBlock placed;
    placed.block = &block;
    placed.rotation = rotation;
    placed.sockets = rotate(block.oriented, rotation);

    target->occupied = true;
    target->sockets = placed.sockets;
    target->placed = std::move(placed);
    ++m_occupied;

    // Mirror every outward face onto the neighbor slot that faces back here
    for (Direction d : ALL_DIRECTIONS) {
        if (GridCell* n = cell_mut(pos.neighbor(d))) {
            n->sockets.set(direction::opposite(d), target->sockets.get(d));
        }
    }
    return true;
}

bool BuildGrid::clear(const GridPosition& pos) {
    GridCell* target = cell_mut(pos);
    if (target == nullptr || !target->occupied) {
        return false;
    }

    target->occupied = false;
    target->placed.reset();
    target->sockets = SocketSet{};
    --m_occupied;

    for (Direction d : ALL_DIRECTIONS) {
        GridCell* n = cell_mut(pos.neighbor(d));
        if (n == nullptr) continue;

        const Direction back = direction::opposite(d);
        if (n->occupied && n->placed) {
            // Neighbor keeps its own face; this cell now sees it
            const SocketLabel& own = n->placed->sockets.get(back);
            n->sockets.set(back, own);
            target->sockets.set(d, own);
        } else {
            n->sockets.set(back, SocketLabel{});
        }
    }

    if (pos.y == 0) {
        target->sockets.set(Direction::Down, ground_socket_at(pos.x, pos.z));
    }
    return true;
}

void BuildGrid::clear_all() {
    reset_cells();
}

void BuildGrid::set_ground(GridCoord x, GridCoord z, bool has_ground) {
    if (x < 0 || x >= m_config.dims.x || z < 0 || z >= m_config.dims.z) return;
    m_config.ground_mask[column_index(x, z)] = has_ground;

    GridCell* c = cell_mut({x, 0, z});
    if (c != nullptr && !c->occupied) {
        c->sockets.set(Direction::Down, ground_socket_at(x, z));
    }
}

void BuildGrid::set_all_ground(bool has_ground) {
    for (GridCoord z = 0; z < m_config.dims.z; ++z) {
        for (GridCoord x = 0; x < m_config.dims.x; ++x) {
            set_ground(x, z, has_ground);
        }
    }
}

} // namespace blockforge::server
