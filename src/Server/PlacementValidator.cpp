// =============================================================================
// BLOCKFORGE - PLACEMENT VALIDATOR IMPLEMENTATION
// =============================================================================

#include "Server/PlacementValidator.hpp"
#include "Shared/Orientation.hpp"

namespace blockforge::server {

std::string_view rejection_name(PlacementRejection r) noexcept {
    switch (r) {
        case PlacementRejection::None:                return "ok";
        case PlacementRejection::OutOfBounds:         return "out of bounds";
        case PlacementRejection::Occupied:            return "occupied";
        case PlacementRejection::MissingBottomSocket: return "missing bottom socket";
        case PlacementRejection::SocketMismatch:      return "socket mismatch";
        case PlacementRejection::NoSupport:           return "no support";
    }
    return "unknown";
}

std::string PlacementCheck::describe() const {
    std::string text(rejection_name(rejection));
    if (direction) {
        text += " facing ";
        text += direction::name(*direction);
    }
    if (conflict) {
        text += " at " + conflict->to_string();
    }
    return text;
}

// =============================================================================
// SINGLE PLACEMENT
// =============================================================================

PlacementCheck PlacementValidator::evaluate(const BlockDefinition& block,
                                            const GridPosition& pos,
                                            Rotation rotation) const {
    PlacementCheck check;

    if (!m_grid->contains(pos)) {
        check.rejection = PlacementRejection::OutOfBounds;
        return check;
    }
    if (m_grid->is_occupied(pos)) {
        check.rejection = PlacementRejection::Occupied;
        return check;
    }

    const SocketSet rotated = rotate(block.oriented, rotation);

    const SocketLabel& down = rotated.get(Direction::Down);
    if (down.empty()) {
        check.rejection = PlacementRejection::MissingBottomSocket;
        check.direction = Direction::Down;
        return check;
    }

    // Occupied neighbors must agree on every non-empty face
    for (Direction d : ALL_DIRECTIONS) {
        const SocketLabel& own = rotated.get(d);
        if (own.empty()) continue;

        const GridPosition n = pos.neighbor(d);
        if (!m_grid->contains(n) || !m_grid->is_occupied(n)) continue;

        const SocketLabel& facing = m_grid->socket_at(n, direction::opposite(d));
        if (facing.empty()) continue;

        if (!m_sockets->are_compatible(own, facing)) {
            check.rejection = PlacementRejection::SocketMismatch;
            check.direction = d;
            check.conflict = n;
            return check;
        }
    }

    // Bottom face needs real support, open air does not count
    if (pos.y == 0) {
        const SocketLabel& ground = m_grid->ground_socket_at(pos.x, pos.z);
        if (ground.empty() || !m_sockets->are_compatible(down, ground)) {
            check.rejection = PlacementRejection::NoSupport;
            check.direction = Direction::Down;
            return check;
        }
    } else {
        const GridPosition below = pos.below();
        const SocketLabel& top = m_grid->socket_at(below, Direction::Up);
        if (!m_grid->is_occupied(below) || top.empty() || !m_sockets->are_compatible(down, top)) {
            check.rejection = PlacementRejection::NoSupport;
            check.direction = Direction::Down;
            check.conflict = below;
            return check;
        }
    }

    return check;
}

// =============================================================================
// ROTATION SEARCH
// =============================================================================

std::vector<Rotation> PlacementValidator::rotation_order(RotationSearch search, RandomSource* random) {
    std::size_t start = 0;
    if (search.random_start && random != nullptr) {
        start = random->next_index(ALL_ROTATIONS.size());
    }

    const std::size_t count = search.try_all ? ALL_ROTATIONS.size() : 1;
    std::vector<Rotation> order;
    order.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        order.push_back(rotation::from_steps(start + i));
    }
    return order;
}

std::optional<Rotation> PlacementValidator::find_valid_rotation(const BlockDefinition& block,
                                                                const GridPosition& pos,
                                                                RotationSearch search,
                                                                RandomSource* random) const {
    for (Rotation r : rotation_order(search, random)) {
        if (can_place(block, pos, r)) {
            return r;
        }
    }
    return std::nullopt;
}

std::vector<Rotation> PlacementValidator::valid_rotations(const BlockDefinition& block,
                                                          const GridPosition& pos) const {
    std::vector<Rotation> out;
    for (Rotation r : ALL_ROTATIONS) {
        if (can_place(block, pos, r)) {
            out.push_back(r);
        }
    }
    return out;
}

// =============================================================================
// VALIDATED PLACEMENT
// =============================================================================

PlacementCheck place_block(BuildGrid& grid, const SocketCompatibilityTable& sockets,
                           const BlockDefinition& block, const GridPosition& pos, Rotation rotation) {
    const PlacementCheck check = PlacementValidator(grid, sockets).evaluate(block, pos, rotation);
    if (check.ok() && !grid.place(block, pos, rotation)) {
        // evaluate() already covers bounds and occupancy
        PlacementCheck failed;
        failed.rejection = PlacementRejection::Occupied;
        return failed;
    }
    return check;
}

std::optional<Rotation> place_block(BuildGrid& grid, const SocketCompatibilityTable& sockets,
                                    const BlockDefinition& block, const GridPosition& pos,
                                    RotationSearch search, RandomSource* random) {
    const auto rotation = PlacementValidator(grid, sockets).find_valid_rotation(block, pos, search, random);
    if (!rotation || !grid.place(block, pos, *rotation)) {
        return std::nullopt;
    }
    return rotation;
}

} // namespace blockforge::server
