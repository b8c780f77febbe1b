// =============================================================================
// BLOCKFORGE - ORIENTATION
// Six-face socket sets and the vertical rotation algebra
// =============================================================================
#pragma once

#include "Types.hpp"

#include <array>
#include <optional>

namespace blockforge {

// =============================================================================
// SOCKET SET (one label per face, indexed by Direction)
// =============================================================================
struct SocketSet {
    std::array<SocketLabel, DIRECTION_COUNT> labels{};

    [[nodiscard]] const SocketLabel& get(Direction d) const noexcept {
        return labels[direction::index(d)];
    }

    void set(Direction d, SocketLabel label) {
        labels[direction::index(d)] = std::move(label);
    }

    [[nodiscard]] bool has(Direction d) const noexcept {
        return !get(d).empty();
    }

    [[nodiscard]] bool operator==(const SocketSet& other) const = default;

    static SocketSet make(SocketLabel up, SocketLabel down,
                          SocketLabel front, SocketLabel back,
                          SocketLabel left, SocketLabel right) {
        SocketSet s;
        s.set(Direction::Up, std::move(up));
        s.set(Direction::Down, std::move(down));
        s.set(Direction::Front, std::move(front));
        s.set(Direction::Back, std::move(back));
        s.set(Direction::Left, std::move(left));
        s.set(Direction::Right, std::move(right));
        return s;
    }
};

// =============================================================================
// ROTATION ALGEBRA
// A quarter turn moves the right face to the front, back to right,
// left to back and front to left. Up and Down never move.
// =============================================================================

// Where a face of the unrotated block ends up after rotating by r
[[nodiscard]] constexpr Direction rotate_direction(Direction d, Rotation r) noexcept {
    if (!direction::is_horizontal(d)) return d;

    // Front, Left, Back, Right: each quarter turn advances one slot
    constexpr std::array<Direction, 4> cycle = {
        Direction::Front, Direction::Left, Direction::Back, Direction::Right,
    };
    std::size_t slot = 0;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (cycle[i] == d) slot = i;
    }
    // Right -> Front is one step forward in the cycle, i.e. index 3 -> 0
    return cycle[(slot + static_cast<std::size_t>(r)) % cycle.size()];
}

// Inverse of rotate_direction: which unrotated face now points toward d
[[nodiscard]] constexpr Direction unrotate_direction(Direction d, Rotation r) noexcept {
    return rotate_direction(d, rotation::from_steps(4 - static_cast<std::size_t>(r)));
}

// Pure rotation: returns a new set, leaves the input untouched
[[nodiscard]] inline SocketSet rotate(const SocketSet& sockets, Rotation r) {
    if (r == Rotation::R0) return sockets;

    SocketSet out;
    for (Direction d : ALL_DIRECTIONS) {
        out.set(rotate_direction(d, r), sockets.get(d));
    }
    return out;
}

// =============================================================================
// DOWN-FACE REMAP
// Blocks authored lying on another face are first remapped so that the
// physical bottom becomes Down. Only Down (identity) and Up (upside down)
// have a verified table; side faces return nullopt.
// =============================================================================
[[nodiscard]] inline std::optional<SocketSet> remap_for_down_face(const SocketSet& sockets, Direction down) {
    switch (down) {
        case Direction::Down:
            return sockets;
        case Direction::Up: {
            SocketSet out = sockets;
            out.set(Direction::Up, sockets.get(Direction::Down));
            out.set(Direction::Down, sockets.get(Direction::Up));
            out.set(Direction::Front, sockets.get(Direction::Back));
            out.set(Direction::Back, sockets.get(Direction::Front));
            return out;
        }
        default:
            return std::nullopt;
    }
}

[[nodiscard]] constexpr bool is_supported_down_face(Direction down) noexcept {
    return down == Direction::Down || down == Direction::Up;
}

} // namespace blockforge
