// =============================================================================
// BLOCKFORGE - CORE TYPES AND CONSTANTS
// Grid coordinates, directions and vertical rotations
// =============================================================================
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace blockforge {

// =============================================================================
// GRID COORDINATE SYSTEM
// Right = +X, Up = +Y, Front = +Z
// =============================================================================
using GridCoord = std::int32_t;

// Socket labels are plain strings; the empty label means "no socket"
using SocketLabel = std::string;

// =============================================================================
// DIRECTIONS (one per block face)
// =============================================================================
enum class Direction : std::uint8_t {
    Up = 0,
    Down,
    Front,
    Back,
    Left,
    Right,
};

inline constexpr std::size_t DIRECTION_COUNT = 6;

inline constexpr std::array<Direction, DIRECTION_COUNT> ALL_DIRECTIONS = {
    Direction::Up, Direction::Down, Direction::Front,
    Direction::Back, Direction::Left, Direction::Right,
};

inline constexpr std::array<Direction, 4> HORIZONTAL_DIRECTIONS = {
    Direction::Front, Direction::Right, Direction::Back, Direction::Left,
};

struct Offset {
    GridCoord dx = 0;
    GridCoord dy = 0;
    GridCoord dz = 0;
};

namespace direction {

    [[nodiscard]] constexpr std::size_t index(Direction d) noexcept {
        return static_cast<std::size_t>(d);
    }

    [[nodiscard]] constexpr Direction opposite(Direction d) noexcept {
        switch (d) {
            case Direction::Up:    return Direction::Down;
            case Direction::Down:  return Direction::Up;
            case Direction::Front: return Direction::Back;
            case Direction::Back:  return Direction::Front;
            case Direction::Left:  return Direction::Right;
            case Direction::Right: return Direction::Left;
        }
        return d;
    }

    [[nodiscard]] constexpr Offset offset(Direction d) noexcept {
        switch (d) {
            case Direction::Up:    return { 0,  1,  0};
            case Direction::Down:  return { 0, -1,  0};
            case Direction::Front: return { 0,  0,  1};
            case Direction::Back:  return { 0,  0, -1};
            case Direction::Left:  return {-1,  0,  0};
            case Direction::Right: return { 1,  0,  0};
        }
        return {};
    }

    [[nodiscard]] constexpr bool is_horizontal(Direction d) noexcept {
        return d != Direction::Up && d != Direction::Down;
    }

    [[nodiscard]] constexpr std::string_view name(Direction d) noexcept {
        switch (d) {
            case Direction::Up:    return "up";
            case Direction::Down:  return "down";
            case Direction::Front: return "front";
            case Direction::Back:  return "back";
            case Direction::Left:  return "left";
            case Direction::Right: return "right";
        }
        return "unknown";
    }

    // Parse a config name ("up", "front", ...); case-sensitive
    [[nodiscard]] constexpr std::optional<Direction> from_name(std::string_view text) noexcept {
        for (Direction d : ALL_DIRECTIONS) {
            if (name(d) == text) return d;
        }
        return std::nullopt;
    }

} // namespace direction

// =============================================================================
// GRID POSITION
// =============================================================================
struct GridPosition {
    GridCoord x = 0;
    GridCoord y = 0;
    GridCoord z = 0;

    [[nodiscard]] constexpr GridPosition neighbor(Direction d) const noexcept {
        const Offset o = direction::offset(d);
        return {x + o.dx, y + o.dy, z + o.dz};
    }

    [[nodiscard]] constexpr GridPosition below() const noexcept {
        return neighbor(Direction::Down);
    }

    [[nodiscard]] constexpr GridPosition above() const noexcept {
        return neighbor(Direction::Up);
    }

    [[nodiscard]] constexpr bool operator==(const GridPosition& other) const noexcept = default;

    // Strict ordering (y, z, x) so ordered containers iterate layer by layer
    [[nodiscard]] constexpr bool operator<(const GridPosition& other) const noexcept {
        if (y != other.y) return y < other.y;
        if (z != other.z) return z < other.z;
        return x < other.x;
    }

    [[nodiscard]] std::size_t hash() const noexcept {
        // Simple hash combining
        std::size_t h = static_cast<std::size_t>(static_cast<std::uint32_t>(x));
        h ^= static_cast<std::size_t>(static_cast<std::uint32_t>(y)) * 0x9E3779B97F4A7C15ULL;
        h ^= static_cast<std::size_t>(static_cast<std::uint32_t>(z)) * 0xC6A4A7935BD1E995ULL;
        return h;
    }

    [[nodiscard]] std::string to_string() const {
        return "(" + std::to_string(x) + ", " + std::to_string(y) + ", " + std::to_string(z) + ")";
    }
};

static_assert(std::is_trivially_copyable_v<GridPosition>, "GridPosition must be trivially copyable");

// =============================================================================
// GRID DIMENSIONS
// =============================================================================
struct GridDimensions {
    GridCoord x = 0;
    GridCoord y = 0;
    GridCoord z = 0;

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return x > 0 && y > 0 && z > 0;
    }

    [[nodiscard]] constexpr bool contains(const GridPosition& p) const noexcept {
        return p.x >= 0 && p.x < x &&
               p.y >= 0 && p.y < y &&
               p.z >= 0 && p.z < z;
    }

    [[nodiscard]] constexpr std::size_t volume() const noexcept {
        if (!is_valid()) return 0;
        return static_cast<std::size_t>(x) * static_cast<std::size_t>(y) * static_cast<std::size_t>(z);
    }

    // Flat index, X fastest then Z then Y (layer-major)
    [[nodiscard]] constexpr std::size_t index_of(const GridPosition& p) const noexcept {
        return (static_cast<std::size_t>(p.y) * static_cast<std::size_t>(z) + static_cast<std::size_t>(p.z))
                   * static_cast<std::size_t>(x) + static_cast<std::size_t>(p.x);
    }

    [[nodiscard]] constexpr bool operator==(const GridDimensions& other) const noexcept = default;
};

// =============================================================================
// VERTICAL ROTATION (quarter turns about +Y)
// =============================================================================
enum class Rotation : std::uint8_t {
    R0 = 0,
    R90,
    R180,
    R270,
};

inline constexpr std::array<Rotation, 4> ALL_ROTATIONS = {
    Rotation::R0, Rotation::R90, Rotation::R180, Rotation::R270,
};

namespace rotation {

    [[nodiscard]] constexpr int to_degrees(Rotation r) noexcept {
        return static_cast<int>(r) * 90;
    }

    // Normalizes into [0, 360); anything that is not a quarter turn is rejected
    [[nodiscard]] constexpr std::optional<Rotation> from_degrees(int degrees) noexcept {
        int normalized = degrees % 360;
        if (normalized < 0) normalized += 360;
        if (normalized % 90 != 0) return std::nullopt;
        return static_cast<Rotation>(normalized / 90);
    }

    [[nodiscard]] constexpr Rotation from_steps(std::size_t quarter_turns) noexcept {
        return static_cast<Rotation>(quarter_turns % 4);
    }

    [[nodiscard]] constexpr Rotation next(Rotation r) noexcept {
        return from_steps(static_cast<std::size_t>(r) + 1);
    }

    [[nodiscard]] constexpr Rotation compose(Rotation a, Rotation b) noexcept {
        return from_steps(static_cast<std::size_t>(a) + static_cast<std::size_t>(b));
    }

} // namespace rotation

} // namespace blockforge

// Hash specialization for std::unordered_map / std::unordered_set
template<>
struct std::hash<blockforge::GridPosition> {
    std::size_t operator()(const blockforge::GridPosition& p) const noexcept {
        return p.hash();
    }
};
