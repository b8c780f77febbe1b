// =============================================================================
// BLOCKFORGE - PLACEMENT VALIDATOR
// Socket compatibility and vertical support checks for a candidate placement
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Shared/BlockRegistry.hpp"
#include "Shared/Random.hpp"
#include "Shared/SocketTable.hpp"
#include "Shared/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockforge::server {

// =============================================================================
// PLACEMENT CHECK RESULT
// =============================================================================
enum class PlacementRejection : std::uint8_t {
    None = 0,
    OutOfBounds,
    Occupied,
    MissingBottomSocket,    // Block has no Down socket, so it can never rest on anything
    SocketMismatch,         // Occupied neighbor faces an incompatible label
    NoSupport,              // Nothing compatible underneath (ground or block)
};

[[nodiscard]] std::string_view rejection_name(PlacementRejection r) noexcept;

struct PlacementCheck {
    PlacementRejection rejection = PlacementRejection::None;
    std::optional<Direction> direction;         // Face that failed, if any
    std::optional<GridPosition> conflict;       // Neighbor that caused it, if any

    [[nodiscard]] bool ok() const noexcept { return rejection == PlacementRejection::None; }
    explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] std::string describe() const;
};

// =============================================================================
// ROTATION SEARCH POLICY
// =============================================================================
struct RotationSearch {
    bool try_all = true;            // Otherwise only the first rotation is tried
    bool random_start = true;       // Start at a uniformly random quarter turn
};

// =============================================================================
// PLACEMENT VALIDATOR
// Reads grid and socket table; never mutates either
// =============================================================================
class PlacementValidator {
public:
    PlacementValidator(const BuildGrid& grid, const SocketCompatibilityTable& sockets)
        : m_grid(&grid)
        , m_sockets(&sockets)
    {}

    [[nodiscard]] PlacementCheck evaluate(const BlockDefinition& block,
                                          const GridPosition& pos,
                                          Rotation rotation) const;

    [[nodiscard]] bool can_place(const BlockDefinition& block,
                                 const GridPosition& pos,
                                 Rotation rotation) const {
        return evaluate(block, pos, rotation).ok();
    }

    // First passing rotation in +90 steps from the start; random may be null
    // only when search.random_start is false
    [[nodiscard]] std::optional<Rotation> find_valid_rotation(const BlockDefinition& block,
                                                              const GridPosition& pos,
                                                              RotationSearch search,
                                                              RandomSource* random) const;

    // Every passing rotation, in 0/90/180/270 order
    [[nodiscard]] std::vector<Rotation> valid_rotations(const BlockDefinition& block,
                                                        const GridPosition& pos) const;

    // Rotation order a search would visit
    [[nodiscard]] static std::vector<Rotation> rotation_order(RotationSearch search, RandomSource* random);

    [[nodiscard]] const BuildGrid& grid() const noexcept { return *m_grid; }
    [[nodiscard]] const SocketCompatibilityTable& sockets() const noexcept { return *m_sockets; }

private:
    const BuildGrid* m_grid;
    const SocketCompatibilityTable* m_sockets;
};

// =============================================================================
// VALIDATED PLACEMENT
// Grid is left unchanged when the check fails
// =============================================================================
PlacementCheck place_block(BuildGrid& grid, const SocketCompatibilityTable& sockets,
                           const BlockDefinition& block, const GridPosition& pos, Rotation rotation);

// Commits the first rotation the search finds
std::optional<Rotation> place_block(BuildGrid& grid, const SocketCompatibilityTable& sockets,
                                    const BlockDefinition& block, const GridPosition& pos,
                                    RotationSearch search, RandomSource* random);

} // namespace blockforge::server
