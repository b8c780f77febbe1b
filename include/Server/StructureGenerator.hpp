// =============================================================================
// BLOCKFORGE - STRUCTURE GENERATOR INTERFACE
// Abstract base for procedural and preset building generation
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Server/BuildingStyle.hpp"
#include "Server/PlacementRules.hpp"
#include "Shared/BlockRegistry.hpp"
#include "Shared/Random.hpp"
#include "Shared/SocketTable.hpp"
#include "Shared/Types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace blockforge::server {

// =============================================================================
// PLACEMENT SINK
// Receives committed placements; visual instantiation lives behind it
// =============================================================================
class PlacementSink {
public:
    virtual ~PlacementSink() = default;

    // Only the seed placement looks at the result
    virtual bool on_place(const GridPosition& pos, const PlacedBlock& placed) = 0;
    virtual void on_clear(const GridPosition& pos) = 0;
};

// =============================================================================
// GENERATION CONTEXT
// Everything a run reads, plus the rule set it notifies. One per run.
// =============================================================================
struct GenerationContext {
    const BlockRegistry& blocks;
    const SocketCompatibilityTable& sockets;
    const BuildingStyle& style;
    RuleSet& rules;
    RandomSource* random = nullptr;         // Generator seeds its own when null
    PlacementSink* sink = nullptr;
};

// =============================================================================
// GENERATION SUMMARY
// =============================================================================
enum class GenerationStatus : std::uint8_t {
    Exhausted,      // Frontier ran dry
    Capped,         // Iteration limit reached; partial structure kept
    Completed,      // Preset generator finished its plan
    SeedFailed,
    InvalidSetup,
};

[[nodiscard]] constexpr std::string_view status_name(GenerationStatus s) noexcept {
    switch (s) {
        case GenerationStatus::Exhausted:    return "exhausted";
        case GenerationStatus::Capped:       return "capped";
        case GenerationStatus::Completed:    return "completed";
        case GenerationStatus::SeedFailed:   return "seed failed";
        case GenerationStatus::InvalidSetup: return "invalid setup";
    }
    return "unknown";
}

struct GenerationSummary {
    GenerationStatus status = GenerationStatus::Exhausted;
    std::size_t iterations = 0;
    std::size_t placed = 0;
    std::size_t rejected = 0;                   // Preset placements that failed validation
    std::vector<GridPosition> invalid_cells;    // Sorted layer by layer
    std::vector<std::string> problems;          // Setup problems, if any

    // A structure exists; capping is not a failure
    [[nodiscard]] bool ok() const noexcept {
        return status != GenerationStatus::SeedFailed && status != GenerationStatus::InvalidSetup;
    }
    [[nodiscard]] bool capped() const noexcept { return status == GenerationStatus::Capped; }
};

// Grid, catalog, socket table, rule and style checks shared by all generators
[[nodiscard]] std::vector<std::string> setup_problems(const BuildGrid& grid, const GenerationContext& ctx);

// =============================================================================
// STRUCTURE GENERATOR INTERFACE
// =============================================================================
class StructureGenerator {
public:
    virtual ~StructureGenerator() = default;

    // =============================================================================
    // CORE INTERFACE
    // =============================================================================

    // Runs to completion on the given grid
    virtual GenerationSummary generate(BuildGrid& grid, GenerationContext& ctx) = 0;

    // Get generator type identifier
    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    // Get the seed used when the context brings no random source
    [[nodiscard]] virtual std::uint64_t seed() const noexcept = 0;

    // =============================================================================
    // OPTIONAL OVERRIDES
    // =============================================================================

    // Setup problems that stop a run before it starts; empty means ready
    [[nodiscard]] virtual std::vector<std::string> validate(const BuildGrid& grid,
                                                            const GenerationContext& ctx) const {
        return setup_problems(grid, ctx);
    }
};

} // namespace blockforge::server
