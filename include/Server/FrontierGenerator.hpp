// =============================================================================
// BLOCKFORGE - FRONTIER GENERATOR
// Grows a building outward from a seed block, one frontier ring at a time
// =============================================================================
#pragma once

#include "Server/PlacementValidator.hpp"
#include "Server/StructureGenerator.hpp"
#include "Shared/Random.hpp"
#include "Shared/Settings.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace blockforge::server {

// =============================================================================
// FRONTIER CONFIGURATION
// =============================================================================
struct FrontierConfig {
    std::uint64_t seed = 0;
    GridPosition start{0, 0, 0};
    std::string seed_block = "EmptyBlock";
    std::size_t iteration_limit = 100;

    // Horizontal center and radius used to normalize distance weights
    float center_x = 5.0f;
    float center_z = 5.0f;
    float max_distance = 10.0f;

    RotationSearch rotations{true, true};

    // Every passing rotation becomes its own candidate instead of only the first
    bool all_rotations_as_candidates = false;

    // [generator] keys; false on malformed values
    bool load(const Settings& settings);
};

// A single committed placement
struct PlacementEvent {
    GridPosition position;
    const BlockDefinition* block = nullptr;
    Rotation rotation = Rotation::R0;
    std::size_t iteration = 0;      // 0 for the seed
    float weight = 0.0f;
};

// =============================================================================
// FRONTIER EXPANSION
// Resumable run: begin() places the seed, each step() commits one block.
// The grid and context must outlive the expansion.
// =============================================================================
class FrontierExpansion {
public:
    FrontierExpansion(FrontierConfig config, BuildGrid& grid, GenerationContext& ctx);

    // Validates setup and places the seed; false when the run cannot start
    bool begin();

    // Next committed placement, or nullopt once the run is over
    std::optional<PlacementEvent> step();

    [[nodiscard]] bool finished() const noexcept { return m_phase == Phase::Done; }
    [[nodiscard]] const GenerationSummary& summary() const noexcept { return m_summary; }

    [[nodiscard]] const std::vector<GridPosition>& current() const noexcept { return m_current; }
    [[nodiscard]] const std::vector<GridPosition>& frontier() const noexcept { return m_frontier; }
    [[nodiscard]] bool is_invalid(const GridPosition& pos) const { return m_invalid.count(pos) != 0; }

private:
    enum class Phase {
        Seed,
        Expand,
        Fill,
        Done,
    };

    struct Candidate {
        const BlockDefinition* block = nullptr;
        Rotation rotation = Rotation::R0;
        float weight = 0.0f;
    };

    void expand();
    [[nodiscard]] std::vector<Candidate> gather_candidates(const GridPosition& cell);
    PlacementEvent commit(const BlockDefinition& block, const GridPosition& cell, Rotation rotation, float weight);
    void finish(GenerationStatus status);

    [[nodiscard]] RuleContext rule_context() const noexcept {
        return {m_grid, m_validator};
    }

    FrontierConfig m_config;
    BuildGrid& m_grid;
    GenerationContext& m_ctx;
    PlacementValidator m_validator;

    std::unique_ptr<SeededRandom> m_own_random;
    RandomSource* m_random = nullptr;

    Phase m_phase = Phase::Seed;
    std::vector<GridPosition> m_current;
    std::vector<GridPosition> m_frontier;
    std::size_t m_fill_index = 0;
    std::unordered_set<GridPosition> m_invalid;
    GenerationSummary m_summary;
};

// =============================================================================
// FRONTIER GENERATOR
// =============================================================================
class FrontierGenerator final : public StructureGenerator {
public:
    FrontierGenerator() = default;
    explicit FrontierGenerator(FrontierConfig config) : m_config(std::move(config)) {}
    ~FrontierGenerator() override = default;

    // =============================================================================
    // StructureGenerator Interface
    // =============================================================================

    GenerationSummary generate(BuildGrid& grid, GenerationContext& ctx) override;

    [[nodiscard]] std::string_view type_name() const noexcept override {
        return "frontier";
    }

    [[nodiscard]] std::uint64_t seed() const noexcept override {
        return m_config.seed;
    }

    [[nodiscard]] std::vector<std::string> validate(const BuildGrid& grid,
                                                    const GenerationContext& ctx) const override;

    // =============================================================================
    // Frontier-specific
    // =============================================================================

    // Step-by-step run for callers that pace placements themselves
    [[nodiscard]] FrontierExpansion start(BuildGrid& grid, GenerationContext& ctx) const {
        return FrontierExpansion(m_config, grid, ctx);
    }

    [[nodiscard]] const FrontierConfig& config() const noexcept { return m_config; }

private:
    FrontierConfig m_config;
};

} // namespace blockforge::server
