// =============================================================================
// BLOCKFORGE - BLUEPRINT GENERATOR
// Deterministic box building: foundation, perimeter walls with a door
// and windows, flat roof
// =============================================================================
#pragma once

#include "Server/PlacementValidator.hpp"
#include "Server/StructureGenerator.hpp"
#include "Shared/Settings.hpp"

#include <cstdint>
#include <string>

namespace blockforge::server {

// =============================================================================
// BLUEPRINT CONFIGURATION
// =============================================================================
struct BlueprintConfig {
    std::uint64_t seed = 0;

    GridCoord width = 5;        // X extent
    GridCoord depth = 5;        // Z extent
    GridCoord height = 3;       // Foundation + wall storeys; roof sits at y = height
    GridCoord start_x = 0;
    GridCoord start_z = 0;

    std::string foundation_block = "EmptyBlock";
    std::string wall_block = "EmptyBlock";
    std::string door_block = "BlockWithDoor";
    std::string window_block = "Block_WindowSmall";
    std::string roof_block = "Roof";

    bool clear_existing = true;
    bool add_windows = true;
    bool add_door = true;

    // [blueprint] keys
    bool load(const Settings& settings);
};

// =============================================================================
// BLUEPRINT GENERATOR
// Each placement still goes through the validator; rejected cells are counted
// =============================================================================
class BlueprintGenerator final : public StructureGenerator {
public:
    BlueprintGenerator() = default;
    explicit BlueprintGenerator(BlueprintConfig config) : m_config(std::move(config)) {}
    ~BlueprintGenerator() override = default;

    GenerationSummary generate(BuildGrid& grid, GenerationContext& ctx) override;

    [[nodiscard]] std::string_view type_name() const noexcept override {
        return "blueprint";
    }

    [[nodiscard]] std::uint64_t seed() const noexcept override {
        return m_config.seed;
    }

    [[nodiscard]] std::vector<std::string> validate(const BuildGrid& grid,
                                                    const GenerationContext& ctx) const override;

    [[nodiscard]] const BlueprintConfig& config() const noexcept { return m_config; }

private:
    void clear_area(BuildGrid& grid, GenerationContext& ctx) const;
    void place_foundation(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const;
    void place_walls(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const;
    void place_roof(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const;

    // Tries the preferred block, then the fallback (may be null)
    bool try_place(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary,
                   const BlockDefinition* preferred, const BlockDefinition* fallback,
                   const GridPosition& pos) const;

    BlueprintConfig m_config;
};

} // namespace blockforge::server
