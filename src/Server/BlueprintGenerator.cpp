// =============================================================================
// BLOCKFORGE - BLUEPRINT GENERATOR IMPLEMENTATION
// =============================================================================

#include "Server/BlueprintGenerator.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>
#include <utility>

namespace blockforge::server {

// =============================================================================
// CONFIGURATION
// =============================================================================

bool BlueprintConfig::load(const Settings& settings) {
    bool ok = true;
    for (const auto& [key, value] : {std::pair<const char*, GridCoord*>{"blueprint.width", &width},
                                     {"blueprint.depth", &depth},
                                     {"blueprint.height", &height},
                                     {"blueprint.start_x", &start_x},
                                     {"blueprint.start_z", &start_z}}) {
        if (!settings.read(key, *value)) {
            BLOCKFORGE_ERROR("Blueprint", key, " is not an integer: ", settings.get_string(key));
            ok = false;
        }
    }

    foundation_block = settings.get_string("blueprint.foundation_block", foundation_block);
    wall_block = settings.get_string("blueprint.wall_block", wall_block);
    door_block = settings.get_string("blueprint.door_block", door_block);
    window_block = settings.get_string("blueprint.window_block", window_block);
    roof_block = settings.get_string("blueprint.roof_block", roof_block);

    for (const auto& [key, value] : {std::pair<const char*, bool*>{"blueprint.clear_existing", &clear_existing},
                                     {"blueprint.add_windows", &add_windows},
                                     {"blueprint.add_door", &add_door}}) {
        if (!settings.read(key, *value)) {
            BLOCKFORGE_ERROR("Blueprint", key, " is not true or false: ", settings.get_string(key));
            ok = false;
        }
    }
    if (!ok) return false;

    if (width < 1 || depth < 1 || height < 1) {
        BLOCKFORGE_ERROR("Blueprint", "width, depth and height must be at least 1");
        return false;
    }
    return true;
}

// =============================================================================
// SETUP
// =============================================================================

std::vector<std::string> BlueprintGenerator::validate(const BuildGrid& grid, const GenerationContext& ctx) const {
    std::vector<std::string> problems = setup_problems(grid, ctx);

    if (ctx.blocks.find(m_config.foundation_block) == nullptr) {
        problems.push_back("foundation block '" + m_config.foundation_block + "' is not in the catalog");
    }
    if (ctx.blocks.find(m_config.wall_block) == nullptr) {
        problems.push_back("wall block '" + m_config.wall_block + "' is not in the catalog");
    }
    if (m_config.width < 1 || m_config.depth < 1 || m_config.height < 1) {
        problems.push_back("blueprint footprint must be at least 1x1x1");
    }

    const GridPosition far_corner{m_config.start_x + m_config.width - 1, 0, m_config.start_z + m_config.depth - 1};
    if (!grid.contains({m_config.start_x, 0, m_config.start_z}) || !grid.contains(far_corner)) {
        problems.push_back("blueprint footprint does not fit inside the grid");
    }
    return problems;
}

// =============================================================================
// GENERATION
// =============================================================================

GenerationSummary BlueprintGenerator::generate(BuildGrid& grid, GenerationContext& ctx) {
    GenerationSummary summary;
    summary.problems = validate(grid, ctx);
    if (!summary.problems.empty()) {
        for (const std::string& problem : summary.problems) {
            BLOCKFORGE_ERROR("Blueprint", "Setup: ", problem);
        }
        summary.status = GenerationStatus::InvalidSetup;
        return summary;
    }

    ctx.rules.reset();

    if (m_config.clear_existing) {
        clear_area(grid, ctx);
    }

    place_foundation(grid, ctx, summary);
    place_walls(grid, ctx, summary);
    place_roof(grid, ctx, summary);

    std::sort(summary.invalid_cells.begin(), summary.invalid_cells.end());
    summary.status = GenerationStatus::Completed;

    BLOCKFORGE_LOG("Blueprint", "Built ", m_config.width, "x", m_config.depth, "x", m_config.height,
                   ": ", summary.placed, " placed, ", summary.rejected, " rejected");
    return summary;
}

void BlueprintGenerator::clear_area(BuildGrid& grid, GenerationContext& ctx) const {
    // +1 for the roof layer
    for (GridCoord y = 0; y <= m_config.height; ++y) {
        for (GridCoord z = 0; z < m_config.depth; ++z) {
            for (GridCoord x = 0; x < m_config.width; ++x) {
                const GridPosition pos{m_config.start_x + x, y, m_config.start_z + z};
                if (grid.clear(pos) && ctx.sink != nullptr) {
                    ctx.sink->on_clear(pos);
                }
            }
        }
    }
}

void BlueprintGenerator::place_foundation(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const {
    const BlockDefinition* foundation = ctx.blocks.find(m_config.foundation_block);
    for (GridCoord z = 0; z < m_config.depth; ++z) {
        for (GridCoord x = 0; x < m_config.width; ++x) {
            try_place(grid, ctx, summary, foundation, nullptr, {m_config.start_x + x, 0, m_config.start_z + z});
        }
    }
}

void BlueprintGenerator::place_walls(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const {
    const BlockDefinition* wall = ctx.blocks.find(m_config.wall_block);
    const BlockDefinition* door = m_config.add_door ? ctx.blocks.find(m_config.door_block) : nullptr;
    const BlockDefinition* window = m_config.add_windows ? ctx.blocks.find(m_config.window_block) : nullptr;

    if (m_config.add_door && door == nullptr) {
        BLOCKFORGE_WARN("Blueprint", "Door block '", m_config.door_block, "' not found, using walls");
    }
    if (m_config.add_windows && window == nullptr) {
        BLOCKFORGE_WARN("Blueprint", "Window block '", m_config.window_block, "' not found, using walls");
    }

    const GridCoord w = m_config.width;
    const GridCoord d = m_config.depth;

    for (GridCoord y = 1; y < m_config.height; ++y) {
        for (GridCoord z = 0; z < d; ++z) {
            for (GridCoord x = 0; x < w; ++x) {
                const bool perimeter = x == 0 || x == w - 1 || z == 0 || z == d - 1;
                if (!perimeter) continue;

                const GridPosition pos{m_config.start_x + x, y, m_config.start_z + z};

                const bool door_slot = door != nullptr && y == 1 && z == 0 && x == w / 2;
                const bool front_back_window = (z == 0 || z == d - 1) && x % 2 == 1;
                const bool side_window = (x == 0 || x == w - 1) && z % 2 == 1;
                const bool window_slot = window != nullptr && y > 1 && (front_back_window || side_window);

                if (door_slot) {
                    try_place(grid, ctx, summary, door, wall, pos);
                } else if (window_slot) {
                    try_place(grid, ctx, summary, window, wall, pos);
                } else {
                    try_place(grid, ctx, summary, wall, nullptr, pos);
                }
            }
        }
    }
}

void BlueprintGenerator::place_roof(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary) const {
    const BlockDefinition* roof = ctx.blocks.find(m_config.roof_block);
    if (roof == nullptr) {
        BLOCKFORGE_WARN("Blueprint", "Roof block '", m_config.roof_block, "' not found, skipping roof");
        return;
    }

    for (GridCoord z = 0; z < m_config.depth; ++z) {
        for (GridCoord x = 0; x < m_config.width; ++x) {
            try_place(grid, ctx, summary, roof, nullptr, {m_config.start_x + x, m_config.height, m_config.start_z + z});
        }
    }
}

bool BlueprintGenerator::try_place(BuildGrid& grid, GenerationContext& ctx, GenerationSummary& summary,
                                   const BlockDefinition* preferred, const BlockDefinition* fallback,
                                   const GridPosition& pos) const {
    const PlacementValidator validator(grid, ctx.sockets);

    for (const BlockDefinition* block : {preferred, fallback}) {
        if (block == nullptr) continue;

        const auto rotation = validator.find_valid_rotation(*block, pos, {true, false}, nullptr);
        if (!rotation) continue;

        grid.place(*block, pos, *rotation);
        if (ctx.sink != nullptr) {
            // Only a refused seed aborts a run; presets have no seed
            static_cast<void>(ctx.sink->on_place(pos, *grid.block_at(pos)));
        }
        ctx.rules.notify_placed(PlacementQuery::make(*block, pos, *rotation), {grid, validator});
        ++summary.placed;
        return true;
    }

    BLOCKFORGE_TRACE("Blueprint", "Nothing fits at ", pos.to_string());
    ++summary.rejected;
    summary.invalid_cells.push_back(pos);
    return false;
}

} // namespace blockforge::server
