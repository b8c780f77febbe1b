// =============================================================================
// BLOCKFORGE - FRONTIER GENERATOR IMPLEMENTATION
// Seed -> Expand -> Fill loop with weighted, rule-filtered candidates
// =============================================================================

#include "Server/FrontierGenerator.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace blockforge::server {

namespace {

std::vector<std::string> frontier_problems(const FrontierConfig& config,
                                           const BuildGrid& grid,
                                           const GenerationContext& ctx) {
    std::vector<std::string> problems = setup_problems(grid, ctx);
    if (ctx.blocks.find(config.seed_block) == nullptr) {
        problems.push_back("seed block '" + config.seed_block + "' is not in the catalog");
    }
    if (!grid.contains(config.start)) {
        problems.push_back("start position " + config.start.to_string() + " is outside the grid");
    }
    return problems;
}

} // namespace

// =============================================================================
// CONFIGURATION
// =============================================================================

bool FrontierConfig::load(const Settings& settings) {
    bool ok = true;

    const std::string seed_text = settings.get_string("generator.seed");
    if (!seed_text.empty()) {
        char* end = nullptr;
        const unsigned long long value = std::strtoull(seed_text.c_str(), &end, 10);
        if (seed_text.front() == '-' || end == seed_text.c_str() || *end != '\0') {
            BLOCKFORGE_ERROR("Frontier", "generator.seed is not an unsigned integer: ", seed_text);
            ok = false;
        } else {
            seed = static_cast<std::uint64_t>(value);
        }
    }

    if (settings.has("generator.start")) {
        const auto start_xyz = settings.get_int_list("generator.start");
        if (!start_xyz || start_xyz->size() != 3) {
            BLOCKFORGE_ERROR("Frontier", "generator.start must be three integers [x, y, z]");
            ok = false;
        } else {
            start = {static_cast<GridCoord>((*start_xyz)[0]),
                     static_cast<GridCoord>((*start_xyz)[1]),
                     static_cast<GridCoord>((*start_xyz)[2])};
        }
    }

    if (settings.has("generator.center")) {
        const auto center = settings.get_float_list("generator.center");
        if (!center || center->size() != 2) {
            BLOCKFORGE_ERROR("Frontier", "generator.center must be [x, z]");
            ok = false;
        } else {
            center_x = (*center)[0];
            center_z = (*center)[1];
        }
    }

    int limit = static_cast<int>(iteration_limit);
    if (!settings.read("generator.iteration_limit", limit)) {
        BLOCKFORGE_ERROR("Frontier", "generator.iteration_limit is not an integer: ",
                         settings.get_string("generator.iteration_limit"));
        ok = false;
    } else if (limit < 0) {
        BLOCKFORGE_ERROR("Frontier", "generator.iteration_limit must not be negative");
        ok = false;
    } else {
        iteration_limit = static_cast<std::size_t>(limit);
    }

    seed_block = settings.get_string("generator.seed_block", seed_block);
    if (!settings.read("generator.max_distance", max_distance)) {
        BLOCKFORGE_ERROR("Frontier", "generator.max_distance is not a number: ",
                         settings.get_string("generator.max_distance"));
        ok = false;
    }

    for (const auto& [key, value] : {std::pair<const char*, bool*>{"generator.try_all_rotations", &rotations.try_all},
                                     {"generator.random_start_rotation", &rotations.random_start},
                                     {"generator.all_rotations_as_candidates", &all_rotations_as_candidates}}) {
        if (!settings.read(key, *value)) {
            BLOCKFORGE_ERROR("Frontier", key, " is not true or false: ", settings.get_string(key));
            ok = false;
        }
    }
    return ok;
}

// =============================================================================
// FRONTIER EXPANSION
// =============================================================================

FrontierExpansion::FrontierExpansion(FrontierConfig config, BuildGrid& grid, GenerationContext& ctx)
    : m_config(std::move(config))
    , m_grid(grid)
    , m_ctx(ctx)
    , m_validator(grid, ctx.sockets)
{
    if (m_ctx.random != nullptr) {
        m_random = m_ctx.random;
    } else {
        m_own_random = std::make_unique<SeededRandom>(m_config.seed);
        m_random = m_own_random.get();
    }
}

bool FrontierExpansion::begin() {
    if (m_phase != Phase::Seed) {
        return m_summary.ok();
    }

    m_summary.problems = frontier_problems(m_config, m_grid, m_ctx);
    if (!m_summary.problems.empty()) {
        for (const std::string& problem : m_summary.problems) {
            BLOCKFORGE_ERROR("Frontier", "Setup: ", problem);
        }
        finish(GenerationStatus::InvalidSetup);
        return false;
    }

    m_ctx.rules.reset();

    // The seed always searches all four turns from a random start;
    // m_config.rotations governs expansion only
    const BlockDefinition& seed = *m_ctx.blocks.find(m_config.seed_block);
    const RotationSearch seed_search{true, true};
    const auto rotation = m_validator.find_valid_rotation(seed, m_config.start, seed_search, m_random);
    if (!rotation || !m_grid.place(seed, m_config.start, *rotation)) {
        BLOCKFORGE_ERROR("Frontier", "Seed block '", seed.name, "' cannot be placed at ",
                         m_config.start.to_string());
        finish(GenerationStatus::SeedFailed);
        return false;
    }

    if (m_ctx.sink != nullptr && !m_ctx.sink->on_place(m_config.start, *m_grid.block_at(m_config.start))) {
        m_grid.clear(m_config.start);
        m_ctx.sink->on_clear(m_config.start);
        BLOCKFORGE_ERROR("Frontier", "Placement sink refused the seed block at ", m_config.start.to_string());
        finish(GenerationStatus::SeedFailed);
        return false;
    }

    m_ctx.rules.notify_placed(PlacementQuery::make(seed, m_config.start, *rotation), rule_context());
    m_summary.placed = 1;

    BLOCKFORGE_LOG("Frontier", "Seed '", seed.name, "' placed at ", m_config.start.to_string(),
                   " rotation ", rotation::to_degrees(*rotation));

    m_current.push_back(m_config.start);
    m_phase = Phase::Expand;
    return true;
}

std::optional<PlacementEvent> FrontierExpansion::step() {
    if (m_phase == Phase::Seed && !begin()) {
        return std::nullopt;
    }

    while (m_phase != Phase::Done) {
        if (m_phase == Phase::Expand) {
            if (m_current.empty()) {
                finish(GenerationStatus::Exhausted);
                break;
            }
            if (m_summary.iterations >= m_config.iteration_limit) {
                BLOCKFORGE_WARN("Frontier", "Iteration limit ", m_config.iteration_limit,
                                " reached, generation capped");
                finish(GenerationStatus::Capped);
                break;
            }
            ++m_summary.iterations;
            expand();
            m_fill_index = 0;
            m_phase = Phase::Fill;
            continue;
        }

        // Fill
        while (m_fill_index < m_frontier.size()) {
            const GridPosition cell = m_frontier[m_fill_index++];
            if (!m_grid.contains(cell) || is_invalid(cell) || m_grid.is_occupied(cell)) {
                continue;
            }

            const std::vector<Candidate> candidates = gather_candidates(cell);
            std::vector<float> weights;
            weights.reserve(candidates.size());
            for (const Candidate& c : candidates) {
                weights.push_back(c.weight);
            }

            const auto pick = choose_weighted(weights, *m_random);
            if (!pick) {
                BLOCKFORGE_TRACE("Frontier", "No valid block for ", cell.to_string(), ", marked invalid");
                m_invalid.insert(cell);
                continue;
            }

            const Candidate& chosen = candidates[*pick];
            return commit(*chosen.block, cell, chosen.rotation, chosen.weight);
        }

        m_current = std::move(m_frontier);
        m_frontier.clear();
        m_phase = Phase::Expand;
    }

    return std::nullopt;
}

void FrontierExpansion::expand() {
    m_frontier.clear();
    std::unordered_set<GridPosition> seen;
    for (const GridPosition& cell : m_current) {
        for (const GridPosition& n : m_grid.empty_neighbors(cell)) {
            if (is_invalid(n)) continue;
            if (seen.insert(n).second) {
                m_frontier.push_back(n);
            }
        }
    }
    BLOCKFORGE_TRACE("Frontier", "Iteration ", m_summary.iterations, ": ", m_current.size(),
                     " current, ", m_frontier.size(), " frontier");
}

std::vector<FrontierExpansion::Candidate> FrontierExpansion::gather_candidates(const GridPosition& cell) {
    std::vector<Candidate> candidates;

    const float height = spatial::normalized_height(cell, m_grid.dims().y);
    const float distance = spatial::normalized_distance(cell, m_config.center_x, m_config.center_z,
                                                        m_config.max_distance);
    const RuleContext rules = rule_context();

    for (const BlockDefinition& block : m_ctx.blocks.all()) {
        for (Rotation r : PlacementValidator::rotation_order(m_config.rotations, m_random)) {
            const PlacementCheck check = m_validator.evaluate(block, cell, r);
            if (!check) continue;

            const PlacementQuery query = PlacementQuery::make(block, cell, r);
            if (!m_ctx.rules.is_placement_legal(query, rules)) continue;

            candidates.push_back({&block, r, m_ctx.style.weight(block.name, height, distance)});
            if (!m_config.all_rotations_as_candidates) break;
        }
    }
    return candidates;
}

PlacementEvent FrontierExpansion::commit(const BlockDefinition& block,
                                         const GridPosition& cell,
                                         Rotation rotation,
                                         float weight) {
    m_grid.place(block, cell, rotation);
    if (m_ctx.sink != nullptr) {
        // Result only matters for the seed
        static_cast<void>(m_ctx.sink->on_place(cell, *m_grid.block_at(cell)));
    }
    m_ctx.rules.notify_placed(PlacementQuery::make(block, cell, rotation), rule_context());
    ++m_summary.placed;

    BLOCKFORGE_TRACE("Frontier", "Placed '", block.name, "' at ", cell.to_string(),
                     " rotation ", rotation::to_degrees(rotation), " weight ", weight);

    return {cell, &block, rotation, m_summary.iterations, weight};
}

void FrontierExpansion::finish(GenerationStatus status) {
    m_phase = Phase::Done;
    m_summary.status = status;
    m_summary.invalid_cells.assign(m_invalid.begin(), m_invalid.end());
    std::sort(m_summary.invalid_cells.begin(), m_summary.invalid_cells.end());

    BLOCKFORGE_LOG("Frontier", "Finished (", status_name(status), "): ", m_summary.placed, " placed, ",
                   m_summary.iterations, " iterations, ", m_summary.invalid_cells.size(), " invalid cells");
}

// =============================================================================
// FRONTIER GENERATOR
// =============================================================================

GenerationSummary FrontierGenerator::generate(BuildGrid& grid, GenerationContext& ctx) {
    FrontierExpansion run(m_config, grid, ctx);
    if (!run.begin()) {
        return run.summary();
    }
    while (run.step()) {
    }
    return run.summary();
}

std::vector<std::string> FrontierGenerator::validate(const BuildGrid& grid, const GenerationContext& ctx) const {
    return frontier_problems(m_config, grid, ctx);
}

} // namespace blockforge::server
