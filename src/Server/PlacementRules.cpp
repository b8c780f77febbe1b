// =============================================================================
// BLOCKFORGE - PLACEMENT RULES IMPLEMENTATION
// =============================================================================

#include "Server/PlacementRules.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>

namespace blockforge::server {

namespace {

bool name_contains(const std::string& name, const std::string& marker) {
    return !marker.empty() && name.find(marker) != std::string::npos;
}

} // namespace

// =============================================================================
// BOTTOM / TOP BLOCKERS
// =============================================================================

RuleVerdict BottomBlockerRule::evaluate(const PlacementQuery& query, const RuleContext&) const {
    if (query.position.y == 0) {
        return reject("'" + query.block_name() + "' cannot be placed on the bottom layer");
    }
    return RuleVerdict::allow();
}

RuleVerdict TopBlockerRule::evaluate(const PlacementQuery& query, const RuleContext& ctx) const {
    const GridCoord top = ctx.grid.dims().y - 1;
    if (query.position.y >= top) {
        return reject("'" + query.block_name() + "' cannot be placed on the top layer (y=" + std::to_string(top) + ")");
    }
    return RuleVerdict::allow();
}

// =============================================================================
// HEIGHT RESTRICTION
// =============================================================================

std::optional<HeightMode> height_mode_from_name(std::string_view name) noexcept {
    if (name == "disallow_top_floor")       return HeightMode::DisallowTopFloor;
    if (name == "disallow_bottom_floor")    return HeightMode::DisallowBottomFloor;
    if (name == "restrict_to_bottom_floor") return HeightMode::RestrictToBottomFloor;
    if (name == "restrict_to_top_floor")    return HeightMode::RestrictToTopFloor;
    if (name == "restrict_to_range")        return HeightMode::RestrictToRange;
    if (name == "disallow_heights")         return HeightMode::DisallowHeights;
    return std::nullopt;
}

RuleVerdict HeightRestrictionRule::evaluate(const PlacementQuery& query, const RuleContext& ctx) const {
    const std::string& name = query.block_name();
    if (name_contains(name, m_config.exempt_marker)) {
        return RuleVerdict::allow();
    }

    const GridCoord y = query.position.y;
    const GridCoord top = ctx.grid.dims().y - 1;
    const std::string at = " (y=" + std::to_string(y) + ")";

    switch (m_config.mode) {
        case HeightMode::DisallowTopFloor:
            if (y == top) return reject("'" + name + "' cannot be placed on the top floor" + at);
            break;
        case HeightMode::DisallowBottomFloor:
            if (y == 0) return reject("'" + name + "' cannot be placed on the bottom floor" + at);
            break;
        case HeightMode::RestrictToBottomFloor:
            if (y != 0) return reject("'" + name + "' can only be placed on the bottom floor" + at);
            break;
        case HeightMode::RestrictToTopFloor:
            if (y != top) return reject("'" + name + "' can only be placed on the top floor" + at);
            break;
        case HeightMode::RestrictToRange:
            if (y < m_config.min_height || y > m_config.max_height) {
                return reject("'" + name + "' must be placed between heights " +
                              std::to_string(m_config.min_height) + " and " +
                              std::to_string(m_config.max_height) + at);
            }
            break;
        case HeightMode::DisallowHeights:
            if (std::find(m_config.disallowed.begin(), m_config.disallowed.end(), y) != m_config.disallowed.end()) {
                return reject("'" + name + "' cannot be placed at height " + std::to_string(y));
            }
            break;
    }
    return RuleVerdict::allow();
}

// =============================================================================
// ROOF EDGE
// =============================================================================

RuleVerdict RoofEdgeRule::evaluate(const PlacementQuery& query, const RuleContext& ctx) const {
    for (Direction d : HORIZONTAL_DIRECTIONS) {
        if (query.sockets.get(d) != m_config.incompatible) continue;

        const GridPosition n = query.position.neighbor(d);

        // Grid edge is a valid roof edge
        if (!ctx.grid.contains(n)) continue;

        if (ctx.grid.is_occupied(n)) {
            return reject("'" + query.block_name() + "' has an incompatible edge facing an occupied cell", n);
        }

        const GridPosition below = n.below();
        const PlacedBlock* under = ctx.grid.block_at(below);
        if (under != nullptr && under->sockets.get(Direction::Up) == m_config.forbidden_top) {
            return reject("'" + query.block_name() + "' at " + query.position.to_string() +
                          " conflicts with the block at " + below.to_string(), below);
        }
    }
    return RuleVerdict::allow();
}

// =============================================================================
// FULL TOP
// =============================================================================

RuleVerdict FullTopRule::evaluate(const PlacementQuery& query, const RuleContext& ctx) const {
    if (query.sockets.get(Direction::Up) != m_config.full_top) {
        return RuleVerdict::allow();
    }

    const GridPosition above = query.position.above();
    if (!ctx.grid.contains(above) || ctx.grid.is_occupied(above)) {
        return RuleVerdict::allow();
    }

    for (Direction d : HORIZONTAL_DIRECTIONS) {
        if (ctx.grid.socket_at(above, d) != m_config.incompatible) continue;

        const GridPosition n = above.neighbor(d);
        const PlacedBlock* roof = ctx.grid.block_at(n);
        if (roof != nullptr && name_contains(roof->name(), m_config.roof_marker)) {
            return reject("'" + query.block_name() + "' would leave roof block '" + roof->name() +
                          "' facing a full top", n);
        }
    }
    return RuleVerdict::allow();
}

// =============================================================================
// PLACEMENT LIMIT
// =============================================================================

RuleVerdict PlacementLimitRule::evaluate(const PlacementQuery& query, const RuleContext&) const {
    if (m_count >= m_max) {
        return reject("'" + query.block_name() + "' reached its limit of " + std::to_string(m_max) + " placements");
    }
    return RuleVerdict::allow();
}

void PlacementLimitRule::on_placed(const PlacementQuery&, const RuleContext&) {
    ++m_count;
}

// =============================================================================
// RULE SET
// =============================================================================

bool RuleGroup::applies_to(std::string_view block_name) const {
    return std::find(blocks.begin(), blocks.end(), block_name) != blocks.end();
}

void RuleSet::add_global(std::unique_ptr<PlacementRule> rule) {
    if (rule) {
        m_globals.push_back(std::move(rule));
    }
}

RuleGroup& RuleSet::group(const std::string& name) {
    for (RuleGroup& g : m_groups) {
        if (g.name == name) return g;
    }
    m_groups.push_back(RuleGroup{name, {}, {}});
    return m_groups.back();
}

const RuleGroup* RuleSet::find_group(std::string_view name) const {
    for (const RuleGroup& g : m_groups) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

void RuleSet::add_block_to_group(const std::string& block_name, const std::string& group_name) {
    RuleGroup& g = group(group_name);
    if (!g.applies_to(block_name)) {
        g.blocks.push_back(block_name);
    }
}

void RuleSet::add_rule_to_group(std::unique_ptr<PlacementRule> rule, const std::string& group_name) {
    if (rule) {
        group(group_name).rules.push_back(std::move(rule));
    }
}

RuleVerdict RuleSet::is_placement_legal(const PlacementQuery& query, const RuleContext& ctx) const {
    for (const auto& rule : m_globals) {
        if (!rule->enabled()) continue;
        RuleVerdict verdict = rule->evaluate(query, ctx);
        if (!verdict.allowed) {
            BLOCKFORGE_TRACE("Rules", "Rule '", rule->name(), "' prevented placement of ",
                             query.block_name(), " at ", query.position.to_string(), ": ", verdict.reason);
            return verdict;
        }
    }

    for (const RuleGroup& g : m_groups) {
        if (!g.applies_to(query.block_name())) continue;
        for (const auto& rule : g.rules) {
            if (!rule->enabled()) continue;
            RuleVerdict verdict = rule->evaluate(query, ctx);
            if (!verdict.allowed) {
                BLOCKFORGE_TRACE("Rules", "Rule '", rule->name(), "' from group '", g.name,
                                 "' prevented placement of ", query.block_name(), " at ",
                                 query.position.to_string(), ": ", verdict.reason);
                return verdict;
            }
        }
    }

    return RuleVerdict::allow();
}

void RuleSet::notify_placed(const PlacementQuery& query, const RuleContext& ctx) {
    for (auto& rule : m_globals) {
        if (rule->enabled()) {
            rule->on_placed(query, ctx);
        }
    }
    for (RuleGroup& g : m_groups) {
        if (!g.applies_to(query.block_name())) continue;
        for (auto& rule : g.rules) {
            if (rule->enabled()) {
                rule->on_placed(query, ctx);
            }
        }
    }
}

void RuleSet::reset() {
    for (auto& rule : m_globals) {
        rule->reset();
    }
    for (RuleGroup& g : m_groups) {
        for (auto& rule : g.rules) {
            rule->reset();
        }
    }
}

void RuleSet::clear() {
    m_globals.clear();
    m_groups.clear();
}

std::size_t RuleSet::rule_count() const noexcept {
    std::size_t count = m_globals.size();
    for (const RuleGroup& g : m_groups) {
        count += g.rules.size();
    }
    return count;
}

std::vector<std::string> RuleSet::validate(const BlockRegistry& blocks) const {
    std::vector<std::string> problems;
    for (const RuleGroup& g : m_groups) {
        for (const std::string& name : g.blocks) {
            if (!blocks.contains(name)) {
                problems.push_back("rule group '" + g.name + "' lists unknown block '" + name + "'");
            }
        }
    }
    return problems;
}

} // namespace blockforge::server
