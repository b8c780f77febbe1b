// =============================================================================
// BLOCKFORGE - RULE FACTORY
// Creates placement rules by type name from config/rules.toml
// =============================================================================
#pragma once

#include "Server/PlacementRules.hpp"
#include "Shared/Logger.hpp"
#include "Shared/Settings.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace blockforge::server {

// =============================================================================
// RULE FACTORY FUNCTION TYPE
// Receives the rule name, the settings and the "rules.<name>." key prefix
// =============================================================================
using RuleBuilder = std::function<std::unique_ptr<PlacementRule>(
    const std::string& name, const Settings& settings, const std::string& prefix)>;

// =============================================================================
// RULE FACTORY
// =============================================================================
class RuleFactory {
public:
    RuleFactory() {
        register_defaults();
    }

    // =============================================================================
    // REGISTRATION
    // =============================================================================

    void register_rule(const std::string& type, RuleBuilder builder) {
        m_builders[type] = std::move(builder);
    }

    // =============================================================================
    // CREATION
    // =============================================================================

    // nullptr for unknown types or bad parameters
    [[nodiscard]] std::unique_ptr<PlacementRule> create(std::string_view type,
                                                        const std::string& name,
                                                        const Settings& settings,
                                                        const std::string& prefix) const {
        auto it = m_builders.find(std::string(type));
        if (it == m_builders.end()) {
            std::string known;
            for (const std::string& t : list_types()) {
                known += known.empty() ? t : ", " + t;
            }
            BLOCKFORGE_ERROR("RuleFactory", "Unknown rule type '", type, "' for rule '", name,
                             "'; known types: ", known);
            return nullptr;
        }
        return it->second(name, settings, prefix);
    }

    // =============================================================================
    // LOADING
    // [[groups.Roofs]]
    // blocks = ["RoofEdge", "RoofCorner"]
    //
    // [[rules.RoofEdges]]
    // type = "roof_edge"
    // group = "Roofs"        # omit for a global rule
    // =============================================================================
    bool load(const Settings& settings, RuleSet& rules) const {
        bool ok = true;

        for (const std::string& group_name : settings.tables_with_prefix("groups")) {
            for (const std::string& block : settings.get_string_list("groups." + group_name + ".blocks")) {
                rules.add_block_to_group(block, group_name);
            }
        }

        std::size_t loaded = 0;
        for (const std::string& name : settings.tables_with_prefix("rules")) {
            const std::string prefix = "rules." + name + ".";
            const std::string type = settings.get_string(prefix + "type");
            if (type.empty()) {
                BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' has no type");
                ok = false;
                continue;
            }

            std::unique_ptr<PlacementRule> rule = create(type, name, settings, prefix);
            if (!rule) {
                ok = false;
                continue;
            }
            bool enabled = true;
            if (!settings.read(prefix + "enabled", enabled)) {
                BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' has enabled = '",
                                 settings.get_string(prefix + "enabled"), "', expected true or false");
                ok = false;
                continue;
            }
            rule->set_enabled(enabled);
            rule->set_description(settings.get_string(prefix + "description"));

            const std::string group_name = settings.get_string(prefix + "group");
            if (group_name.empty()) {
                rules.add_global(std::move(rule));
            } else {
                if (rules.find_group(group_name) == nullptr) {
                    BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' references undefined group '", group_name, "'");
                    ok = false;
                    continue;
                }
                rules.add_rule_to_group(std::move(rule), group_name);
            }
            ++loaded;
        }

        BLOCKFORGE_LOG("RuleFactory", "Loaded ", loaded, " rules in ", rules.groups().size(), " groups");
        return ok;
    }

    // =============================================================================
    // QUERY
    // =============================================================================

    [[nodiscard]] bool has_type(const std::string& type) const {
        return m_builders.find(type) != m_builders.end();
    }

    // Sorted by name
    [[nodiscard]] std::vector<std::string> list_types() const {
        std::vector<std::string> names;
        names.reserve(m_builders.size());
        for (const auto& [name, _] : m_builders) {
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

private:
    void register_defaults() {
        register_rule("bottom_blocker", [](const std::string& name, const Settings&, const std::string&) {
            return std::make_unique<BottomBlockerRule>(name);
        });

        register_rule("top_blocker", [](const std::string& name, const Settings&, const std::string&) {
            return std::make_unique<TopBlockerRule>(name);
        });

        register_rule("height_restriction",
            [](const std::string& name, const Settings& s, const std::string& prefix) -> std::unique_ptr<PlacementRule> {
                HeightRestrictionConfig config;
                const std::string mode = s.get_string(prefix + "mode", "disallow_top_floor");
                const auto parsed = height_mode_from_name(mode);
                if (!parsed) {
                    BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' has unknown mode '", mode, "'");
                    return nullptr;
                }
                config.mode = *parsed;
                if (!s.read(prefix + "min_height", config.min_height) ||
                    !s.read(prefix + "max_height", config.max_height)) {
                    BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' needs integer min_height and max_height");
                    return nullptr;
                }
                config.exempt_marker = s.get_string(prefix + "exempt_marker", config.exempt_marker);

                const auto heights = s.get_int_list(prefix + "heights");
                if (!heights) {
                    BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' needs integer heights");
                    return nullptr;
                }
                for (long h : *heights) {
                    config.disallowed.push_back(static_cast<GridCoord>(h));
                }
                return std::make_unique<HeightRestrictionRule>(name, std::move(config));
            });

        register_rule("roof_edge", [](const std::string& name, const Settings& s, const std::string& prefix) {
            RoofEdgeConfig config;
            config.incompatible = s.get_string(prefix + "incompatible_socket", config.incompatible);
            config.forbidden_top = s.get_string(prefix + "forbidden_top_socket", config.forbidden_top);
            return std::make_unique<RoofEdgeRule>(name, std::move(config));
        });

        register_rule("full_top", [](const std::string& name, const Settings& s, const std::string& prefix) {
            FullTopConfig config;
            config.full_top = s.get_string(prefix + "full_top_socket", config.full_top);
            config.incompatible = s.get_string(prefix + "incompatible_socket", config.incompatible);
            config.roof_marker = s.get_string(prefix + "roof_marker", config.roof_marker);
            return std::make_unique<FullTopRule>(name, std::move(config));
        });

        register_rule("placement_limit",
            [](const std::string& name, const Settings& s, const std::string& prefix) -> std::unique_ptr<PlacementRule> {
                const auto max_count = s.try_int(prefix + "max_count");
                if (!max_count || *max_count < 0) {
                    BLOCKFORGE_ERROR("RuleFactory", "Rule '", name, "' needs a non-negative max_count");
                    return nullptr;
                }
                return std::make_unique<PlacementLimitRule>(name, static_cast<std::size_t>(*max_count));
            });
    }

    std::unordered_map<std::string, RuleBuilder> m_builders;
};

} // namespace blockforge::server
