// =============================================================================
// BLOCKFORGE - PLACEMENT RULES
// Pluggable vetoes over socket-valid placements, global or per block group
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Server/PlacementValidator.hpp"
#include "Shared/BlockRegistry.hpp"
#include "Shared/Types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockforge::server {

// =============================================================================
// RULE INPUTS AND OUTPUTS
// =============================================================================

// Read-only view of the run a rule is evaluated in
struct RuleContext {
    const BuildGrid& grid;
    const PlacementValidator& validator;
};

// A candidate (or just-committed) placement
struct PlacementQuery {
    const BlockDefinition* block = nullptr;
    Rotation rotation = Rotation::R0;
    GridPosition position;
    SocketSet sockets;                      // Block sockets after rotation

    static PlacementQuery make(const BlockDefinition& block, const GridPosition& pos, Rotation rotation) {
        return {&block, rotation, pos, rotate(block.oriented, rotation)};
    }

    [[nodiscard]] const std::string& block_name() const noexcept { return block->name; }
};

struct RuleVerdict {
    bool allowed = true;
    std::string rule;                           // Name of the rule that decided
    std::string reason;                         // Diagnostics only
    std::optional<GridPosition> conflict;       // Cell that caused a rejection, if any

    explicit operator bool() const noexcept { return allowed; }

    static RuleVerdict allow() { return {}; }
};

// =============================================================================
// RULE INTERFACE
// evaluate() must not mutate anything; on_placed() may keep per-run state
// =============================================================================
class PlacementRule {
public:
    explicit PlacementRule(std::string name) : m_name(std::move(name)) {}
    virtual ~PlacementRule() = default;

    PlacementRule(const PlacementRule&) = delete;
    PlacementRule& operator=(const PlacementRule&) = delete;

    [[nodiscard]] virtual RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const = 0;

    // Called after a placement commits; no return value, placement already happened
    virtual void on_placed([[maybe_unused]] const PlacementQuery& query,
                           [[maybe_unused]] const RuleContext& ctx) {}

    // Drop per-run state before a new generation run
    virtual void reset() {}

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] bool enabled() const noexcept { return m_enabled; }
    void set_enabled(bool enabled) noexcept { m_enabled = enabled; }

    [[nodiscard]] const std::string& description() const noexcept { return m_description; }
    void set_description(std::string text) { m_description = std::move(text); }

protected:
    [[nodiscard]] RuleVerdict reject(std::string reason,
                                     std::optional<GridPosition> conflict = std::nullopt) const {
        return {false, m_name, std::move(reason), conflict};
    }

private:
    std::string m_name;
    std::string m_description;
    bool m_enabled = true;
};

// =============================================================================
// BUILT-IN RULES
// =============================================================================

// Nothing on the bottom layer
class BottomBlockerRule final : public PlacementRule {
public:
    using PlacementRule::PlacementRule;
    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    [[nodiscard]] std::string_view type_name() const noexcept override { return "bottom_blocker"; }
};

// Nothing on the top layer
class TopBlockerRule final : public PlacementRule {
public:
    using PlacementRule::PlacementRule;
    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    [[nodiscard]] std::string_view type_name() const noexcept override { return "top_blocker"; }
};

enum class HeightMode : std::uint8_t {
    DisallowTopFloor,
    DisallowBottomFloor,
    RestrictToBottomFloor,
    RestrictToTopFloor,
    RestrictToRange,        // min_height..max_height inclusive
    DisallowHeights,
};

[[nodiscard]] std::optional<HeightMode> height_mode_from_name(std::string_view name) noexcept;

struct HeightRestrictionConfig {
    HeightMode mode = HeightMode::DisallowTopFloor;
    GridCoord min_height = 0;
    GridCoord max_height = 10;
    std::vector<GridCoord> disallowed;
    std::string exempt_marker = "Roof";     // Blocks whose name contains this bypass the rule
};

class HeightRestrictionRule final : public PlacementRule {
public:
    HeightRestrictionRule(std::string name, HeightRestrictionConfig config)
        : PlacementRule(std::move(name)), m_config(std::move(config)) {}

    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    [[nodiscard]] std::string_view type_name() const noexcept override { return "height_restriction"; }
    [[nodiscard]] const HeightRestrictionConfig& config() const noexcept { return m_config; }

private:
    HeightRestrictionConfig m_config;
};

struct RoofEdgeConfig {
    SocketLabel incompatible = "incompatible";
    SocketLabel forbidden_top = "full_top";
};

// A side face carrying the incompatible label must look at open air,
// and the open cell it faces must not sit on a full-top block
class RoofEdgeRule final : public PlacementRule {
public:
    RoofEdgeRule(std::string name, RoofEdgeConfig config)
        : PlacementRule(std::move(name)), m_config(std::move(config)) {}

    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    [[nodiscard]] std::string_view type_name() const noexcept override { return "roof_edge"; }

private:
    RoofEdgeConfig m_config;
};

struct FullTopConfig {
    SocketLabel full_top = "full_top";
    SocketLabel incompatible = "incompatible";
    std::string roof_marker = "Roof";
};

// A full-top block may not go under an empty cell that an adjacent roof
// block faces through an incompatible edge
class FullTopRule final : public PlacementRule {
public:
    FullTopRule(std::string name, FullTopConfig config)
        : PlacementRule(std::move(name)), m_config(std::move(config)) {}

    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    [[nodiscard]] std::string_view type_name() const noexcept override { return "full_top"; }

private:
    FullTopConfig m_config;
};

// At most N placements per run of the blocks it applies to
class PlacementLimitRule final : public PlacementRule {
public:
    PlacementLimitRule(std::string name, std::size_t max_count)
        : PlacementRule(std::move(name)), m_max(max_count) {}

    [[nodiscard]] RuleVerdict evaluate(const PlacementQuery& query, const RuleContext& ctx) const override;
    void on_placed(const PlacementQuery& query, const RuleContext& ctx) override;
    void reset() override { m_count = 0; }
    [[nodiscard]] std::string_view type_name() const noexcept override { return "placement_limit"; }

    [[nodiscard]] std::size_t count() const noexcept { return m_count; }

private:
    std::size_t m_max;
    std::size_t m_count = 0;
};

// =============================================================================
// RULE SET
// Global rules first, then every group that lists the block, in order
// =============================================================================
struct RuleGroup {
    std::string name;
    std::vector<std::string> blocks;
    std::vector<std::unique_ptr<PlacementRule>> rules;

    [[nodiscard]] bool applies_to(std::string_view block_name) const;
};

class RuleSet {
public:
    void add_global(std::unique_ptr<PlacementRule> rule);

    // Get or create
    RuleGroup& group(const std::string& name);
    [[nodiscard]] const RuleGroup* find_group(std::string_view name) const;

    void add_block_to_group(const std::string& block_name, const std::string& group_name);
    void add_rule_to_group(std::unique_ptr<PlacementRule> rule, const std::string& group_name);

    // First rejecting enabled rule wins; allowed verdict otherwise
    [[nodiscard]] RuleVerdict is_placement_legal(const PlacementQuery& query, const RuleContext& ctx) const;

    // Every enabled applicable rule, same order, no short-circuit
    void notify_placed(const PlacementQuery& query, const RuleContext& ctx);

    void reset();
    void clear();

    [[nodiscard]] const std::vector<std::unique_ptr<PlacementRule>>& globals() const noexcept { return m_globals; }
    [[nodiscard]] const std::vector<RuleGroup>& groups() const noexcept { return m_groups; }
    [[nodiscard]] std::size_t rule_count() const noexcept;

    // Group members that are not in the registry
    [[nodiscard]] std::vector<std::string> validate(const BlockRegistry& blocks) const;

private:
    std::vector<std::unique_ptr<PlacementRule>> m_globals;
    std::vector<RuleGroup> m_groups;
};

} // namespace blockforge::server
