#include "TestKit.hpp"

#include "Server/PlacementRules.hpp"
#include "Server/PlacementValidator.hpp"
#include "Server/RuleFactory.hpp"
#include "Shared/Settings.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace blockforge;
using namespace blockforge::server;
using blockforge::test::grid_config;
using blockforge::test::make_block;

namespace {

class PlacementRulesTest : public ::testing::Test {
protected:
    PlacementRulesTest()
        : grid(grid_config(4, 4, 4))
        , validator(grid, kit.sockets)
    {
        kit.sockets.add_label("incompatible");
        kit.sockets.add_label("full_top");
        kit.sockets.set_compatible("full_top", "floor", true);
        kit.blocks.add(make_block("Roof", SocketSet::make("", "floor", "incompatible", "wall", "wall", "wall")));
        kit.blocks.add(make_block("Solid", SocketSet::make("full_top", "floor", "wall", "wall", "wall", "wall")));
        wall = kit.blocks.find("Wall");
        roof = kit.blocks.find("Roof");
        solid = kit.blocks.find("Solid");
    }

    [[nodiscard]] RuleContext context() const { return {grid, validator}; }

    [[nodiscard]] RuleVerdict check(const PlacementRule& rule, const BlockDefinition& block,
                                    const GridPosition& pos, Rotation r = Rotation::R0) const {
        return rule.evaluate(PlacementQuery::make(block, pos, r), context());
    }

    test::StackKit kit;
    BuildGrid grid;
    PlacementValidator validator;
    const BlockDefinition* wall = nullptr;
    const BlockDefinition* roof = nullptr;
    const BlockDefinition* solid = nullptr;
};

} // namespace

// =============================================================================
// BUILT-IN RULES
// =============================================================================

TEST_F(PlacementRulesTest, BottomAndTopBlockers) {
    const BottomBlockerRule bottom("no_ground");
    EXPECT_FALSE(check(bottom, *roof, {0, 0, 0}).allowed);
    EXPECT_TRUE(check(bottom, *roof, {0, 1, 0}).allowed);

    const TopBlockerRule top("no_sky");
    EXPECT_FALSE(check(top, *wall, {0, 3, 0}).allowed);
    EXPECT_TRUE(check(top, *wall, {0, 2, 0}).allowed);

    const RuleVerdict verdict = check(bottom, *roof, {1, 0, 1});
    EXPECT_EQ(verdict.rule, "no_ground");
    EXPECT_FALSE(verdict.reason.empty());
}

TEST_F(PlacementRulesTest, HeightModes) {
    HeightRestrictionConfig config;
    config.mode = HeightMode::RestrictToRange;
    config.min_height = 1;
    config.max_height = 2;
    const HeightRestrictionRule range("range", config);
    EXPECT_FALSE(check(range, *wall, {0, 0, 0}).allowed);
    EXPECT_TRUE(check(range, *wall, {0, 1, 0}).allowed);
    EXPECT_TRUE(check(range, *wall, {0, 2, 0}).allowed);
    EXPECT_FALSE(check(range, *wall, {0, 3, 0}).allowed);

    // Names containing the marker are exempt
    EXPECT_TRUE(check(range, *roof, {0, 0, 0}).allowed);

    config.mode = HeightMode::DisallowHeights;
    config.disallowed = {2};
    const HeightRestrictionRule listed("listed", config);
    EXPECT_TRUE(check(listed, *wall, {0, 1, 0}).allowed);
    EXPECT_FALSE(check(listed, *wall, {0, 2, 0}).allowed);

    config.mode = HeightMode::RestrictToTopFloor;
    const HeightRestrictionRule top_only("top_only", config);
    EXPECT_TRUE(check(top_only, *wall, {0, 3, 0}).allowed);
    EXPECT_FALSE(check(top_only, *wall, {0, 2, 0}).allowed);

    EXPECT_EQ(height_mode_from_name("restrict_to_bottom_floor"), HeightMode::RestrictToBottomFloor);
    EXPECT_FALSE(height_mode_from_name("sideways").has_value());
}

TEST_F(PlacementRulesTest, RoofEdgeNeedsClearOutsideFace) {
    const RoofEdgeRule rule("roof_edge", RoofEdgeConfig{});
    const GridPosition pos{1, 1, 1};

    // Front is the incompatible edge; an occupied cell there rejects
    ASSERT_TRUE(grid.place(*wall, {1, 0, 1}, Rotation::R0));
    ASSERT_TRUE(grid.place(*wall, {1, 0, 2}, Rotation::R0));
    ASSERT_TRUE(grid.place(*wall, {1, 1, 2}, Rotation::R0));
    EXPECT_FALSE(check(rule, *roof, pos, Rotation::R0).allowed);

    // Turned so the edge faces empty air above a plain wall
    EXPECT_TRUE(check(rule, *roof, pos, Rotation::R180).allowed);

    // Edge at the grid boundary is fine
    EXPECT_TRUE(check(rule, *roof, {0, 1, 3}, Rotation::R0).allowed);
}

TEST_F(PlacementRulesTest, RoofEdgeRejectsFullTopBelowOutsideCell) {
    const RoofEdgeRule rule("roof_edge", RoofEdgeConfig{});
    ASSERT_TRUE(grid.place(*wall, {1, 0, 1}, Rotation::R0));
    ASSERT_TRUE(grid.place(*solid, {1, 0, 2}, Rotation::R0));

    const RuleVerdict verdict = check(rule, *roof, {1, 1, 1}, Rotation::R0);
    EXPECT_FALSE(verdict.allowed);
    ASSERT_TRUE(verdict.conflict.has_value());
    EXPECT_EQ(*verdict.conflict, (GridPosition{1, 0, 2}));
}

TEST_F(PlacementRulesTest, FullTopProtectsRoofEdges) {
    const FullTopRule rule("full_top", FullTopConfig{});

    // Roof at (1,1,1) shows its incompatible edge toward (1,1,2)
    ASSERT_TRUE(grid.place(*wall, {1, 0, 1}, Rotation::R0));
    ASSERT_TRUE(grid.place(*roof, {1, 1, 1}, Rotation::R0));

    const RuleVerdict verdict = check(rule, *solid, {1, 0, 2});
    EXPECT_FALSE(verdict.allowed);
    ASSERT_TRUE(verdict.conflict.has_value());
    EXPECT_EQ(*verdict.conflict, (GridPosition{1, 1, 1}));

    // Plain walls do not expose a full top
    EXPECT_TRUE(check(rule, *wall, {1, 0, 2}).allowed);
    // Nowhere near the edge
    EXPECT_TRUE(check(rule, *solid, {3, 0, 3}).allowed);
}

TEST_F(PlacementRulesTest, PlacementLimitCountsNotifications) {
    PlacementLimitRule rule("two_walls", 2);
    const PlacementQuery query = PlacementQuery::make(*wall, {0, 0, 0}, Rotation::R0);

    EXPECT_TRUE(rule.evaluate(query, context()).allowed);
    rule.on_placed(query, context());
    rule.on_placed(query, context());
    EXPECT_EQ(rule.count(), 2u);
    EXPECT_FALSE(rule.evaluate(query, context()).allowed);

    rule.reset();
    EXPECT_TRUE(rule.evaluate(query, context()).allowed);
}

// =============================================================================
// RULE SET
// =============================================================================

TEST_F(PlacementRulesTest, GroupsOnlyApplyToMembers) {
    RuleSet rules;
    rules.add_block_to_group("Roof", "Roofs");
    rules.add_rule_to_group(std::make_unique<BottomBlockerRule>("roofs_up"), "Roofs");
    rules.add_global(std::make_unique<TopBlockerRule>("no_top"));
    EXPECT_EQ(rules.rule_count(), 2u);

    const GridPosition ground{0, 0, 0};
    EXPECT_TRUE(rules.is_placement_legal(PlacementQuery::make(*wall, ground, Rotation::R0), context()).allowed);

    const RuleVerdict roof_verdict =
        rules.is_placement_legal(PlacementQuery::make(*roof, ground, Rotation::R0), context());
    EXPECT_FALSE(roof_verdict.allowed);
    EXPECT_EQ(roof_verdict.rule, "roofs_up");

    // Globals run first
    const RuleVerdict top_verdict =
        rules.is_placement_legal(PlacementQuery::make(*roof, {0, 3, 0}, Rotation::R0), context());
    EXPECT_EQ(top_verdict.rule, "no_top");
}

TEST_F(PlacementRulesTest, DisabledRulesAreSkipped) {
    RuleSet rules;
    auto rule = std::make_unique<BottomBlockerRule>("off");
    rule->set_enabled(false);
    rules.add_global(std::move(rule));

    EXPECT_TRUE(rules.is_placement_legal(PlacementQuery::make(*wall, {0, 0, 0}, Rotation::R0), context()).allowed);
}

TEST_F(PlacementRulesTest, ValidateFlagsUnknownMembers) {
    RuleSet rules;
    rules.add_block_to_group("Ghost", "Spooky");
    const auto problems = rules.validate(kit.blocks);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("Ghost"), std::string::npos);
}

// =============================================================================
// RULE FACTORY
// =============================================================================

TEST(RuleFactoryTest, BuildsRulesFromSettings) {
    Settings settings;
    ASSERT_TRUE(settings.parse(R"(
[[groups.Roofs]]
blocks = ["Roof"]

[[rules.roofs_up]]
type = "bottom_blocker"
group = "Roofs"

[[rules.height]]
type = "height_restriction"
mode = "disallow_heights"
heights = [1, 3]
description = "No walls on odd floors"

[[rules.limit]]
type = "placement_limit"
max_count = 4
enabled = false
)"));

    const RuleFactory factory;
    RuleSet rules;
    ASSERT_TRUE(factory.load(settings, rules));
    EXPECT_EQ(rules.rule_count(), 3u);
    ASSERT_EQ(rules.globals().size(), 2u);
    ASSERT_EQ(rules.groups().size(), 1u);
    EXPECT_EQ(rules.groups()[0].name, "Roofs");
    EXPECT_EQ(rules.groups()[0].rules.front()->type_name(), "bottom_blocker");

    const auto* height = dynamic_cast<const HeightRestrictionRule*>(rules.globals()[0].get());
    ASSERT_NE(height, nullptr);
    EXPECT_EQ(height->config().mode, HeightMode::DisallowHeights);
    EXPECT_EQ(height->config().disallowed, (std::vector<GridCoord>{1, 3}));
    EXPECT_EQ(height->description(), "No walls on odd floors");
    EXPECT_FALSE(rules.globals()[1]->enabled());
}

TEST(RuleFactoryTest, ReportsBadRules) {
    Settings settings;
    ASSERT_TRUE(settings.parse(R"(
[[rules.untyped]]
group = "Nowhere"

[[rules.unknown]]
type = "teleporter"

[[rules.orphan]]
type = "top_blocker"
group = "Nowhere"

[[rules.bad_mode]]
type = "height_restriction"
mode = "upside_down"
)"));

    const RuleFactory factory;
    RuleSet rules;
    EXPECT_FALSE(factory.load(settings, rules));
    EXPECT_EQ(rules.rule_count(), 0u);
    EXPECT_TRUE(factory.has_type("roof_edge"));
    EXPECT_FALSE(factory.has_type("teleporter"));
}

TEST(RuleFactoryTest, RejectsMalformedValues) {
    for (const char* text : {"[[rules.cap]]\ntype = \"placement_limit\"\nmax_count = 3\nenabled = flase\n",
                             "[[rules.cap]]\ntype = \"placement_limit\"\nmax_count = 3x\n",
                             "[[rules.low]]\ntype = \"height_restriction\"\nmin_height = low\n",
                             "[[rules.odd]]\ntype = \"height_restriction\"\n"
                             "mode = \"disallow_heights\"\nheights = [1.5]\n"}) {
        Settings settings;
        ASSERT_TRUE(settings.parse(text));
        const RuleFactory factory;
        RuleSet rules;
        EXPECT_FALSE(factory.load(settings, rules)) << text;
        EXPECT_EQ(rules.rule_count(), 0u) << text;
    }
}

TEST(RuleFactoryTest, ListsKnownTypesSorted) {
    const RuleFactory factory;
    const std::vector<std::string> types = factory.list_types();
    EXPECT_TRUE(std::is_sorted(types.begin(), types.end()));
    for (const char* type : {"bottom_blocker", "height_restriction", "placement_limit", "roof_edge"}) {
        EXPECT_NE(std::find(types.begin(), types.end(), type), types.end()) << type;
    }
}
