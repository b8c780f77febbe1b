#include "TestKit.hpp"

#include "Server/FrontierGenerator.hpp"
#include "Server/GeneratorRegistry.hpp"
#include "Server/PlacementRules.hpp"
#include "Shared/Settings.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

using namespace blockforge;
using namespace blockforge::server;
using blockforge::test::grid_config;
using blockforge::test::make_block;

namespace {

FrontierConfig small_config() {
    FrontierConfig config;
    config.seed = 7;
    config.start = {1, 0, 1};
    config.seed_block = "Wall";
    config.center_x = 1.0f;
    config.center_z = 1.0f;
    config.max_distance = 3.0f;
    return config;
}

std::vector<std::string> layout(const BuildGrid& grid) {
    std::vector<std::string> out;
    const GridDimensions& dims = grid.dims();
    for (GridCoord y = 0; y < dims.y; ++y) {
        for (GridCoord z = 0; z < dims.z; ++z) {
            for (GridCoord x = 0; x < dims.x; ++x) {
                const PlacedBlock* placed = grid.block_at({x, y, z});
                out.push_back(placed != nullptr
                    ? placed->name() + "@" + std::to_string(rotation::to_degrees(placed->rotation))
                    : ".");
            }
        }
    }
    return out;
}

// Every occupied cell above ground rests on an occupied cell
void expect_supported(const BuildGrid& grid) {
    grid.for_each_occupied([&grid](const GridPosition& pos, const PlacedBlock&) {
        if (pos.y > 0) {
            EXPECT_TRUE(grid.is_occupied(pos.below())) << pos.to_string() << " floats";
        }
    });
}

} // namespace

TEST(FrontierGeneratorTest, FillsSmallGridCompletely) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    test::RecordingSink sink;
    auto ctx = kit.context(nullptr, &sink);

    FrontierGenerator generator(small_config());
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::Exhausted);
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(summary.placed, 18u);
    EXPECT_EQ(summary.iterations, 4u);
    EXPECT_TRUE(summary.invalid_cells.empty());
    EXPECT_EQ(grid.occupied_count(), 18u);
    EXPECT_EQ(sink.placed_at.size(), 18u);
    EXPECT_EQ(sink.placed_at.front(), (GridPosition{1, 0, 1}));
    expect_supported(grid);
}

TEST(FrontierGeneratorTest, FirstExpansionVisitsSeedNeighbors) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    auto ctx = kit.context();

    FrontierExpansion run(small_config(), grid, ctx);
    ASSERT_TRUE(run.begin());
    EXPECT_TRUE(grid.is_occupied({1, 0, 1}));

    const auto first = run.step();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->iteration, 1u);

    const std::vector<GridPosition>& frontier = run.frontier();
    for (const GridPosition& expected : {GridPosition{0, 0, 1}, GridPosition{2, 0, 1},
                                         GridPosition{1, 0, 0}, GridPosition{1, 0, 2}}) {
        EXPECT_NE(std::find(frontier.begin(), frontier.end(), expected), frontier.end())
            << expected.to_string() << " missing from frontier";
    }
    for (const GridPosition& cell : frontier) {
        EXPECT_TRUE(grid.contains(cell)) << cell.to_string();
    }
    EXPECT_EQ(frontier.size(), 5u);

    while (run.step()) {
        for (const GridPosition& cell : run.frontier()) {
            EXPECT_TRUE(grid.contains(cell)) << cell.to_string();
        }
    }
    EXPECT_TRUE(run.finished());
}

TEST(FrontierGeneratorTest, UnsupportedCellsBecomeInvalid) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    grid.set_ground(0, 0, false);
    auto ctx = kit.context();

    FrontierGenerator generator(small_config());
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::Exhausted);
    EXPECT_EQ(summary.placed, 16u);
    const std::vector<GridPosition> expected{{0, 0, 0}, {0, 1, 0}};
    EXPECT_EQ(summary.invalid_cells, expected);
    expect_supported(grid);
}

TEST(FrontierGeneratorTest, IterationCapKeepsPartialStructure) {
    test::StackKit kit;
    BuildGrid grid(grid_config(5, 3, 5));
    auto ctx = kit.context();

    FrontierConfig config = small_config();
    config.start = {2, 0, 2};
    config.iteration_limit = 1;
    FrontierGenerator generator(config);
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::Capped);
    EXPECT_TRUE(summary.capped());
    EXPECT_TRUE(summary.ok());
    EXPECT_EQ(summary.iterations, 1u);
    EXPECT_EQ(summary.placed, 6u);
    EXPECT_EQ(grid.occupied_count(), 6u);
}

TEST(FrontierGeneratorTest, RulesLimitPlacements) {
    test::StackKit kit;
    kit.rules.add_global(std::make_unique<PlacementLimitRule>("five", 5));
    BuildGrid grid(grid_config(3, 2, 3));
    auto ctx = kit.context();

    FrontierGenerator generator(small_config());
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::Exhausted);
    EXPECT_EQ(summary.placed, 5u);
    EXPECT_EQ(grid.occupied_count(), 5u);
    EXPECT_FALSE(summary.invalid_cells.empty());
}

TEST(FrontierGeneratorTest, ZeroWeightBlocksAreNeverChosen) {
    test::StackKit kit;
    kit.blocks.add(make_block("Shed", SocketSet::make("floor", "floor", "wall", "wall", "wall", "wall")));
    BlockWeight shed;
    shed.block_name = "Shed";
    shed.weight = 0.0f;
    kit.style.set(shed);

    BuildGrid grid(grid_config(4, 2, 4));
    auto ctx = kit.context();
    FrontierGenerator generator(small_config());
    const GenerationSummary summary = generator.generate(grid, ctx);

    ASSERT_EQ(summary.placed, 32u);
    grid.for_each_occupied([](const GridPosition& pos, const PlacedBlock& placed) {
        EXPECT_EQ(placed.name(), "Wall") << pos.to_string();
    });
}

TEST(FrontierGeneratorTest, SameSeedSameStructure) {
    test::StackKit kit;
    kit.blocks.add(make_block("Tower", SocketSet::make("floor", "floor", "wall", "wall", "wall", "wall")));
    kit.blocks.add(make_block("Cap", SocketSet::make("", "floor", "wall", "wall", "wall", "wall")));

    auto run = [&kit](std::uint64_t seed) {
        BuildGrid grid(grid_config(5, 3, 5));
        auto ctx = kit.context();
        FrontierConfig config = small_config();
        config.seed = seed;
        config.start = {2, 0, 2};
        FrontierGenerator generator(config);
        const GenerationSummary summary = generator.generate(grid, ctx);
        EXPECT_TRUE(summary.ok());
        return layout(grid);
    };

    EXPECT_EQ(run(99), run(99));

    // An injected source wins over the configured seed
    SeededRandom a(5);
    SeededRandom b(5);
    BuildGrid grid_a(grid_config(5, 3, 5));
    BuildGrid grid_b(grid_config(5, 3, 5));
    auto ctx_a = kit.context(&a);
    auto ctx_b = kit.context(&b);
    FrontierConfig first = small_config();
    first.seed = 1;
    FrontierConfig second = small_config();
    second.seed = 2;
    FrontierGenerator(first).generate(grid_a, ctx_a);
    FrontierGenerator(second).generate(grid_b, ctx_b);
    EXPECT_EQ(layout(grid_a), layout(grid_b));
}

// =============================================================================
// SEED FAILURES
// =============================================================================

TEST(FrontierGeneratorTest, MissingSeedBlockIsSetupError) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    auto ctx = kit.context();

    FrontierConfig config = small_config();
    config.seed_block = "Nope";
    FrontierGenerator generator(config);
    EXPECT_FALSE(generator.validate(grid, ctx).empty());

    const GenerationSummary summary = generator.generate(grid, ctx);
    EXPECT_EQ(summary.status, GenerationStatus::InvalidSetup);
    EXPECT_FALSE(summary.ok());
    ASSERT_EQ(summary.problems.size(), 1u);
    EXPECT_NE(summary.problems[0].find("Nope"), std::string::npos);
    EXPECT_EQ(grid.occupied_count(), 0u);
}

TEST(FrontierGeneratorTest, UnsupportedSeedFails) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    auto ctx = kit.context();

    FrontierConfig config = small_config();
    config.start = {1, 1, 1};
    FrontierGenerator generator(config);
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::SeedFailed);
    EXPECT_EQ(summary.placed, 0u);
    EXPECT_EQ(grid.occupied_count(), 0u);
}

TEST(FrontierGeneratorTest, SeedSearchesEveryRotation) {
    test::StackKit kit;
    kit.sockets.add_label("door");
    kit.blocks.add(make_block("SideDoor", SocketSet::make("floor", "floor", "wall", "wall", "door", "wall")));
    BuildGrid grid(grid_config(3, 2, 3));
    ASSERT_TRUE(grid.place(*kit.blocks.find("Wall"), {0, 0, 1}, Rotation::R0));
    auto ctx = kit.context();

    // Unturned, the door faces the wall on the left
    FrontierConfig config = small_config();
    config.seed_block = "SideDoor";
    config.rotations = {false, false};
    config.iteration_limit = 1;
    const GenerationSummary summary = FrontierGenerator(config).generate(grid, ctx);

    EXPECT_TRUE(summary.ok());
    const PlacedBlock* seed = grid.block_at({1, 0, 1});
    ASSERT_NE(seed, nullptr);
    EXPECT_EQ(seed->name(), "SideDoor");
    EXPECT_NE(seed->rotation, Rotation::R0);
    EXPECT_NE(seed->sockets.get(Direction::Left), "door");
}

TEST(FrontierGeneratorTest, RefusedSeedIsRolledBack) {
    test::StackKit kit;
    BuildGrid grid(grid_config(3, 2, 3));
    test::RecordingSink sink;
    sink.accept = false;
    auto ctx = kit.context(nullptr, &sink);

    FrontierGenerator generator(small_config());
    const GenerationSummary summary = generator.generate(grid, ctx);

    EXPECT_EQ(summary.status, GenerationStatus::SeedFailed);
    EXPECT_EQ(grid.occupied_count(), 0u);
    EXPECT_EQ(sink.cleared_at, (std::vector<GridPosition>{GridPosition{1, 0, 1}}));
    EXPECT_EQ(grid.socket_at({1, 0, 1}, Direction::Down), "ground");
}

TEST(FrontierGeneratorTest, InvalidSetupIsReported) {
    test::StackKit kit;
    kit.rules.add_block_to_group("Ghost", "Spooky");
    kit.sockets.clear();
    BuildGrid grid(grid_config(3, 2, 3));
    auto ctx = kit.context();

    const GenerationSummary summary = FrontierGenerator(small_config()).generate(grid, ctx);
    EXPECT_EQ(summary.status, GenerationStatus::InvalidSetup);
    EXPECT_EQ(summary.problems.size(), 2u);
}

// =============================================================================
// CONFIGURATION AND REGISTRY
// =============================================================================

TEST(FrontierConfigTest, LoadsGeneratorSection) {
    Settings settings;
    ASSERT_TRUE(settings.parse(R"(
[generator]
seed = 18446744073709551615
start = [2, 0, 3]
center = [4, 6]
iteration_limit = 12
seed_block = "Tower"
max_distance = 7.5
try_all_rotations = false
random_start_rotation = false
all_rotations_as_candidates = true
)"));

    FrontierConfig config;
    ASSERT_TRUE(config.load(settings));
    EXPECT_EQ(config.seed, 18446744073709551615ULL);
    EXPECT_EQ(config.start, (GridPosition{2, 0, 3}));
    EXPECT_FLOAT_EQ(config.center_x, 4.0f);
    EXPECT_FLOAT_EQ(config.center_z, 6.0f);
    EXPECT_EQ(config.iteration_limit, 12u);
    EXPECT_EQ(config.seed_block, "Tower");
    EXPECT_FLOAT_EQ(config.max_distance, 7.5f);
    EXPECT_FALSE(config.rotations.try_all);
    EXPECT_FALSE(config.rotations.random_start);
    EXPECT_TRUE(config.all_rotations_as_candidates);
}

TEST(FrontierConfigTest, RejectsMalformedValues) {
    for (const char* text : {"[generator]\niteration_limit = 5x\n",
                             "[generator]\nmax_distance = far\n",
                             "[generator]\nstart = [1.7, 0, 1]\n",
                             "[generator]\ntry_all_rotations = maybe\n",
                             "[generator]\nseed = -3\n"}) {
        Settings settings;
        ASSERT_TRUE(settings.parse(text));
        FrontierConfig config;
        EXPECT_FALSE(config.load(settings)) << text;
        EXPECT_EQ(config.iteration_limit, FrontierConfig{}.iteration_limit) << text;
        EXPECT_FLOAT_EQ(config.max_distance, FrontierConfig{}.max_distance) << text;
    }
}

TEST(GeneratorRegistryTest, CreatesBuiltInGenerators) {
    const GeneratorRegistry registry;
    EXPECT_EQ(registry.count(), 2u);
    EXPECT_TRUE(registry.has_generator("frontier"));
    EXPECT_TRUE(registry.has_generator("blueprint"));

    Settings settings;
    ASSERT_TRUE(settings.parse("[generator]\nseed = 3\n"));

    auto frontier = registry.create("frontier", settings, 11);
    ASSERT_NE(frontier, nullptr);
    EXPECT_EQ(frontier->type_name(), "frontier");
    EXPECT_EQ(frontier->seed(), 11u);

    EXPECT_EQ(registry.create("voronoi", settings, 0), nullptr);
}
