#include "TestKit.hpp"

#include "Client/BuildKit.hpp"
#include "Client/GridPrinter.hpp"
#include "Client/PlacementLog.hpp"
#include "Server/GeneratorRegistry.hpp"
#include "Shared/ThreadPool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>

using namespace blockforge;
using namespace blockforge::client;
using blockforge::test::grid_config;
using blockforge::test::make_block;

// =============================================================================
// PLACEMENT LOG
// =============================================================================

TEST(PlacementLogTest, WritesOneLinePerEvent) {
    test::StackKit kit;
    server::BuildGrid grid(grid_config(3, 2, 3));
    ASSERT_TRUE(grid.place(*kit.blocks.find("Wall"), {1, 0, 2}, Rotation::R90));

    PlacementLog log;
    EXPECT_TRUE(log.on_place({1, 0, 2}, *grid.block_at({1, 0, 2})));
    log.on_clear({1, 0, 2});

    EXPECT_EQ(log.entries().size(), 2u);
    EXPECT_EQ(log.placements(), 1u);
    EXPECT_EQ(log.to_text(), "place Wall 1 0 2 90 meshes/Wall.obj\nclear 1 0 2\n");

    log.clear();
    EXPECT_TRUE(log.entries().empty());
}

TEST(PlacementLogTest, RefusingLogStillRecords) {
    test::StackKit kit;
    server::BuildGrid grid(grid_config(3, 2, 3));
    ASSERT_TRUE(grid.place(*kit.blocks.find("Wall"), {0, 0, 0}, Rotation::R0));

    PlacementLog log;
    log.set_accepting(false);
    EXPECT_FALSE(log.on_place({0, 0, 0}, *grid.block_at({0, 0, 0})));
    EXPECT_EQ(log.placements(), 1u);
}

// =============================================================================
// GRID PRINTER
// =============================================================================

TEST(GridPrinterTest, RendersTopLayerFirst) {
    test::StackKit kit;
    kit.sockets.add_label("door");
    kit.blocks.add(make_block("Door", SocketSet::make("floor", "floor", "door", "wall", "wall", "wall")));

    server::BuildGrid grid(grid_config(2, 2, 2));
    ASSERT_TRUE(grid.place(*kit.blocks.find("Wall"), {0, 0, 0}, Rotation::R0));

    const GridPrinter printer(kit.blocks);
    EXPECT_EQ(printer.symbol_for("Wall"), 'A');
    EXPECT_EQ(printer.symbol_for("Door"), 'B');
    EXPECT_EQ(printer.symbol_for("Chimney"), '?');

    EXPECT_EQ(printer.render(grid, {{1, 0, 1}}),
              "y = 1\n"
              "  ..\n"
              "  ..\n"
              "y = 0\n"
              "  A.\n"
              "  .x\n");

    EXPECT_EQ(printer.legend(),
              "  A = Wall\n"
              "  B = Door\n"
              "  . = empty, x = unfillable\n");
}

// =============================================================================
// BUILD KIT
// =============================================================================

TEST(BuildKitTest, LoadsFromText) {
    BuildKit kit;
    ASSERT_TRUE(kit.load_text(
        "[sockets]\nground = [\"floor\"]\nfloor = [\"floor\"]\nwall = [\"wall\"]\n",
        "[[blocks.Wall]]\nup = \"floor\"\ndown = \"floor\"\n"
        "front = \"wall\"\nback = \"wall\"\nleft = \"wall\"\nright = \"wall\"\n",
        "",
        "[[rules.cap]]\ntype = \"placement_limit\"\nmax_count = 3\n",
        "[grid]\nsize_x = 4\nsize_y = 2\nsize_z = 3\n"));

    EXPECT_EQ(kit.blocks.size(), 1u);
    EXPECT_TRUE(kit.sockets.are_compatible("ground", "floor"));
    EXPECT_EQ(kit.grid.dims, (GridDimensions{4, 2, 3}));
    EXPECT_EQ(kit.style.entries().size(), 1u);

    server::RuleSet rules;
    ASSERT_TRUE(kit.make_rules(rules));
    EXPECT_EQ(rules.rule_count(), 1u);

    // Each call starts from an empty set
    ASSERT_TRUE(kit.make_rules(rules));
    EXPECT_EQ(rules.rule_count(), 1u);
}

TEST(BuildKitTest, ReportsBadRules) {
    BuildKit kit;
    EXPECT_FALSE(kit.load_text("[sockets]\nfloor = [\"floor\"]\n",
                               "[[blocks.Wall]]\ndown = \"floor\"\n",
                               "",
                               "[[rules.odd]]\ntype = \"teleporter\"\n"));
}

TEST(BuildKitTest, RejectsMalformedGridNumbers) {
    BuildKit kit;
    EXPECT_FALSE(kit.load_text("[sockets]\nfloor = [\"floor\"]\n",
                               "[[blocks.Wall]]\ndown = \"floor\"\n",
                               "",
                               "",
                               "[grid]\nsize_x = 3.5\nsize_y = abc\nsize_z = 4\n"));
}

TEST(BuildKitTest, MissingDirectoryFails) {
    BuildKit kit;
    EXPECT_FALSE(kit.load("no/such/config/dir"));
}

TEST(BuildKitTest, LoadsSampleConfig) {
    BuildKit kit;
    ASSERT_TRUE(kit.load(BLOCKFORGE_CONFIG_DIR));

    EXPECT_EQ(kit.blocks.size(), 5u);
    EXPECT_EQ(kit.grid.dims, (GridDimensions{10, 5, 10}));
    EXPECT_EQ(kit.style.name(), "Townhouse");
    EXPECT_NE(kit.blocks.find("BlockWithDoor"), nullptr);

    server::RuleSet rules;
    ASSERT_TRUE(kit.make_rules(rules));
    EXPECT_EQ(rules.rule_count(), 6u);
    EXPECT_TRUE(rules.validate(kit.blocks).empty());
}

TEST(BuildKitTest, SampleConfigDrivesBothGenerators) {
    BuildKit kit;
    ASSERT_TRUE(kit.load(BLOCKFORGE_CONFIG_DIR));
    const server::GeneratorRegistry registry;

    for (const char* name : {"frontier", "blueprint"}) {
        auto generator = registry.create(name, kit.settings, 7);
        ASSERT_NE(generator, nullptr) << name;

        server::RuleSet rules;
        ASSERT_TRUE(kit.make_rules(rules));
        server::BuildGrid grid(kit.grid);
        PlacementLog log;
        server::GenerationContext ctx{kit.blocks, kit.sockets, kit.style, rules, nullptr, &log};

        const server::GenerationSummary summary = generator->generate(grid, ctx);
        EXPECT_TRUE(summary.ok()) << name;
        EXPECT_GT(summary.placed, 0u) << name;
        EXPECT_EQ(grid.occupied_count(), summary.placed) << name;
        EXPECT_EQ(log.placements(), summary.placed) << name;
    }
}

TEST(BuildKitTest, SameSeedSameBuilding) {
    BuildKit kit;
    ASSERT_TRUE(kit.load(BLOCKFORGE_CONFIG_DIR));
    const server::GeneratorRegistry registry;

    auto run = [&](std::uint64_t seed) {
        auto generator = registry.create("frontier", kit.settings, seed);
        server::RuleSet rules;
        EXPECT_TRUE(kit.make_rules(rules));
        server::BuildGrid grid(kit.grid);
        PlacementLog log;
        server::GenerationContext ctx{kit.blocks, kit.sockets, kit.style, rules, nullptr, &log};
        static_cast<void>(generator->generate(grid, ctx));
        return log.to_text();
    };

    const std::string first = run(99);
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(run(99), first);
}

// =============================================================================
// THREAD POOL
// =============================================================================

TEST(ThreadPoolTest, RunsJobsAndReturnsResults) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.size(), 3u);

    std::atomic<int> counter{0};
    std::vector<std::future<int>> results;
    for (int i = 0; i < 16; ++i) {
        results.push_back(pool.submit([i, &counter]() {
            counter.fetch_add(1);
            return i * i;
        }));
    }

    pool.wait_idle();
    EXPECT_EQ(counter.load(), 16);
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, SubmitAfterShutdownGivesInvalidFuture) {
    ThreadPool pool(1);
    pool.shutdown();
    auto future = pool.submit([]() { return 1; });
    EXPECT_FALSE(future.valid());
}
