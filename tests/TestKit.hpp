// =============================================================================
// BLOCKFORGE - TEST KIT
// Small in-memory catalogs shared by the test suites
// =============================================================================
#pragma once

#include "Server/BuildGrid.hpp"
#include "Server/BuildingStyle.hpp"
#include "Server/PlacementRules.hpp"
#include "Server/StructureGenerator.hpp"
#include "Shared/BlockRegistry.hpp"
#include "Shared/Orientation.hpp"
#include "Shared/Random.hpp"
#include "Shared/SocketTable.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace blockforge::test {

// Oriented like a registered block; down faces without a remap keep oriented empty
inline BlockDefinition make_block(std::string name, SocketSet sockets, Direction down_face = Direction::Down) {
    const std::string mesh = "meshes/" + name + ".obj";
    if (auto block = BlockDefinition::make(name, sockets, down_face, mesh)) {
        return *block;
    }
    BlockDefinition block;
    block.name = std::move(name);
    block.mesh = mesh;
    block.sockets = std::move(sockets);
    block.down_face = down_face;
    return block;
}

inline server::GridConfig grid_config(GridCoord x, GridCoord y, GridCoord z) {
    server::GridConfig config;
    config.dims = {x, y, z};
    config.ground_socket = "ground";
    return config;
}

// =============================================================================
// STACK KIT
// ground <-> floor, floor <-> floor, wall <-> wall, open <-> open
// "Wall" stacks on anything with a floor top and joins other walls sideways
// =============================================================================
struct StackKit {
    SocketCompatibilityTable sockets;
    BlockRegistry blocks;
    server::BuildingStyle style;
    server::RuleSet rules;

    StackKit() {
        for (const char* label : {"ground", "floor", "wall", "open"}) {
            sockets.add_label(label);
        }
        sockets.set_compatible("ground", "floor", true);
        sockets.set_compatible("floor", "floor", true);
        sockets.set_compatible("wall", "wall", true);
        sockets.set_compatible("open", "open", true);

        blocks.add(make_block("Wall", SocketSet::make("floor", "floor", "wall", "wall", "wall", "wall")));
    }

    server::GenerationContext context(RandomSource* random = nullptr, server::PlacementSink* sink = nullptr) {
        return {blocks, sockets, style, rules, random, sink};
    }
};

// =============================================================================
// RECORDING SINK
// =============================================================================
class RecordingSink final : public server::PlacementSink {
public:
    bool on_place(const GridPosition& pos, const server::PlacedBlock& placed) override {
        placed_at.push_back(pos);
        names.push_back(placed.name());
        return accept;
    }

    void on_clear(const GridPosition& pos) override {
        cleared_at.push_back(pos);
    }

    bool accept = true;
    std::vector<GridPosition> placed_at;
    std::vector<std::string> names;
    std::vector<GridPosition> cleared_at;
};

// =============================================================================
// SCRIPTED RANDOM
// Hands out queued values; falls back to 0 when the queue runs dry
// =============================================================================
class ScriptedRandom final : public RandomSource {
public:
    std::uint64_t next_u64() override { return 0; }

    double next_unit() override {
        if (units.empty()) return 0.0;
        const double v = units.front();
        units.pop_front();
        return v;
    }

    std::size_t next_index(std::size_t bound) override {
        if (indices.empty() || bound == 0) return 0;
        const std::size_t v = indices.front();
        indices.pop_front();
        return v % bound;
    }

    std::deque<double> units;
    std::deque<std::size_t> indices;
};

} // namespace blockforge::test
