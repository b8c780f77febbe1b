// =============================================================================
// BLOCKFORGE - BUILDING STYLE
// Per-block base weights shaped by height and distance curves,
// plus the weighted random choice used by the generators
// Loads from config/style.toml
// =============================================================================
#pragma once

#include "Shared/BlockRegistry.hpp"
#include "Shared/Random.hpp"
#include "Shared/Settings.hpp"
#include "Shared/Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace blockforge::server {

// =============================================================================
// WEIGHT CURVE
// Piecewise-linear over sorted keys, clamped beyond the first and last key
// =============================================================================
class WeightCurve {
public:
    struct Key {
        float t = 0.0f;
        float value = 1.0f;
    };

    WeightCurve() = default;
    explicit WeightCurve(std::vector<Key> keys);

    // Straight line from (0, start) to (1, end)
    static WeightCurve linear(float start, float end);
    static WeightCurve constant(float value);

    // Flat [t0, v0, t1, v1, ...]; nullopt on odd length
    static std::optional<WeightCurve> from_flat(const std::vector<float>& flat);

    // An empty curve evaluates to 1
    [[nodiscard]] float evaluate(float t) const noexcept;

    [[nodiscard]] const std::vector<Key>& keys() const noexcept { return m_keys; }
    [[nodiscard]] bool empty() const noexcept { return m_keys.empty(); }

private:
    std::vector<Key> m_keys;
};

// =============================================================================
// BLOCK WEIGHT ENTRY
// =============================================================================
struct BlockWeight {
    std::string block_name;
    float weight = 1.0f;

    bool height_enabled = false;
    WeightCurve height_curve = WeightCurve::constant(1.0f);

    bool distance_enabled = false;
    WeightCurve distance_curve = WeightCurve::constant(1.0f);
};

// =============================================================================
// BUILDING STYLE
// =============================================================================
class BuildingStyle {
public:
    BuildingStyle() = default;
    explicit BuildingStyle(std::string name) : m_name(std::move(name)) {}

    // Replaces an existing entry with the same block name
    void set(BlockWeight entry);

    // One default entry (weight 1, no curves) per registered block
    void initialize_with(const BlockRegistry& blocks);

    // Base weight x enabled curves, never negative; unknown blocks weigh 1
    [[nodiscard]] float weight(std::string_view block_name,
                               float normalized_height = 0.0f,
                               float normalized_distance = 0.0f) const;

    [[nodiscard]] const BlockWeight* find(std::string_view block_name) const;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    void set_name(std::string name) { m_name = std::move(name); }
    [[nodiscard]] const std::vector<BlockWeight>& entries() const noexcept { return m_entries; }

    // [style] name, [[weights.<Block>]] weight / height_curve / distance_curve
    bool load(const Settings& settings);

    // Entries that name blocks missing from the registry, and negative base weights
    [[nodiscard]] std::vector<std::string> validate(const BlockRegistry& blocks) const;

private:
    std::string m_name = "Default Style";
    std::vector<BlockWeight> m_entries;
};

// =============================================================================
// SPATIAL NORMALIZATION
// =============================================================================
namespace spatial {

    [[nodiscard]] float clamp01(float v) noexcept;

    // y / grid height, clamped; 0 for a degenerate grid
    [[nodiscard]] float normalized_height(const GridPosition& pos, GridCoord grid_height) noexcept;

    // Horizontal distance to the center over max_distance, clamped; 0 if max_distance <= 0
    [[nodiscard]] float normalized_distance(const GridPosition& pos,
                                            float center_x, float center_z,
                                            float max_distance) noexcept;

} // namespace spatial

// =============================================================================
// WEIGHTED CHOICE
// Draws r in [0, total) and returns the first index whose running sum
// reaches r. Zero-weight entries are never returned while total > 0;
// when every weight is zero the choice is uniform. Empty input yields nullopt.
// =============================================================================
[[nodiscard]] std::optional<std::size_t> choose_weighted(const std::vector<float>& weights, RandomSource& random);

} // namespace blockforge::server
