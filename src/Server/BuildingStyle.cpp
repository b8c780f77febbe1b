// =============================================================================
// BLOCKFORGE - BUILDING STYLE IMPLEMENTATION
// =============================================================================

#include "Server/BuildingStyle.hpp"
#include "Shared/Logger.hpp"

#include <algorithm>
#include <cmath>

namespace blockforge::server {

// =============================================================================
// WEIGHT CURVE
// =============================================================================

WeightCurve::WeightCurve(std::vector<Key> keys)
    : m_keys(std::move(keys))
{
    std::stable_sort(m_keys.begin(), m_keys.end(), [](const Key& a, const Key& b) {
        return a.t < b.t;
    });
}

WeightCurve WeightCurve::linear(float start, float end) {
    return WeightCurve({{0.0f, start}, {1.0f, end}});
}

WeightCurve WeightCurve::constant(float value) {
    return WeightCurve({{0.0f, value}, {1.0f, value}});
}

std::optional<WeightCurve> WeightCurve::from_flat(const std::vector<float>& flat) {
    if (flat.size() % 2 != 0) return std::nullopt;

    std::vector<Key> keys;
    keys.reserve(flat.size() / 2);
    for (std::size_t i = 0; i < flat.size(); i += 2) {
        keys.push_back({flat[i], flat[i + 1]});
    }
    return WeightCurve(std::move(keys));
}

float WeightCurve::evaluate(float t) const noexcept {
    if (m_keys.empty()) return 1.0f;
    if (t <= m_keys.front().t) return m_keys.front().value;
    if (t >= m_keys.back().t) return m_keys.back().value;

    for (std::size_t i = 1; i < m_keys.size(); ++i) {
        const Key& a = m_keys[i - 1];
        const Key& b = m_keys[i];
        if (t <= b.t) {
            const float span = b.t - a.t;
            if (span <= 0.0f) return b.value;
            const float f = (t - a.t) / span;
            return a.value + (b.value - a.value) * f;
        }
    }
    return m_keys.back().value;
}

// =============================================================================
// BUILDING STYLE
// =============================================================================

void BuildingStyle::set(BlockWeight entry) {
    for (BlockWeight& existing : m_entries) {
        if (existing.block_name == entry.block_name) {
            existing = std::move(entry);
            return;
        }
    }
    m_entries.push_back(std::move(entry));
}

void BuildingStyle::initialize_with(const BlockRegistry& blocks) {
    m_entries.clear();
    for (const BlockDefinition& block : blocks.all()) {
        BlockWeight entry;
        entry.block_name = block.name;
        m_entries.push_back(std::move(entry));
    }
}

const BlockWeight* BuildingStyle::find(std::string_view block_name) const {
    for (const BlockWeight& entry : m_entries) {
        if (entry.block_name == block_name) return &entry;
    }
    return nullptr;
}

float BuildingStyle::weight(std::string_view block_name, float normalized_height, float normalized_distance) const {
    const BlockWeight* entry = find(block_name);
    if (entry == nullptr) {
        return 1.0f;
    }

    float w = entry->weight;
    if (entry->height_enabled) {
        w *= entry->height_curve.evaluate(normalized_height);
    }
    if (entry->distance_enabled) {
        w *= entry->distance_curve.evaluate(normalized_distance);
    }
    return std::max(w, 0.0f);
}

bool BuildingStyle::load(const Settings& settings) {
    bool ok = true;
    m_name = settings.get_string("style.name", m_name);

    for (const std::string& block : settings.tables_with_prefix("weights")) {
        const std::string prefix = "weights." + block + ".";

        BlockWeight entry;
        entry.block_name = block;

        const auto base = settings.try_float(prefix + "weight");
        if (settings.has(prefix + "weight") && !base) {
            BLOCKFORGE_ERROR("Style", "Weight for '", block, "' is not a number");
            ok = false;
            continue;
        }
        entry.weight = base.value_or(1.0f);

        if (settings.has(prefix + "height_curve")) {
            const auto flat = settings.get_float_list(prefix + "height_curve");
            const auto curve = flat ? WeightCurve::from_flat(*flat) : std::nullopt;
            if (!curve) {
                BLOCKFORGE_ERROR("Style", "height_curve for '", block, "' must be [t0, v0, t1, v1, ...]");
                ok = false;
                continue;
            }
            entry.height_enabled = true;
            entry.height_curve = *curve;
        }

        if (settings.has(prefix + "distance_curve")) {
            const auto flat = settings.get_float_list(prefix + "distance_curve");
            const auto curve = flat ? WeightCurve::from_flat(*flat) : std::nullopt;
            if (!curve) {
                BLOCKFORGE_ERROR("Style", "distance_curve for '", block, "' must be [t0, v0, t1, v1, ...]");
                ok = false;
                continue;
            }
            entry.distance_enabled = true;
            entry.distance_curve = *curve;
        }

        set(std::move(entry));
    }

    BLOCKFORGE_LOG("Style", "Loaded style '", m_name, "' with ", m_entries.size(), " weights");
    return ok;
}

std::vector<std::string> BuildingStyle::validate(const BlockRegistry& blocks) const {
    std::vector<std::string> problems;
    for (const BlockWeight& entry : m_entries) {
        if (!blocks.contains(entry.block_name)) {
            problems.push_back("style weight names unknown block '" + entry.block_name + "'");
        }
        if (entry.weight < 0.0f) {
            problems.push_back("style weight for '" + entry.block_name + "' is negative");
        }
    }
    return problems;
}

// =============================================================================
// SPATIAL NORMALIZATION
// =============================================================================

namespace spatial {

float clamp01(float v) noexcept {
    return std::clamp(v, 0.0f, 1.0f);
}

float normalized_height(const GridPosition& pos, GridCoord grid_height) noexcept {
    if (grid_height <= 0) return 0.0f;
    return clamp01(static_cast<float>(pos.y) / static_cast<float>(grid_height));
}

float normalized_distance(const GridPosition& pos, float center_x, float center_z, float max_distance) noexcept {
    if (max_distance <= 0.0f) return 0.0f;
    const float dx = static_cast<float>(pos.x) - center_x;
    const float dz = static_cast<float>(pos.z) - center_z;
    return clamp01(std::sqrt(dx * dx + dz * dz) / max_distance);
}

} // namespace spatial

// =============================================================================
// WEIGHTED CHOICE
// =============================================================================

std::optional<std::size_t> choose_weighted(const std::vector<float>& weights, RandomSource& random) {
    if (weights.empty()) return std::nullopt;

    double total = 0.0;
    for (float w : weights) {
        if (w > 0.0f) total += static_cast<double>(w);
    }

    if (total <= 0.0) {
        return random.next_index(weights.size());
    }

    const double r = random.next_range(total);
    double cumulative = 0.0;
    std::optional<std::size_t> last_positive;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (weights[i] <= 0.0f) continue;
        cumulative += static_cast<double>(weights[i]);
        last_positive = i;
        if (cumulative >= r) {
            return i;
        }
    }

    // Rounding left r past the final sum
    return last_positive;
}

} // namespace blockforge::server
