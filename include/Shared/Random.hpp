// =============================================================================
// BLOCKFORGE - RANDOM SOURCE
// Injectable randomness for rotation order and weighted selection
// =============================================================================
#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace blockforge {

// =============================================================================
// RANDOM SOURCE INTERFACE
// =============================================================================
class RandomSource {
public:
    virtual ~RandomSource() = default;

    [[nodiscard]] virtual std::uint64_t next_u64() = 0;

    // Uniform in [0, 1)
    [[nodiscard]] virtual double next_unit() {
        // 53 high bits -> double mantissa
        return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
    }

    // Uniform in [0, bound); bound == 0 returns 0
    [[nodiscard]] virtual std::size_t next_index(std::size_t bound) {
        if (bound == 0) return 0;
        return static_cast<std::size_t>(next_u64() % bound);
    }

    // Uniform in [0, upper)
    [[nodiscard]] double next_range(double upper) {
        return next_unit() * upper;
    }
};

// =============================================================================
// SEEDED RANDOM (mt19937_64)
// Same seed, same sequence, on every platform
// =============================================================================
class SeededRandom final : public RandomSource {
public:
    explicit SeededRandom(std::uint64_t seed = 0) : m_engine(seed), m_seed(seed) {}

    [[nodiscard]] std::uint64_t next_u64() override {
        return m_engine();
    }

    [[nodiscard]] std::uint64_t seed() const noexcept { return m_seed; }

private:
    std::mt19937_64 m_engine;
    std::uint64_t m_seed;
};

} // namespace blockforge
