#pragma once

#include <cstdint>
#include <random>

namespace galaxy {

/**
 * @brief Source of independent uniform [0, 1) draws
 *
 * The generator takes one of these by reference so callers decide whether
 * regenerations vary (default) or repeat (fixed seed, scripted draws in tests).
 */
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Next uniform draw in [0, 1)
    [[nodiscard]] virtual float next_uniform() = 0;
};

/**
 * @brief Mersenne Twister backed random source
 */
class DefaultRandomSource : public RandomSource {
public:
    /**
     * @param seed Random seed (0 = use random device)
     */
    explicit DefaultRandomSource(uint32_t seed = 0);

    [[nodiscard]] float next_uniform() override;

    [[nodiscard]] uint32_t seed() const { return m_seed; }

private:
    uint32_t m_seed;
    std::mt19937 m_rng;
    std::uniform_real_distribution<float> m_dist;
};

} // namespace galaxy
