#pragma once

#include "Common.hpp"
#include <cstdint>

namespace galaxy {

/**
 * @brief Inclusive range and panel step of a numeric galaxy parameter
 */
template<typename T>
struct ParameterDomain {
    T min;
    T max;
    T step;
};

/**
 * @brief Parameter record for galaxy generation
 *
 * Plain value type. The model owns one instance, the tweak panel edits it
 * through UI callbacks and the generator receives it by const reference.
 */
struct GalaxyParameters {
    uint32_t count = 1000;           ///< Number of points generated
    float size = 0.02f;              ///< Rendered point size (world units)
    float radius = 5.0f;             ///< Maximum sampling radius
    uint32_t branches = 3;           ///< Number of spiral arms
    float spin = 1.0f;               ///< Angular twist per unit radius
    float randomness = 0.2f;         ///< Magnitude of per-axis jitter (0 disables jitter)
    float randomness_power = 3.0f;   ///< Exponent shaping jitter toward zero
    Color inside_color{1.0f, 0.376f, 0.188f};   ///< #ff6030, color at radius 0
    Color outside_color{0.106f, 0.224f, 0.518f}; ///< #1b3984, color at full radius

    static constexpr ParameterDomain<uint32_t> count_domain{100, 100'000, 100};
    static constexpr ParameterDomain<float> size_domain{0.001f, 0.1f, 0.001f};
    static constexpr ParameterDomain<float> radius_domain{0.01f, 20.0f, 0.01f};
    static constexpr ParameterDomain<uint32_t> branches_domain{2, 20, 1};
    static constexpr ParameterDomain<float> spin_domain{-5.0f, 5.0f, 0.001f};
    static constexpr ParameterDomain<float> randomness_domain{0.0f, 2.0f, 0.001f};
    static constexpr ParameterDomain<float> randomness_power_domain{1.0f, 10.0f, 0.001f};

    /**
     * @brief Copy of this record with every numeric field clamped into its domain
     *
     * Color channels are clamped to [0, 1].
     */
    [[nodiscard]] GalaxyParameters clamped() const;

    bool operator==(const GalaxyParameters&) const = default;
};

} // namespace galaxy
