#pragma once

#include "GalaxyParameters.hpp"
#include "PointBuffer.hpp"
#include "RandomSource.hpp"
#include <cstdint>

namespace galaxy {

/**
 * @brief Angle of the spiral arm point `index` belongs to
 *
 * Points are assigned to arms by index modulo `branches`, so the result has
 * period `branches` in index space and lies in [0, 2π).
 */
[[nodiscard]] float branch_angle(uint32_t index, uint32_t branches);

/**
 * @brief One axis of jitter: u^power with a random sign, scaled by `randomness`
 *
 * Consumes two draws from `random` (magnitude, then sign).
 */
[[nodiscard]] float sample_jitter(RandomSource& random, float randomness, float randomness_power);

/**
 * @brief Radial color gradient between inside and outside color
 *
 * @param t Normalized radius r / radius in [0, 1]
 */
[[nodiscard]] Color radial_color(const Color& inside, const Color& outside, float t);

/**
 * @brief Lay out a spiral galaxy
 *
 * For point i: r = u * radius, angle = branch_angle(i) + r * spin,
 * position = (cos(angle) * r, 0, sin(angle) * r) + jitter and
 * color = radial_color(inside, outside, r / radius).
 * Jitter is applied on all three axes when `params.randomness > 0`.
 *
 * @param params Parameters, expected to be within their domains (see GalaxyParameters::clamped())
 * @param random Uniform draw source (1 draw per point, 7 with jitter)
 * @return Freshly allocated point buffer with params.count points
 */
[[nodiscard]] PointBuffer generate(const GalaxyParameters& params, RandomSource& random);

} // namespace galaxy
