#include <galaxy/GalaxyGenerator.hpp>
#include <galaxy/Logger.hpp>
#include <chrono>
#include <cmath>

namespace galaxy {

float branch_angle(uint32_t index, uint32_t branches) {
    return static_cast<float>(index % branches) / static_cast<float>(branches) * glm::two_pi<float>();
}

float sample_jitter(RandomSource& random, float randomness, float randomness_power) {
    float magnitude = std::pow(random.next_uniform(), randomness_power);
    float sign = random.next_uniform() < 0.5f ? -1.0f : 1.0f;
    return magnitude * sign * randomness;
}

Color radial_color(const Color& inside, const Color& outside, float t) {
    return glm::mix(inside, outside, t);
}

PointBuffer generate(const GalaxyParameters& params, RandomSource& random) {
    auto start = std::chrono::steady_clock::now();

    PointBuffer points(params.count);
    const bool jitter = params.randomness > 0.0f;

    for (uint32_t i = 0; i < params.count; i++) {
        float r = random.next_uniform() * params.radius;
        float angle = branch_angle(i, params.branches) + r * params.spin;

        glm::vec3 offset(0.0f);
        if (jitter) {
            offset.x = sample_jitter(random, params.randomness, params.randomness_power);
            offset.y = sample_jitter(random, params.randomness, params.randomness_power);
            offset.z = sample_jitter(random, params.randomness, params.randomness_power);
        }

        glm::vec3 position(std::cos(angle) * r, 0.0f, std::sin(angle) * r);
        points.set_point(i, position + offset,
            radial_color(params.inside_color, params.outside_color, r / params.radius));
    }

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
    Logger::instance().debug("Generated galaxy: {} points, {} branches in {:.2f} ms",
        params.count, params.branches, elapsed.count());

    return points;
}

} // namespace galaxy
