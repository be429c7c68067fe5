#include <galaxy/GalaxyParameters.hpp>
#include <algorithm>

namespace galaxy {

namespace {

template<typename T>
T clamp_to(T value, const ParameterDomain<T>& domain) {
    return std::clamp(value, domain.min, domain.max);
}

} // anonymous namespace

GalaxyParameters GalaxyParameters::clamped() const {
    GalaxyParameters result = *this;
    result.count = clamp_to(count, count_domain);
    result.size = clamp_to(size, size_domain);
    result.radius = clamp_to(radius, radius_domain);
    result.branches = clamp_to(branches, branches_domain);
    result.spin = clamp_to(spin, spin_domain);
    result.randomness = clamp_to(randomness, randomness_domain);
    result.randomness_power = clamp_to(randomness_power, randomness_power_domain);
    result.inside_color = glm::clamp(inside_color, Color(0.0f), Color(1.0f));
    result.outside_color = glm::clamp(outside_color, Color(0.0f), Color(1.0f));
    return result;
}

} // namespace galaxy
