#include <galaxy/RandomSource.hpp>
#include <cmath>

namespace galaxy {

DefaultRandomSource::DefaultRandomSource(uint32_t seed)
    : m_seed(seed == 0 ? std::random_device{}() : seed)
    , m_rng(m_seed)
    , m_dist(0.0f, 1.0f)
{}

float DefaultRandomSource::next_uniform() {
    float value = m_dist(m_rng);
    // generate_canonical<float> may round up to 1.0
    if (value >= 1.0f) {
        value = std::nextafter(1.0f, 0.0f);
    }
    return value;
}

} // namespace galaxy
