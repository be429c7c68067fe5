#include <galaxy/PointBuffer.hpp>

namespace galaxy {

PointBuffer::PointBuffer(uint32_t count)
    : m_positions(static_cast<size_t>(count) * 3, 0.0f)
    , m_colors(static_cast<size_t>(count) * 3, 0.0f)
{}

void PointBuffer::resize(uint32_t count) {
    m_positions.resize(static_cast<size_t>(count) * 3, 0.0f);
    m_colors.resize(static_cast<size_t>(count) * 3, 0.0f);
}

void PointBuffer::set_point(uint32_t index, const glm::vec3& position, const Color& color) {
    const size_t i3 = static_cast<size_t>(index) * 3;
    m_positions[i3 + 0] = position.x;
    m_positions[i3 + 1] = position.y;
    m_positions[i3 + 2] = position.z;

    m_colors[i3 + 0] = color.r;
    m_colors[i3 + 1] = color.g;
    m_colors[i3 + 2] = color.b;
}

glm::vec3 PointBuffer::position(uint32_t index) const {
    const size_t i3 = static_cast<size_t>(index) * 3;
    return {m_positions[i3 + 0], m_positions[i3 + 1], m_positions[i3 + 2]};
}

Color PointBuffer::color(uint32_t index) const {
    const size_t i3 = static_cast<size_t>(index) * 3;
    return {m_colors[i3 + 0], m_colors[i3 + 1], m_colors[i3 + 2]};
}

} // namespace galaxy
