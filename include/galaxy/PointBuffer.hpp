#pragma once

#include "Common.hpp"
#include <cstdint>
#include <vector>

namespace galaxy {

/**
 * @brief CPU-side point set: index-aligned flat position and color arrays
 *
 * Both arrays hold 3 floats per point. Point i's color always belongs to
 * point i's position; the only way to grow the buffer is resize(), which
 * keeps both arrays the same length.
 */
class PointBuffer {
public:
    PointBuffer() = default;
    explicit PointBuffer(uint32_t count);

    [[nodiscard]] uint32_t count() const { return static_cast<uint32_t>(m_positions.size() / 3); }
    [[nodiscard]] bool empty() const { return m_positions.empty(); }

    void resize(uint32_t count);

    void set_point(uint32_t index, const glm::vec3& position, const Color& color);

    [[nodiscard]] glm::vec3 position(uint32_t index) const;
    [[nodiscard]] Color color(uint32_t index) const;

    /// Flat x,y,z array of size 3 * count()
    [[nodiscard]] const std::vector<float>& positions() const { return m_positions; }

    /// Flat r,g,b array of size 3 * count()
    [[nodiscard]] const std::vector<float>& colors() const { return m_colors; }

private:
    std::vector<float> m_positions;
    std::vector<float> m_colors;
};

} // namespace galaxy
