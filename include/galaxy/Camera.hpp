#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace galaxy {

/**
 * @brief Abstract camera interface
 *
 * The renderer only needs a view-projection matrix and the viewport size
 * hook, so any camera model can drive it.
 */
class Camera {
public:
    virtual ~Camera() = default;

    /**
     * @brief Get the combined view-projection matrix
     *
     * This matrix transforms world coordinates to clip space.
     */
    [[nodiscard]] virtual glm::mat4 view_projection_matrix() = 0;

    /**
     * @brief Handle window/viewport resize
     *
     * @param width New viewport width
     * @param height New viewport height
     */
    virtual void handle_resize(uint32_t width, uint32_t height) = 0;

    /**
     * @brief Get the camera's position in world space
     */
    [[nodiscard]] virtual glm::vec3 position() const = 0;
};

} // namespace galaxy
