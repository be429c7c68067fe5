#pragma once

#include "Camera.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cstdint>

namespace galaxy {

/**
 * @brief Damped orbit camera
 *
 * Orbits a target point on a sphere:
 * - Mouse drag queues orbit rotation (azimuth/elevation)
 * - Scroll wheel queues zoom (distance from target)
 * - update() applies a damping_factor share of the queued motion per frame
 *   and decays the rest, so motion eases out after input stops
 * - Perspective projection with automatic aspect ratio handling
 * - Lazy matrix computation with dirty flags
 */
class Camera3D : public Camera {
public:
    /**
     * @brief Construct camera with default parameters
     *
     * Default camera:
     * - Target: origin
     * - Position: (4, 2, 5)
     * - FOV: 75°, near 0.1, far 100
     * - Damping factor: 0.05
     */
    Camera3D(uint32_t viewport_width = 1280, uint32_t viewport_height = 720);

    [[nodiscard]] glm::mat4 view_matrix();
    [[nodiscard]] glm::mat4 projection_matrix();
    [[nodiscard]] glm::mat4 view_projection_matrix() override;
    [[nodiscard]] glm::vec3 position() const override;

    /**
     * @brief Queue orbit rotation from a mouse drag
     *
     * @param xoffset Mouse X delta in pixels
     * @param yoffset Mouse Y delta in pixels
     */
    void handle_mouse_movement(double xoffset, double yoffset);

    /**
     * @brief Queue zoom from a scroll event
     *
     * @param yoffset Scroll amount (positive = zoom in, negative = zoom out)
     */
    void handle_mouse_scroll(double yoffset);

    void handle_resize(uint32_t width, uint32_t height) override;

    /**
     * @brief Advance damped motion by one frame
     *
     * @return true if the view changed
     */
    bool update();

    void set_target(const glm::vec3& target);

    /**
     * @brief Set camera distance from target (clamped to [min_distance, max_distance])
     */
    void set_distance(float distance);

    /**
     * @brief Set camera rotation angles
     *
     * @param azimuth Horizontal angle in degrees
     * @param elevation Vertical angle in degrees (clamped to [-89, 89])
     */
    void set_rotation(float azimuth, float elevation);

    /**
     * @brief Place the camera at a world position, keeping the current target
     */
    void look_from(const glm::vec3& position);

    /**
     * @brief Reset camera to default parameters and drop queued motion
     */
    void reset();

    [[nodiscard]] glm::vec3 target() const { return m_target; }
    [[nodiscard]] float distance() const { return m_distance; }
    [[nodiscard]] float azimuth() const { return m_azimuth; }
    [[nodiscard]] float elevation() const { return m_elevation; }
    [[nodiscard]] float fov() const { return m_fov; }
    [[nodiscard]] float aspect_ratio() const { return m_aspect_ratio; }
    [[nodiscard]] float damping_factor() const { return m_damping_factor; }

    static constexpr float min_distance = 0.5f;
    static constexpr float max_distance = 50.0f;

private:
    void update_view_matrix();
    void update_projection_matrix();

    // Camera orbital parameters (spherical coordinates)
    glm::vec3 m_target;       ///< Point the camera orbits around
    float m_distance;         ///< Distance from target
    float m_azimuth;          ///< Horizontal rotation (degrees)
    float m_elevation;        ///< Vertical rotation (degrees)

    // Queued motion not yet applied by update()
    float m_pending_azimuth = 0.0f;
    float m_pending_elevation = 0.0f;
    float m_pending_distance = 0.0f;

    // Projection parameters
    float m_fov;              ///< Field of view (degrees)
    float m_aspect_ratio;     ///< Width / height
    float m_near_plane;       ///< Near clipping plane
    float m_far_plane;        ///< Far clipping plane

    // Cached matrices
    glm::mat4 m_view_matrix;
    glm::mat4 m_projection_matrix;

    // Dirty flags for lazy computation
    bool m_view_dirty;
    bool m_projection_dirty;

    float m_damping_factor;       ///< Share of queued motion applied per update
    float m_mouse_sensitivity;    ///< Degrees per pixel for orbit rotation
    float m_scroll_sensitivity;   ///< Distance change per scroll unit
};

} // namespace galaxy
