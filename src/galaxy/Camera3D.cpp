#include <galaxy/Camera3D.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace galaxy {

namespace {

const glm::vec3 default_position(4.0f, 2.0f, 5.0f);

float wrap_degrees(float angle) {
    angle = std::fmod(angle, 360.0f);
    if (angle < 0.0f) angle += 360.0f;
    return angle;
}

// Applies the damped share of `pending` and decays the remainder
float take_damped(float& pending, float damping) {
    float step = pending * damping;
    pending *= (1.0f - damping);
    if (std::abs(pending) < 1e-5f) {
        step += pending;
        pending = 0.0f;
    }
    return step;
}

} // anonymous namespace

Camera3D::Camera3D(uint32_t viewport_width, uint32_t viewport_height)
    : m_target(0.0f)
    , m_distance(1.0f)
    , m_azimuth(0.0f)
    , m_elevation(0.0f)
    , m_fov(75.0f)
    , m_aspect_ratio(static_cast<float>(viewport_width) / static_cast<float>(viewport_height))
    , m_near_plane(0.1f)
    , m_far_plane(100.0f)
    , m_view_matrix(1.0f)
    , m_projection_matrix(1.0f)
    , m_view_dirty(true)
    , m_projection_dirty(true)
    , m_damping_factor(0.05f)
    , m_mouse_sensitivity(0.25f)
    , m_scroll_sensitivity(0.5f)
{
    look_from(default_position);
}

void Camera3D::update_view_matrix() {
    if (!m_view_dirty) return;

    m_view_matrix = glm::lookAt(position(), m_target, glm::vec3(0.0f, 1.0f, 0.0f));
    m_view_dirty = false;
}

void Camera3D::update_projection_matrix() {
    if (!m_projection_dirty) return;

    // GLM_FORCE_DEPTH_ZERO_TO_ONE gives Vulkan's [0, 1] depth range.
    // The Y flip is done by the renderer's negative viewport height.
    m_projection_matrix = glm::perspective(
        glm::radians(m_fov),
        m_aspect_ratio,
        m_near_plane,
        m_far_plane
    );
    m_projection_dirty = false;
}

glm::mat4 Camera3D::view_matrix() {
    update_view_matrix();
    return m_view_matrix;
}

glm::mat4 Camera3D::projection_matrix() {
    update_projection_matrix();
    return m_projection_matrix;
}

glm::mat4 Camera3D::view_projection_matrix() {
    update_view_matrix();
    update_projection_matrix();
    return m_projection_matrix * m_view_matrix;
}

glm::vec3 Camera3D::position() const {
    float azimuth_rad = glm::radians(m_azimuth);
    float elevation_rad = glm::radians(m_elevation);

    glm::vec3 pos;
    pos.x = m_target.x + m_distance * std::cos(elevation_rad) * std::cos(azimuth_rad);
    pos.y = m_target.y + m_distance * std::sin(elevation_rad);
    pos.z = m_target.z + m_distance * std::cos(elevation_rad) * std::sin(azimuth_rad);
    return pos;
}

void Camera3D::handle_mouse_movement(double xoffset, double yoffset) {
    m_pending_azimuth -= static_cast<float>(xoffset) * m_mouse_sensitivity;
    m_pending_elevation += static_cast<float>(yoffset) * m_mouse_sensitivity;
}

void Camera3D::handle_mouse_scroll(double yoffset) {
    m_pending_distance -= static_cast<float>(yoffset) * m_scroll_sensitivity;
}

void Camera3D::handle_resize(uint32_t width, uint32_t height) {
    // Minimized window
    if (width == 0 || height == 0) return;

    m_aspect_ratio = static_cast<float>(width) / static_cast<float>(height);
    m_projection_dirty = true;
}

bool Camera3D::update() {
    if (m_pending_azimuth == 0.0f && m_pending_elevation == 0.0f && m_pending_distance == 0.0f) {
        return false;
    }

    float azimuth = m_azimuth + take_damped(m_pending_azimuth, m_damping_factor);
    float elevation = m_elevation + take_damped(m_pending_elevation, m_damping_factor);
    set_rotation(azimuth, elevation);
    set_distance(m_distance + take_damped(m_pending_distance, m_damping_factor));
    return true;
}

void Camera3D::set_target(const glm::vec3& target) {
    m_target = target;
    m_view_dirty = true;
}

void Camera3D::set_distance(float distance) {
    m_distance = std::clamp(distance, min_distance, max_distance);
    m_view_dirty = true;
}

void Camera3D::set_rotation(float azimuth, float elevation) {
    m_azimuth = wrap_degrees(azimuth);
    m_elevation = std::clamp(elevation, -89.0f, 89.0f);
    m_view_dirty = true;
}

void Camera3D::look_from(const glm::vec3& position) {
    glm::vec3 offset = position - m_target;
    float distance = glm::length(offset);
    if (distance <= 0.0f) return;

    set_distance(distance);
    set_rotation(glm::degrees(std::atan2(offset.z, offset.x)),
                 glm::degrees(std::asin(offset.y / distance)));
}

void Camera3D::reset() {
    m_pending_azimuth = 0.0f;
    m_pending_elevation = 0.0f;
    m_pending_distance = 0.0f;
    m_target = glm::vec3(0.0f);
    look_from(default_position);
}

} // namespace galaxy
