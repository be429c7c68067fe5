#pragma once

#include "Camera3D.hpp"
#include "GalaxyModel.hpp"
#include "GalaxyParameters.hpp"
#include "Scene.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include "render/PointCloud.hpp"
#include "render/PointsRenderer.hpp"
#include <GLFW/glfw3.h>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace galaxy {

/**
 * @brief Configuration for the galaxy viewer
 */
struct ViewerConfig {
    uint32_t window_width = 1280;
    uint32_t window_height = 720;
    std::string window_title = "Galaxy Generator";
    GalaxyParameters parameters{};
    uint32_t seed = 0;   ///< Random seed (0 = use random device)
};

/**
 * @brief Controller for the galaxy viewer
 *
 * - Model: GalaxyModel (parameters and the displayed point cloud)
 * - View: PointsRenderer drawing the scene
 * - Controller: window, camera input, tweak panel and the main loop
 */
class GalaxyController {
public:
    /**
     * @brief Create the controller and every Vulkan resource it drives
     *
     * @param config Viewer configuration
     * @return Controller instance or error message
     */
    static std::expected<std::unique_ptr<GalaxyController>, std::string> create(
        const ViewerConfig& config = {}
    );

    ~GalaxyController();

    GalaxyController(const GalaxyController&) = delete;
    GalaxyController& operator=(const GalaxyController&) = delete;
    GalaxyController(GalaxyController&&) = delete;
    GalaxyController& operator=(GalaxyController&&) = delete;

    /**
     * @brief Generate the first galaxy and run the main loop
     *
     * Blocks until the window is closed.
     *
     * @return Error message if rendering fails, or void on success
     */
    std::expected<void, std::string> run();

    [[nodiscard]] GalaxyModel& model() { return *m_model; }
    [[nodiscard]] Camera3D& camera() { return *m_camera; }

private:
    explicit GalaxyController(const ViewerConfig& config);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> setup_imgui();

    /**
     * @brief Render the tweak panel
     */
    void render_ui();

    /**
     * @brief Render UI callbacks generically, committing when an edit settles
     */
    void render_ui_callbacks(const std::vector<UICallback>& callbacks);

    std::expected<void, std::string> draw_frame();

    void cleanup();

    // GLFW callbacks (friends to access private members)
    friend void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    friend void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos);
    friend void glfw_scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
    friend void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

    ViewerConfig m_config;

    // Destroyed bottom-up: the model releases its drawable while the
    // factory, renderer and device are still alive
    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<PointsRenderer> m_renderer;
    std::unique_ptr<PointCloudFactory> m_factory;
    Scene m_scene;
    std::unique_ptr<GalaxyModel> m_model;
    std::vector<UICallback> m_ui_callbacks;

    // Camera and input
    std::unique_ptr<Camera3D> m_camera;
    bool m_dragging = false;
    double m_last_mouse_x = 0.0;
    double m_last_mouse_y = 0.0;

    vk::DescriptorPool m_imgui_descriptor_pool;

    // Frame counter for in-flight synchronization
    uint32_t m_current_frame = 0;
};

} // namespace galaxy
