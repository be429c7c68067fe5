#pragma once

#include <galaxy/VulkanCommon.hpp>
#include <galaxy/VulkanContext.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace galaxy {

/**
 * @brief GLFW window with integrated Vulkan presentation
 *
 * Owns the presentation stack: surface, swapchain, depth buffer, render pass
 * and framebuffers. The swapchain is recreated on resize or when the surface
 * reports out-of-date / suboptimal.
 */
class Window {
public:
    /**
     * @brief Create a Window with Vulkan presentation
     *
     * @param context Vulkan context for device/queue access
     * @param width Initial window width
     * @param height Initial window height
     * @param title Window title
     * @return Window instance or error message
     */
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        int width,
        int height,
        std::string_view title
    );

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;
    Window(Window&&) = delete;
    Window& operator=(Window&&) = delete;

    /**
     * @brief Initialize GLFW once per process
     *
     * Must run before VulkanContext queries the required instance extensions.
     * Throws std::runtime_error if GLFW cannot be initialized.
     */
    static void ensure_glfw_initialized();

    [[nodiscard]] bool should_close() const;

    [[nodiscard]] int get_width() const { return m_width; }
    [[nodiscard]] int get_height() const { return m_height; }

    /**
     * @brief Get GLFW window handle (for input/ImGui)
     */
    [[nodiscard]] GLFWwindow* get_window_handle() const { return m_window_handle; }

    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }

    [[nodiscard]] uint32_t image_count() const {
        return static_cast<uint32_t>(m_swapchain_images.size());
    }

    [[nodiscard]] vk::Framebuffer get_framebuffer(uint32_t index) const {
        return m_framebuffers[index];
    }

    /**
     * @brief Acquire next swapchain image
     *
     * If the swapchain had to be recreated, returns nullopt to signal the
     * caller to skip this frame.
     *
     * @param signal_semaphore Semaphore to signal when image is available
     * @param timeout Timeout in nanoseconds
     * @return Image index, or nullopt if swapchain was recreated
     */
    [[nodiscard]] std::optional<uint32_t> acquire_next_image(
        vk::Semaphore signal_semaphore,
        uint64_t timeout = UINT64_MAX
    );

    /**
     * @brief Present rendered image to screen
     *
     * @return true if presented, false if the swapchain must be recreated
     */
    [[nodiscard]] bool present(
        vk::Queue present_queue,
        vk::Semaphore wait_semaphore,
        uint32_t image_index
    );

    /**
     * @brief Recreate the swapchain on the next acquire_next_image()
     */
    void mark_resize_needed() { m_needs_resize = true; }

private:
    Window(const VulkanContext& context, int width, int height, std::string_view title);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> create_swapchain();
    std::expected<void, std::string> create_render_pass();
    std::expected<void, std::string> create_framebuffers();
    std::expected<void, std::string> create_depth_resources();
    std::expected<void, std::string> recreate_swapchain();

    [[nodiscard]] std::expected<vk::Format, std::string> find_depth_format() const;

    void cleanup_swapchain();
    void cleanup();

    [[nodiscard]] vk::SurfaceFormatKHR choose_surface_format(
        const std::vector<vk::SurfaceFormatKHR>& available_formats) const;
    [[nodiscard]] vk::PresentModeKHR choose_present_mode(
        const std::vector<vk::PresentModeKHR>& available_modes) const;
    [[nodiscard]] vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const;

    GLFWwindow* m_window_handle = nullptr;
    int m_width;
    int m_height;

    const VulkanContext* m_context;
    vk::Device m_device;

    // Presentation resources
    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode = vk::PresentModeKHR::eFifo;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;

    std::vector<vk::Image> m_swapchain_images;
    std::vector<vk::ImageView> m_image_views;
    std::vector<vk::Framebuffer> m_framebuffers;
    vk::RenderPass m_render_pass;

    // Depth buffer resources
    vk::Image m_depth_image;
    vk::DeviceMemory m_depth_memory;
    vk::ImageView m_depth_image_view;
    vk::Format m_depth_format = vk::Format::eUndefined;

    bool m_needs_resize = false;
};

} // namespace galaxy
