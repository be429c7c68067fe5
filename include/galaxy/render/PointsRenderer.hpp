#pragma once

#include "../Camera.hpp"
#include "../PointMaterial.hpp"
#include "../Scene.hpp"
#include "../Shader.hpp"
#include "../VulkanContext.hpp"
#include <array>
#include <expected>
#include <memory>
#include <string>
#include <vector>

struct ImDrawData;

namespace galaxy {

/**
 * @brief Information needed to render a frame
 */
struct FrameRenderInfo {
    uint32_t image_index;                       ///< Swapchain image index
    uint32_t current_frame;                     ///< Frame-in-flight index (for fence cycling)
    vk::Semaphore image_available_semaphore;    ///< Semaphore signaled when image is available
    vk::Framebuffer framebuffer;                ///< Target framebuffer
    vk::Extent2D extent;                        ///< Render area extent
    vk::RenderPass render_pass;                 ///< Render pass to use
    std::array<vk::ClearValue, 2> clear_values; ///< Clear values for render pass (color, depth)
    const Scene& scene;                         ///< Drawables to render
    Camera& camera;                             ///< Camera for view/projection
    ImDrawData* imgui_draw_data;                ///< ImGui draw data (optional)
};

/**
 * @brief Renders every PointCloud attached to a scene as point sprites
 *
 * Owns the graphics command infrastructure: one command buffer and
 * render-finished semaphore per swapchain image, and a fence, view uniform
 * buffer and image-available semaphore per frame in flight.
 *
 * Features:
 * - Vertex input layout taken from shader reflection
 * - One pipeline per (additive blending, depth write) combination
 * - Point size, size attenuation and vertex colors as push constants
 * - Dynamic viewport/scissor handling
 */
class PointsRenderer {
public:
    static constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

    /**
     * @brief Create the renderer
     *
     * @param context Vulkan context
     * @param render_pass Render pass for the graphics pipelines
     * @param image_count Number of swapchain images
     * @return PointsRenderer instance or error message
     */
    static std::expected<std::unique_ptr<PointsRenderer>, std::string> create(
        const VulkanContext& context,
        vk::RenderPass render_pass,
        uint32_t image_count
    );

    ~PointsRenderer();

    PointsRenderer(const PointsRenderer&) = delete;
    PointsRenderer& operator=(const PointsRenderer&) = delete;
    PointsRenderer(PointsRenderer&&) = delete;
    PointsRenderer& operator=(PointsRenderer&&) = delete;

    /**
     * @brief Wait until the frame slot is free for reuse
     *
     * @param current_frame Frame-in-flight index
     * @return Semaphore to pass to Window::acquire_next_image()
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> begin_frame(uint32_t current_frame);

    /**
     * @brief Record and submit one frame
     *
     * Records the render pass with all point clouds of the scene followed by
     * ImGui, and submits it waiting on the image-available semaphore.
     *
     * @return Semaphore signaled when rendering is complete (for presentation)
     */
    [[nodiscard]] std::expected<vk::Semaphore, std::string> render_frame(
        const FrameRenderInfo& info,
        vk::Queue graphics_queue
    );

    /**
     * @brief Recreate per-image resources after the swapchain changed
     */
    std::expected<void, std::string> handle_swapchain_recreation(uint32_t new_image_count);

    /**
     * @brief Pipeline slot for a material's blend/depth-write combination
     */
    [[nodiscard]] static size_t pipeline_index(const PointMaterial& material) {
        return (material.additive_blending ? 1u : 0u) | (material.depth_write ? 2u : 0u);
    }

private:
    PointsRenderer(const VulkanContext& context, vk::RenderPass render_pass);

    std::expected<void, std::string> initialize(uint32_t image_count);
    std::expected<void, std::string> create_descriptor_layout();
    std::expected<void, std::string> create_pipelines();
    std::expected<vk::Pipeline, std::string> create_pipeline(bool additive_blending, bool depth_write);
    std::expected<void, std::string> create_view_buffers();
    std::expected<void, std::string> create_frame_sync();

    void record_points(vk::CommandBuffer cmd, const FrameRenderInfo& info);

    void cleanup();

    const VulkanContext* m_context;
    vk::Device m_device;
    vk::RenderPass m_render_pass;

    // Shaders and pipelines
    std::unique_ptr<Shader> m_vertex_shader;
    std::unique_ptr<Shader> m_fragment_shader;
    vk::DescriptorSetLayout m_descriptor_layout;
    vk::PipelineLayout m_pipeline_layout;
    std::array<vk::Pipeline, 4> m_pipelines{};

    // View parameters, one uniform buffer per frame in flight
    vk::DescriptorPool m_descriptor_pool;
    std::array<vk::DescriptorSet, MAX_FRAMES_IN_FLIGHT> m_descriptor_sets{};
    std::array<vk::Buffer, MAX_FRAMES_IN_FLIGHT> m_view_buffers{};
    std::array<vk::DeviceMemory, MAX_FRAMES_IN_FLIGHT> m_view_memories{};
    std::array<void*, MAX_FRAMES_IN_FLIGHT> m_view_mapped{};

    // Graphics command infrastructure
    vk::CommandPool m_graphics_command_pool;
    std::vector<vk::CommandBuffer> m_command_buffers;         // One per swapchain image
    std::vector<vk::Semaphore> m_render_finished_semaphores;  // One per swapchain image
    std::vector<vk::Semaphore> m_image_available_semaphores;  // One per frame in flight
    std::vector<vk::Fence> m_in_flight_fences;                // One per frame in flight
    std::vector<vk::Fence> m_images_in_flight;                // Fence currently using each image
};

} // namespace galaxy
