#pragma once

#include "PointBuffer.hpp"
#include "VulkanContext.hpp"
#include <expected>
#include <string>

namespace galaxy {

/**
 * @brief Vertex layout of one galaxy point on the GPU
 *
 * Must match the PointInput struct of points.vert.slang.
 */
struct PointVertex {
    glm::vec3 position;
    glm::vec3 color;
};
static_assert(sizeof(PointVertex) == 24, "PointVertex must be tightly packed");

/**
 * @brief RAII wrapper for a device-local vertex buffer of galaxy points
 *
 * Contents are uploaded once at creation through a staging buffer; the
 * buffer is immutable afterwards. An empty point buffer creates no Vulkan
 * objects and draws nothing.
 */
class GpuPointBuffer {
public:
    /**
     * @brief Create the buffer and upload `points`
     *
     * @param context Vulkan context
     * @param cmd_pool Command pool for the transfer command
     * @param queue Queue for transfer submission
     * @param points CPU point data
     * @return GpuPointBuffer on success, error message on failure
     */
    static std::expected<GpuPointBuffer, std::string> create(
        const VulkanContext& context,
        vk::CommandPool cmd_pool,
        vk::Queue queue,
        const PointBuffer& points
    );

    ~GpuPointBuffer();

    // Non-copyable
    GpuPointBuffer(const GpuPointBuffer&) = delete;
    GpuPointBuffer& operator=(const GpuPointBuffer&) = delete;

    // Movable
    GpuPointBuffer(GpuPointBuffer&& other) noexcept;
    GpuPointBuffer& operator=(GpuPointBuffer&& other) noexcept;

    [[nodiscard]] vk::Buffer buffer() const { return m_buffer; }
    [[nodiscard]] uint32_t vertex_count() const { return m_vertex_count; }
    [[nodiscard]] vk::DeviceSize size_bytes() const { return m_buffer_size; }

private:
    GpuPointBuffer(const VulkanContext& context, uint32_t vertex_count);

    std::expected<void, std::string> create_buffer();
    std::expected<void, std::string> upload(
        vk::CommandPool cmd_pool,
        vk::Queue queue,
        const PointBuffer& points
    );
    void destroy_buffer();

    const VulkanContext* m_context;
    vk::Device m_device;

    vk::Buffer m_buffer;
    vk::DeviceMemory m_memory;
    uint32_t m_vertex_count;
    vk::DeviceSize m_buffer_size;
};

} // namespace galaxy
