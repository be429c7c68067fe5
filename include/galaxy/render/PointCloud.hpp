#pragma once

#include "../Drawable.hpp"
#include "../GpuPointBuffer.hpp"
#include "../VulkanContext.hpp"
#include <expected>
#include <memory>
#include <string>

namespace galaxy {

/**
 * @brief Drawable point cloud backed by a GPU vertex buffer
 *
 * Waits for the device to go idle before its buffer is released, so a frame
 * still in flight never reads freed memory.
 */
class PointCloud : public Drawable {
public:
    PointCloud(vk::Device device, PointBuffer points, const PointMaterial& material, GpuPointBuffer gpu_buffer);
    ~PointCloud() override;

    [[nodiscard]] std::string_view name() const override { return "Galaxy Points"; }

    [[nodiscard]] const GpuPointBuffer& gpu_buffer() const { return m_gpu_buffer; }

private:
    vk::Device m_device;
    GpuPointBuffer m_gpu_buffer;
};

/**
 * @brief Builds PointCloud drawables on the graphics queue
 */
class PointCloudFactory : public DrawableFactory {
public:
    /**
     * @brief Create a factory with its own transfer command pool
     *
     * @param context Vulkan context (must outlive the factory)
     * @return Factory or error message
     */
    static std::expected<std::unique_ptr<PointCloudFactory>, std::string> create(const VulkanContext& context);

    ~PointCloudFactory() override;

    PointCloudFactory(const PointCloudFactory&) = delete;
    PointCloudFactory& operator=(const PointCloudFactory&) = delete;

    [[nodiscard]] std::expected<std::unique_ptr<Drawable>, std::string> create_points(
        PointBuffer&& points,
        const PointMaterial& material
    ) override;

private:
    explicit PointCloudFactory(const VulkanContext& context);

    const VulkanContext* m_context;
    vk::CommandPool m_command_pool;
};

} // namespace galaxy
