#include <galaxy/render/PointCloud.hpp>
#include <galaxy/Logger.hpp>

namespace galaxy {

PointCloud::PointCloud(vk::Device device, PointBuffer points, const PointMaterial& material, GpuPointBuffer gpu_buffer)
    : Drawable(std::move(points), material)
    , m_device(device)
    , m_gpu_buffer(std::move(gpu_buffer))
{}

PointCloud::~PointCloud() {
    if (auto result = m_device.waitIdle(); result != vk::Result::eSuccess) {
        Logger::instance().error("waitIdle before releasing point cloud failed: {}", vk::to_string(result));
    }
    Logger::instance().trace("Releasing point cloud ({} points)", point_count());
}

PointCloudFactory::PointCloudFactory(const VulkanContext& context)
    : m_context(&context)
    , m_command_pool(nullptr)
{}

std::expected<std::unique_ptr<PointCloudFactory>, std::string> PointCloudFactory::create(
    const VulkanContext& context
) {
    auto factory = std::unique_ptr<PointCloudFactory>(new PointCloudFactory(context));

    auto pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(context.queue_indices().graphics)
        .setFlags(vk::CommandPoolCreateFlagBits::eTransient);

    auto pool_res = context.device().createCommandPool(pool_info);
    GALAXY_CHECK_VK_RESULT(pool_res, "Failed to create transfer command pool: {}");
    factory->m_command_pool = pool_res.value;

    Logger::instance().debug("Created PointCloudFactory");
    return factory;
}

PointCloudFactory::~PointCloudFactory() {
    if (m_command_pool) {
        m_context->device().destroyCommandPool(m_command_pool);
    }
}

std::expected<std::unique_ptr<Drawable>, std::string> PointCloudFactory::create_points(
    PointBuffer&& points,
    const PointMaterial& material
) {
    auto gpu_buffer = GpuPointBuffer::create(*m_context, m_command_pool, m_context->graphics_queue(), points);
    if (!gpu_buffer) {
        return std::unexpected(gpu_buffer.error());
    }

    return std::make_unique<PointCloud>(m_context->device(), std::move(points), material, std::move(*gpu_buffer));
}

} // namespace galaxy
