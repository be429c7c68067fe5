#include <galaxy/GpuPointBuffer.hpp>
#include <galaxy/Logger.hpp>
#include <cstring>
#include <utility>
#include <vector>

namespace galaxy {

namespace {

/**
 * @brief Host-visible staging buffer, destroyed on scope exit
 */
struct StagingBuffer {
    vk::Device device;
    vk::Buffer buffer;
    vk::DeviceMemory memory;

    explicit StagingBuffer(vk::Device dev) : device(dev) {}
    ~StagingBuffer() {
        if (buffer) {
            device.destroyBuffer(buffer);
        }
        if (memory) {
            device.freeMemory(memory);
        }
    }

    /// Give up ownership without destroying (the GPU may still use the buffer)
    void release() {
        buffer = nullptr;
        memory = nullptr;
    }

    StagingBuffer(const StagingBuffer&) = delete;
    StagingBuffer& operator=(const StagingBuffer&) = delete;
};

std::vector<PointVertex> interleave(const PointBuffer& points) {
    std::vector<PointVertex> vertices(points.count());
    for (uint32_t i = 0; i < points.count(); ++i) {
        vertices[i].position = points.position(i);
        vertices[i].color = points.color(i);
    }
    return vertices;
}

} // anonymous namespace

GpuPointBuffer::GpuPointBuffer(const VulkanContext& context, uint32_t vertex_count)
    : m_context(&context)
    , m_device(context.device())
    , m_buffer(nullptr)
    , m_memory(nullptr)
    , m_vertex_count(vertex_count)
    , m_buffer_size(static_cast<vk::DeviceSize>(vertex_count) * sizeof(PointVertex))
{}

std::expected<GpuPointBuffer, std::string> GpuPointBuffer::create(
    const VulkanContext& context,
    vk::CommandPool cmd_pool,
    vk::Queue queue,
    const PointBuffer& points
) {
    GpuPointBuffer buffer(context, points.count());
    if (points.empty()) {
        Logger::instance().debug("Empty point buffer, no GPU storage created");
        return buffer;
    }

    if (auto result = buffer.create_buffer(); !result) {
        return std::unexpected(result.error());
    }
    if (auto result = buffer.upload(cmd_pool, queue, points); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().debug("Created point vertex buffer: {} points ({:.2f} MB)",
        buffer.m_vertex_count,
        buffer.m_buffer_size / (1024.0 * 1024.0));

    return buffer;
}

GpuPointBuffer::~GpuPointBuffer() {
    destroy_buffer();
}

GpuPointBuffer::GpuPointBuffer(GpuPointBuffer&& other) noexcept
    : m_context(other.m_context)
    , m_device(other.m_device)
    , m_buffer(std::exchange(other.m_buffer, nullptr))
    , m_memory(std::exchange(other.m_memory, nullptr))
    , m_vertex_count(std::exchange(other.m_vertex_count, 0))
    , m_buffer_size(std::exchange(other.m_buffer_size, 0))
{}

GpuPointBuffer& GpuPointBuffer::operator=(GpuPointBuffer&& other) noexcept {
    if (this != &other) {
        destroy_buffer();

        m_context = other.m_context;
        m_device = other.m_device;
        m_buffer = std::exchange(other.m_buffer, nullptr);
        m_memory = std::exchange(other.m_memory, nullptr);
        m_vertex_count = std::exchange(other.m_vertex_count, 0);
        m_buffer_size = std::exchange(other.m_buffer_size, 0);
    }
    return *this;
}

std::expected<void, std::string> GpuPointBuffer::create_buffer() {
    auto buffer_info = vk::BufferCreateInfo()
        .setSize(m_buffer_size)
        .setUsage(vk::BufferUsageFlagBits::eVertexBuffer | vk::BufferUsageFlagBits::eTransferDst)
        .setSharingMode(vk::SharingMode::eExclusive);

    auto buffer_res = m_device.createBuffer(buffer_info);
    GALAXY_CHECK_VK_RESULT(buffer_res, "Failed to create vertex buffer: {}");
    m_buffer = buffer_res.value;

    auto mem_reqs = m_device.getBufferMemoryRequirements(m_buffer);
    auto memory_type = m_context->find_memory_type(
        mem_reqs.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eDeviceLocal
    );
    if (!memory_type) {
        destroy_buffer();
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_reqs.size)
        .setMemoryTypeIndex(*memory_type);

    auto memory_res = m_device.allocateMemory(alloc_info);
    if (memory_res.result != vk::Result::eSuccess) {
        destroy_buffer();
        return std::unexpected(fmt::format("Failed to allocate vertex memory: {}", vk::to_string(memory_res.result)));
    }
    m_memory = memory_res.value;

    auto bind_res = m_device.bindBufferMemory(m_buffer, m_memory, 0);
    if (bind_res != vk::Result::eSuccess) {
        destroy_buffer();
        return std::unexpected(fmt::format("Failed to bind vertex memory: {}", vk::to_string(bind_res)));
    }

    return {};
}

std::expected<void, std::string> GpuPointBuffer::upload(
    vk::CommandPool cmd_pool,
    vk::Queue queue,
    const PointBuffer& points
) {
    auto vertices = interleave(points);

    StagingBuffer staging(m_device);

    auto staging_info = vk::BufferCreateInfo()
        .setSize(m_buffer_size)
        .setUsage(vk::BufferUsageFlagBits::eTransferSrc)
        .setSharingMode(vk::SharingMode::eExclusive);

    auto staging_res = m_device.createBuffer(staging_info);
    GALAXY_CHECK_VK_RESULT(staging_res, "Failed to create staging buffer: {}");
    staging.buffer = staging_res.value;

    auto staging_reqs = m_device.getBufferMemoryRequirements(staging.buffer);
    auto memory_type = m_context->find_memory_type(
        staging_reqs.memoryTypeBits,
        vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
    );
    if (!memory_type) {
        return std::unexpected(memory_type.error());
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(staging_reqs.size)
        .setMemoryTypeIndex(*memory_type);

    auto memory_res = m_device.allocateMemory(alloc_info);
    GALAXY_CHECK_VK_RESULT(memory_res, "Failed to allocate staging memory: {}");
    staging.memory = memory_res.value;

    auto bind_res = m_device.bindBufferMemory(staging.buffer, staging.memory, 0);
    GALAXY_CHECK_VK_RESULT_VOID(bind_res, "Failed to bind staging memory: {}");

    auto map_res = m_device.mapMemory(staging.memory, 0, m_buffer_size);
    GALAXY_CHECK_VK_RESULT(map_res, "Failed to map staging memory: {}");
    std::memcpy(map_res.value, vertices.data(), m_buffer_size);
    m_device.unmapMemory(staging.memory);

    // One-time transfer command
    auto cmd_alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(cmd_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(1);

    auto cmd_res = m_device.allocateCommandBuffers(cmd_alloc_info);
    GALAXY_CHECK_VK_RESULT(cmd_res, "Failed to allocate transfer command buffer: {}");
    vk::CommandBuffer cmd = cmd_res.value[0];

    bool submitted = false;
    auto submit_and_wait = [&]() -> std::expected<void, std::string> {
        auto begin_res = cmd.begin(vk::CommandBufferBeginInfo()
            .setFlags(vk::CommandBufferUsageFlagBits::eOneTimeSubmit));
        GALAXY_CHECK_VK_RESULT_VOID(begin_res, "Failed to begin transfer command buffer: {}");

        auto copy_region = vk::BufferCopy()
            .setSrcOffset(0)
            .setDstOffset(0)
            .setSize(m_buffer_size);
        cmd.copyBuffer(staging.buffer, m_buffer, copy_region);

        auto end_res = cmd.end();
        GALAXY_CHECK_VK_RESULT_VOID(end_res, "Failed to record transfer command: {}");

        auto submit_info = vk::SubmitInfo().setCommandBuffers(cmd);
        auto submit_res = queue.submit(submit_info);
        GALAXY_CHECK_VK_RESULT_VOID(submit_res, "Failed to submit transfer: {}");
        submitted = true;

        auto wait_res = queue.waitIdle();
        GALAXY_CHECK_VK_RESULT_VOID(wait_res, "Failed to wait for transfer: {}");
        return {};
    };

    auto result = submit_and_wait();
    if (!result && submitted) {
        // The copy may still be reading the staging buffer
        if (auto idle_res = m_device.waitIdle(); idle_res != vk::Result::eSuccess) {
            Logger::instance().error("Transfer did not settle ({}), leaking its buffers",
                vk::to_string(idle_res));
            staging.release();
            m_buffer = nullptr;
            m_memory = nullptr;
            return result;
        }
    }

    m_device.freeCommandBuffers(cmd_pool, cmd);
    return result;
}

void GpuPointBuffer::destroy_buffer() {
    if (m_buffer) {
        m_device.destroyBuffer(m_buffer);
        m_buffer = nullptr;
    }
    if (m_memory) {
        m_device.freeMemory(m_memory);
        m_memory = nullptr;
    }
}

} // namespace galaxy
