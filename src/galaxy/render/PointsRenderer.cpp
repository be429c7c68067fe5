#include <galaxy/render/PointsRenderer.hpp>
#include <galaxy/render/PointCloud.hpp>
#include <galaxy/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_vulkan.h>
#include <cstring>

namespace galaxy {

namespace {

// View parameter structure matching shader layout
struct alignas(16) ViewShaderParams {
    glm::mat4 view_projection;
    glm::vec2 screen_size;
    float max_point_size;
    float padding;
};

// Per-drawable material, matches PointParams in points.vert.slang
struct PointPushConstants {
    float size;
    uint32_t size_attenuation;
    uint32_t vertex_colors;
    float padding;
};
static_assert(sizeof(PointPushConstants) == 16);

constexpr const char* VERTEX_SHADER = "points/points.vert.slang";
constexpr const char* FRAGMENT_SHADER = "points/points.frag.slang";

} // anonymous namespace

PointsRenderer::PointsRenderer(const VulkanContext& context, vk::RenderPass render_pass)
    : m_context(&context)
    , m_device(context.device())
    , m_render_pass(render_pass)
    , m_descriptor_layout(nullptr)
    , m_pipeline_layout(nullptr)
    , m_descriptor_pool(nullptr)
    , m_graphics_command_pool(nullptr)
{}

std::expected<std::unique_ptr<PointsRenderer>, std::string> PointsRenderer::create(
    const VulkanContext& context,
    vk::RenderPass render_pass,
    uint32_t image_count
) {
    auto renderer = std::unique_ptr<PointsRenderer>(new PointsRenderer(context, render_pass));

    if (auto result = renderer->initialize(image_count); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created PointsRenderer");
    return renderer;
}

PointsRenderer::~PointsRenderer() {
    cleanup();
}

std::expected<void, std::string> PointsRenderer::initialize(uint32_t image_count) {
    auto vert_result = Shader::create_shader(m_device, VERTEX_SHADER, "main");
    if (!vert_result) {
        return std::unexpected(fmt::format("Failed to load vertex shader: {}", vert_result.error()));
    }
    m_vertex_shader = std::make_unique<Shader>(std::move(*vert_result));

    auto frag_result = Shader::create_shader(m_device, FRAGMENT_SHADER, "main");
    if (!frag_result) {
        return std::unexpected(fmt::format("Failed to load fragment shader: {}", frag_result.error()));
    }
    m_fragment_shader = std::make_unique<Shader>(std::move(*frag_result));

    if (!m_vertex_shader->get_details().matches(m_fragment_shader->get_details())) {
        return std::unexpected("Point vertex outputs do not match fragment inputs");
    }

    if (auto result = create_descriptor_layout(); !result) {
        return result;
    }
    if (auto result = create_pipelines(); !result) {
        return result;
    }
    if (auto result = create_view_buffers(); !result) {
        return result;
    }
    if (auto result = create_frame_sync(); !result) {
        return result;
    }

    // Command buffers and render-finished semaphores depend on the image count
    return handle_swapchain_recreation(image_count);
}

std::expected<void, std::string> PointsRenderer::create_descriptor_layout() {
    std::vector<vk::DescriptorSetLayoutBinding> bindings;
    for (const auto& desc : m_vertex_shader->get_descriptor_infos()) {
        bindings.push_back(vk::DescriptorSetLayoutBinding()
            .setBinding(static_cast<uint32_t>(desc.binding))
            .setDescriptorType(desc.type)
            .setDescriptorCount(static_cast<uint32_t>(desc.descriptor_count))
            .setStageFlags(vk::ShaderStageFlagBits::eVertex)
        );
    }

    if (bindings.size() != 1 || bindings[0].descriptorType != vk::DescriptorType::eUniformBuffer) {
        return std::unexpected(fmt::format(
            "Point vertex shader must declare exactly one uniform buffer, found {} descriptors", bindings.size()));
    }

    auto layout_info = vk::DescriptorSetLayoutCreateInfo()
        .setBindings(bindings);

    auto layout_res = m_device.createDescriptorSetLayout(layout_info);
    GALAXY_CHECK_VK_RESULT(layout_res, "Failed to create descriptor layout: {}");
    m_descriptor_layout = layout_res.value;
    return {};
}

std::expected<void, std::string> PointsRenderer::create_pipelines() {
    const auto& push_constant = m_vertex_shader->get_push_constant_info();
    if (!push_constant) {
        return std::unexpected("Point vertex shader declares no push constants");
    }
    if (push_constant->size != sizeof(PointPushConstants)) {
        return std::unexpected(fmt::format("Push constant size mismatch: shader {} bytes, host {} bytes",
            push_constant->size, sizeof(PointPushConstants)));
    }

    auto push_range = vk::PushConstantRange()
        .setStageFlags(vk::ShaderStageFlagBits::eVertex)
        .setOffset(0)
        .setSize(sizeof(PointPushConstants));

    auto pipeline_layout_info = vk::PipelineLayoutCreateInfo()
        .setSetLayouts(m_descriptor_layout)
        .setPushConstantRanges(push_range);

    auto layout_res = m_device.createPipelineLayout(pipeline_layout_info);
    GALAXY_CHECK_VK_RESULT(layout_res, "Failed to create pipeline layout: {}");
    m_pipeline_layout = layout_res.value;

    for (bool additive : {false, true}) {
        for (bool depth_write : {false, true}) {
            auto pipeline = create_pipeline(additive, depth_write);
            if (!pipeline) {
                return std::unexpected(pipeline.error());
            }
            m_pipelines[pipeline_index(PointMaterial{.additive_blending = additive, .depth_write = depth_write})] =
                *pipeline;
        }
    }

    Logger::instance().debug("Created {} point pipelines", m_pipelines.size());
    return {};
}

std::expected<vk::Pipeline, std::string> PointsRenderer::create_pipeline(bool additive_blending, bool depth_write) {
    std::vector<vk::PipelineShaderStageCreateInfo> shader_stages = {
        m_vertex_shader->create_pipeline_shader_stage_create_info(),
        m_fragment_shader->create_pipeline_shader_stage_create_info()
    };

    // Vertex input from reflection: one interleaved binding of PointVertex
    const auto& vertex_details = std::get<VertexDetails>(m_vertex_shader->get_details());
    if (vertex_details.bindings.size() != 1 || vertex_details.bindings[0].stride != sizeof(PointVertex)) {
        return std::unexpected("Point vertex shader input does not match PointVertex layout");
    }

    std::vector<vk::VertexInputBindingDescription> binding_descriptions;
    for (const auto& binding : vertex_details.bindings) {
        binding_descriptions.push_back(binding.to_binding_description());
    }
    std::vector<vk::VertexInputAttributeDescription> attribute_descriptions;
    for (const auto& input : vertex_details.inputs) {
        attribute_descriptions.push_back(input.to_attribute_description());
    }

    auto vertex_input_info = vk::PipelineVertexInputStateCreateInfo()
        .setVertexBindingDescriptions(binding_descriptions)
        .setVertexAttributeDescriptions(attribute_descriptions);

    auto input_assembly = vk::PipelineInputAssemblyStateCreateInfo()
        .setTopology(vk::PrimitiveTopology::ePointList)
        .setPrimitiveRestartEnable(false);

    // Viewport and scissor (dynamic)
    auto viewport_state = vk::PipelineViewportStateCreateInfo()
        .setViewportCount(1)
        .setScissorCount(1);

    auto rasterizer = vk::PipelineRasterizationStateCreateInfo()
        .setDepthClampEnable(false)
        .setRasterizerDiscardEnable(false)
        .setPolygonMode(vk::PolygonMode::eFill)
        .setLineWidth(1.0f)
        .setCullMode(vk::CullModeFlagBits::eNone)
        .setFrontFace(vk::FrontFace::eCounterClockwise)
        .setDepthBiasEnable(false);

    auto multisampling = vk::PipelineMultisampleStateCreateInfo()
        .setSampleShadingEnable(false)
        .setRasterizationSamples(vk::SampleCountFlagBits::e1);

    // Additive: src * alpha + dst, otherwise regular alpha blending
    auto color_blend_attachment = vk::PipelineColorBlendAttachmentState()
        .setColorWriteMask(vk::ColorComponentFlagBits::eR |
                          vk::ColorComponentFlagBits::eG |
                          vk::ColorComponentFlagBits::eB |
                          vk::ColorComponentFlagBits::eA)
        .setBlendEnable(true)
        .setSrcColorBlendFactor(vk::BlendFactor::eSrcAlpha)
        .setDstColorBlendFactor(additive_blending ? vk::BlendFactor::eOne : vk::BlendFactor::eOneMinusSrcAlpha)
        .setColorBlendOp(vk::BlendOp::eAdd)
        .setSrcAlphaBlendFactor(vk::BlendFactor::eOne)
        .setDstAlphaBlendFactor(additive_blending ? vk::BlendFactor::eOne : vk::BlendFactor::eZero)
        .setAlphaBlendOp(vk::BlendOp::eAdd);

    auto color_blending = vk::PipelineColorBlendStateCreateInfo()
        .setLogicOpEnable(false)
        .setAttachments(color_blend_attachment);

    // Depth test stays on; only the write is material-controlled
    auto depth_stencil = vk::PipelineDepthStencilStateCreateInfo()
        .setDepthTestEnable(true)
        .setDepthWriteEnable(depth_write)
        .setDepthCompareOp(vk::CompareOp::eLess)
        .setDepthBoundsTestEnable(false)
        .setStencilTestEnable(false);

    std::vector<vk::DynamicState> dynamic_states = {
        vk::DynamicState::eViewport,
        vk::DynamicState::eScissor
    };

    auto dynamic_state = vk::PipelineDynamicStateCreateInfo()
        .setDynamicStates(dynamic_states);

    auto pipeline_info = vk::GraphicsPipelineCreateInfo()
        .setStages(shader_stages)
        .setPVertexInputState(&vertex_input_info)
        .setPInputAssemblyState(&input_assembly)
        .setPViewportState(&viewport_state)
        .setPRasterizationState(&rasterizer)
        .setPMultisampleState(&multisampling)
        .setPDepthStencilState(&depth_stencil)
        .setPColorBlendState(&color_blending)
        .setPDynamicState(&dynamic_state)
        .setLayout(m_pipeline_layout)
        .setRenderPass(m_render_pass)
        .setSubpass(0);

    auto pipeline_res = m_device.createGraphicsPipeline(nullptr, pipeline_info);
    GALAXY_CHECK_VK_RESULT(pipeline_res, "Failed to create graphics pipeline: {}");

    Logger::instance().trace("Created point pipeline (additive={}, depth_write={})", additive_blending, depth_write);
    return pipeline_res.value;
}

std::expected<void, std::string> PointsRenderer::create_view_buffers() {
    auto pool_size = vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, MAX_FRAMES_IN_FLIGHT);
    auto pool_info = vk::DescriptorPoolCreateInfo()
        .setMaxSets(MAX_FRAMES_IN_FLIGHT)
        .setPoolSizes(pool_size);

    auto pool_res = m_device.createDescriptorPool(pool_info);
    GALAXY_CHECK_VK_RESULT(pool_res, "Failed to create descriptor pool: {}");
    m_descriptor_pool = pool_res.value;

    std::array<vk::DescriptorSetLayout, MAX_FRAMES_IN_FLIGHT> layouts;
    layouts.fill(m_descriptor_layout);
    auto set_alloc_info = vk::DescriptorSetAllocateInfo()
        .setDescriptorPool(m_descriptor_pool)
        .setSetLayouts(layouts);

    auto sets_res = m_device.allocateDescriptorSets(set_alloc_info);
    GALAXY_CHECK_VK_RESULT(sets_res, "Failed to allocate descriptor sets: {}");

    uint32_t view_binding = static_cast<uint32_t>(m_vertex_shader->get_descriptor_infos()[0].binding);

    for (uint32_t frame = 0; frame < MAX_FRAMES_IN_FLIGHT; frame++) {
        m_descriptor_sets[frame] = sets_res.value[frame];

        auto buffer_info = vk::BufferCreateInfo()
            .setSize(sizeof(ViewShaderParams))
            .setUsage(vk::BufferUsageFlagBits::eUniformBuffer)
            .setSharingMode(vk::SharingMode::eExclusive);

        auto buffer_res = m_device.createBuffer(buffer_info);
        GALAXY_CHECK_VK_RESULT(buffer_res, "Failed to create view buffer: {}");
        m_view_buffers[frame] = buffer_res.value;

        auto mem_reqs = m_device.getBufferMemoryRequirements(m_view_buffers[frame]);
        auto memory_type = m_context->find_memory_type(
            mem_reqs.memoryTypeBits,
            vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent
        );
        if (!memory_type) {
            return std::unexpected(fmt::format("View buffer: {}", memory_type.error()));
        }

        auto alloc_info = vk::MemoryAllocateInfo()
            .setAllocationSize(mem_reqs.size)
            .setMemoryTypeIndex(*memory_type);

        auto memory_res = m_device.allocateMemory(alloc_info);
        GALAXY_CHECK_VK_RESULT(memory_res, "Failed to allocate view memory: {}");
        m_view_memories[frame] = memory_res.value;

        auto bind_res = m_device.bindBufferMemory(m_view_buffers[frame], m_view_memories[frame], 0);
        GALAXY_CHECK_VK_RESULT_VOID(bind_res, "Failed to bind view memory: {}");

        // Persistently mapped, host-coherent
        auto map_res = m_device.mapMemory(m_view_memories[frame], 0, sizeof(ViewShaderParams));
        GALAXY_CHECK_VK_RESULT(map_res, "Failed to map view memory: {}");
        m_view_mapped[frame] = map_res.value;

        auto view_buffer_info = vk::DescriptorBufferInfo()
            .setBuffer(m_view_buffers[frame])
            .setOffset(0)
            .setRange(sizeof(ViewShaderParams));

        auto write = vk::WriteDescriptorSet()
            .setDstSet(m_descriptor_sets[frame])
            .setDstBinding(view_binding)
            .setDstArrayElement(0)
            .setDescriptorType(vk::DescriptorType::eUniformBuffer)
            .setDescriptorCount(1)
            .setBufferInfo(view_buffer_info);

        m_device.updateDescriptorSets(write, {});
    }

    return {};
}

std::expected<void, std::string> PointsRenderer::create_frame_sync() {
    auto cmd_pool_info = vk::CommandPoolCreateInfo()
        .setQueueFamilyIndex(m_context->queue_indices().graphics)
        .setFlags(vk::CommandPoolCreateFlagBits::eResetCommandBuffer);

    auto pool_res = m_device.createCommandPool(cmd_pool_info);
    GALAXY_CHECK_VK_RESULT(pool_res, "Failed to create graphics command pool: {}");
    m_graphics_command_pool = pool_res.value;

    for (uint32_t i = 0; i < MAX_FRAMES_IN_FLIGHT; i++) {
        // Start signaled so the first begin_frame() does not block
        auto fence_res = m_device.createFence(vk::FenceCreateInfo().setFlags(vk::FenceCreateFlagBits::eSignaled));
        GALAXY_CHECK_VK_RESULT(fence_res, "Failed to create in-flight fence: {}");
        m_in_flight_fences.push_back(fence_res.value);

        auto sem_res = m_device.createSemaphore({});
        GALAXY_CHECK_VK_RESULT(sem_res, "Failed to create image available semaphore: {}");
        m_image_available_semaphores.push_back(sem_res.value);
    }

    return {};
}

void PointsRenderer::cleanup() {
    if (!m_in_flight_fences.empty()) {
        if (auto result = m_device.waitForFences(m_in_flight_fences, true, UINT64_MAX);
            result != vk::Result::eSuccess) {
            Logger::instance().error("Waiting for in-flight frames failed: {}", vk::to_string(result));
        }
    }

    for (auto& fence : m_in_flight_fences) {
        m_device.destroyFence(fence);
    }
    m_in_flight_fences.clear();

    for (auto& sem : m_image_available_semaphores) {
        m_device.destroySemaphore(sem);
    }
    m_image_available_semaphores.clear();

    for (auto& sem : m_render_finished_semaphores) {
        m_device.destroySemaphore(sem);
    }
    m_render_finished_semaphores.clear();

    if (m_graphics_command_pool) {
        // Command buffers are freed with the pool
        m_device.destroyCommandPool(m_graphics_command_pool);
        m_graphics_command_pool = nullptr;
        m_command_buffers.clear();
    }
    m_images_in_flight.clear();

    if (m_descriptor_pool) {
        m_device.destroyDescriptorPool(m_descriptor_pool);
        m_descriptor_pool = nullptr;
    }
    for (auto& pipeline : m_pipelines) {
        if (pipeline) {
            m_device.destroyPipeline(pipeline);
            pipeline = nullptr;
        }
    }
    if (m_pipeline_layout) {
        m_device.destroyPipelineLayout(m_pipeline_layout);
        m_pipeline_layout = nullptr;
    }
    if (m_descriptor_layout) {
        m_device.destroyDescriptorSetLayout(m_descriptor_layout);
        m_descriptor_layout = nullptr;
    }
    for (uint32_t frame = 0; frame < MAX_FRAMES_IN_FLIGHT; frame++) {
        if (m_view_buffers[frame]) {
            m_device.destroyBuffer(m_view_buffers[frame]);
            m_view_buffers[frame] = nullptr;
        }
        if (m_view_memories[frame]) {
            // Freeing implicitly unmaps
            m_device.freeMemory(m_view_memories[frame]);
            m_view_memories[frame] = nullptr;
            m_view_mapped[frame] = nullptr;
        }
    }
}

std::expected<void, std::string> PointsRenderer::handle_swapchain_recreation(uint32_t new_image_count) {
    auto idle_res = m_device.waitIdle();
    GALAXY_CHECK_VK_RESULT_VOID(idle_res, "Failed to wait for device idle: {}");

    for (auto& sem : m_render_finished_semaphores) {
        m_device.destroySemaphore(sem);
    }
    m_render_finished_semaphores.clear();

    if (!m_command_buffers.empty()) {
        m_device.freeCommandBuffers(m_graphics_command_pool, m_command_buffers);
        m_command_buffers.clear();
    }

    m_render_finished_semaphores.reserve(new_image_count);
    for (uint32_t i = 0; i < new_image_count; i++) {
        auto sem_res = m_device.createSemaphore({});
        GALAXY_CHECK_VK_RESULT(sem_res, "Failed to create render finished semaphore: {}");
        m_render_finished_semaphores.push_back(sem_res.value);
    }

    auto cmd_alloc_info = vk::CommandBufferAllocateInfo()
        .setCommandPool(m_graphics_command_pool)
        .setLevel(vk::CommandBufferLevel::ePrimary)
        .setCommandBufferCount(new_image_count);

    auto cmd_res = m_device.allocateCommandBuffers(cmd_alloc_info);
    GALAXY_CHECK_VK_RESULT(cmd_res, "Failed to allocate command buffers: {}");
    m_command_buffers = std::move(cmd_res.value);

    m_images_in_flight.assign(new_image_count, nullptr);

    Logger::instance().info("Renderer swapchain resources recreated for {} images", new_image_count);
    return {};
}

std::expected<vk::Semaphore, std::string> PointsRenderer::begin_frame(uint32_t current_frame) {
    auto wait_res = m_device.waitForFences(m_in_flight_fences[current_frame], true, UINT64_MAX);
    GALAXY_CHECK_VK_RESULT_VOID(wait_res, "Failed to wait for in-flight fence: {}");
    return m_image_available_semaphores[current_frame];
}

void PointsRenderer::record_points(vk::CommandBuffer cmd, const FrameRenderInfo& info) {
    ViewShaderParams view_params{
        .view_projection = info.camera.view_projection_matrix(),
        .screen_size = glm::vec2(info.extent.width, info.extent.height),
        .max_point_size = m_context->max_point_size(),
        .padding = 0.0f
    };
    std::memcpy(m_view_mapped[info.current_frame], &view_params, sizeof(ViewShaderParams));

    // Negative height flips Y to match glm's clip space
    auto viewport = vk::Viewport()
        .setX(0.0f)
        .setY(static_cast<float>(info.extent.height))
        .setWidth(static_cast<float>(info.extent.width))
        .setHeight(-static_cast<float>(info.extent.height))
        .setMinDepth(0.0f)
        .setMaxDepth(1.0f);

    auto scissor = vk::Rect2D()
        .setOffset({0, 0})
        .setExtent(info.extent);

    cmd.setViewport(0, viewport);
    cmd.setScissor(0, scissor);

    cmd.bindDescriptorSets(
        vk::PipelineBindPoint::eGraphics,
        m_pipeline_layout,
        0,
        m_descriptor_sets[info.current_frame],
        {}
    );

    for (const Drawable* drawable : info.scene.drawables()) {
        const auto* cloud = dynamic_cast<const PointCloud*>(drawable);
        if (!cloud) {
            Logger::instance().warn("Skipping drawable '{}': not a point cloud", drawable->name());
            continue;
        }
        const auto& gpu = cloud->gpu_buffer();
        if (gpu.vertex_count() == 0) {
            continue;
        }

        const auto& material = cloud->material();
        PointPushConstants push{
            .size = material.size,
            .size_attenuation = material.size_attenuation ? 1u : 0u,
            .vertex_colors = material.vertex_colors ? 1u : 0u,
            .padding = 0.0f
        };

        cmd.bindPipeline(vk::PipelineBindPoint::eGraphics, m_pipelines[pipeline_index(material)]);
        cmd.pushConstants(m_pipeline_layout, vk::ShaderStageFlagBits::eVertex, 0, sizeof(push), &push);
        cmd.bindVertexBuffers(0, gpu.buffer(), vk::DeviceSize{0});
        cmd.draw(gpu.vertex_count(), 1, 0, 0);
    }
}

std::expected<vk::Semaphore, std::string> PointsRenderer::render_frame(
    const FrameRenderInfo& info,
    vk::Queue graphics_queue
) {
    // If this image is still being used by a previous frame, wait for it
    if (m_images_in_flight[info.image_index]) {
        auto wait_res = m_device.waitForFences(m_images_in_flight[info.image_index], true, UINT64_MAX);
        GALAXY_CHECK_VK_RESULT_VOID(wait_res, "Failed to wait for image fence: {}");
    }
    m_images_in_flight[info.image_index] = m_in_flight_fences[info.current_frame];

    auto reset_fence_res = m_device.resetFences(m_in_flight_fences[info.current_frame]);
    GALAXY_CHECK_VK_RESULT_VOID(reset_fence_res, "Failed to reset in-flight fence: {}");

    auto& cmd = m_command_buffers[info.image_index];
    auto reset_res = cmd.reset();
    GALAXY_CHECK_VK_RESULT_VOID(reset_res, "Failed to reset command buffer: {}");
    auto begin_res = cmd.begin(vk::CommandBufferBeginInfo());
    GALAXY_CHECK_VK_RESULT_VOID(begin_res, "Failed to begin command buffer: {}");

    auto render_pass_begin = vk::RenderPassBeginInfo()
        .setRenderPass(info.render_pass)
        .setFramebuffer(info.framebuffer)
        .setRenderArea(vk::Rect2D({0, 0}, info.extent))
        .setClearValues(info.clear_values);

    cmd.beginRenderPass(render_pass_begin, vk::SubpassContents::eInline);

    record_points(cmd, info);

    if (info.imgui_draw_data) {
        ImGui_ImplVulkan_RenderDrawData(info.imgui_draw_data, static_cast<VkCommandBuffer>(cmd));
    }

    cmd.endRenderPass();
    auto end_res = cmd.end();
    GALAXY_CHECK_VK_RESULT_VOID(end_res, "Failed to record command buffer: {}");

    vk::PipelineStageFlags wait_stage = vk::PipelineStageFlagBits::eColorAttachmentOutput;
    auto submit_info = vk::SubmitInfo()
        .setWaitSemaphores(info.image_available_semaphore)
        .setWaitDstStageMask(wait_stage)
        .setCommandBuffers(cmd)
        .setSignalSemaphores(m_render_finished_semaphores[info.image_index]);

    auto submit_res = graphics_queue.submit(submit_info, m_in_flight_fences[info.current_frame]);
    GALAXY_CHECK_VK_RESULT_VOID(submit_res, "Failed to submit frame: {}");

    return m_render_finished_semaphores[info.image_index];
}

} // namespace galaxy
