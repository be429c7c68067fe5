#include <galaxy/GalaxyController.hpp>
#include <galaxy/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <glm/gtc/type_ptr.hpp>

namespace galaxy {

// GLFW callback wrappers
void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, [[maybe_unused]] int mods) {
    auto* controller = static_cast<GalaxyController*>(glfwGetWindowUserPointer(window));
    if (!controller || button != GLFW_MOUSE_BUTTON_LEFT) return;

    if (action == GLFW_PRESS) {
        // Clicks on the panel belong to ImGui
        if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse) return;
        controller->m_dragging = true;
        glfwGetCursorPos(window, &controller->m_last_mouse_x, &controller->m_last_mouse_y);
    } else if (action == GLFW_RELEASE) {
        controller->m_dragging = false;
    }
}

void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos) {
    auto* controller = static_cast<GalaxyController*>(glfwGetWindowUserPointer(window));
    if (!controller || !controller->m_camera || !controller->m_dragging) return;

    double xoffset = xpos - controller->m_last_mouse_x;
    double yoffset = ypos - controller->m_last_mouse_y;
    controller->m_last_mouse_x = xpos;
    controller->m_last_mouse_y = ypos;

    controller->m_camera->handle_mouse_movement(xoffset, yoffset);
}

void glfw_scroll_callback(GLFWwindow* window, [[maybe_unused]] double xoffset, double yoffset) {
    auto* controller = static_cast<GalaxyController*>(glfwGetWindowUserPointer(window));
    if (!controller || !controller->m_camera) return;
    if (ImGui::GetCurrentContext() && ImGui::GetIO().WantCaptureMouse) return;

    controller->m_camera->handle_mouse_scroll(yoffset);
}

void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    auto* controller = static_cast<GalaxyController*>(glfwGetWindowUserPointer(window));
    if (!controller) return;

    controller->m_window->mark_resize_needed();
    if (controller->m_camera && width > 0 && height > 0) {
        controller->m_camera->handle_resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }
}

GalaxyController::GalaxyController(const ViewerConfig& config)
    : m_config(config)
    , m_imgui_descriptor_pool(nullptr)
{}

GalaxyController::~GalaxyController() {
    cleanup();
}

std::expected<std::unique_ptr<GalaxyController>, std::string> GalaxyController::create(const ViewerConfig& config) {
    auto controller = std::unique_ptr<GalaxyController>(new GalaxyController(config));

    if (auto result = controller->initialize(); !result) {
        return std::unexpected(result.error());
    }

    return controller;
}

std::expected<void, std::string> GalaxyController::initialize() {
    Logger::instance().info("Initializing Galaxy Controller...");

    try {
        Window::ensure_glfw_initialized();
        m_context = std::make_unique<VulkanContext>(m_config.window_title);
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Failed to create Vulkan context: {}", e.what()));
    }

    auto window_result = Window::create(
        *m_context,
        static_cast<int>(m_config.window_width),
        static_cast<int>(m_config.window_height),
        m_config.window_title
    );
    if (!window_result) {
        return std::unexpected(fmt::format("Failed to create window: {}", window_result.error()));
    }
    m_window = std::move(*window_result);

    auto renderer_result = PointsRenderer::create(*m_context, m_window->render_pass(), m_window->image_count());
    if (!renderer_result) {
        return std::unexpected(fmt::format("Failed to create renderer: {}", renderer_result.error()));
    }
    m_renderer = std::move(*renderer_result);

    auto factory_result = PointCloudFactory::create(*m_context);
    if (!factory_result) {
        return std::unexpected(fmt::format("Failed to create drawable factory: {}", factory_result.error()));
    }
    m_factory = std::move(*factory_result);

    m_model = std::make_unique<GalaxyModel>(
        *m_factory,
        m_scene,
        std::make_unique<DefaultRandomSource>(m_config.seed),
        m_config.parameters
    );
    m_ui_callbacks = m_model->get_ui_callbacks();

    auto extent = m_window->extent();
    m_camera = std::make_unique<Camera3D>(extent.width, extent.height);

    // Installed before ImGui so its GLFW backend chains to them
    GLFWwindow* handle = m_window->get_window_handle();
    glfwSetWindowUserPointer(handle, this);
    glfwSetMouseButtonCallback(handle, glfw_mouse_button_callback);
    glfwSetCursorPosCallback(handle, glfw_cursor_callback);
    glfwSetScrollCallback(handle, glfw_scroll_callback);
    glfwSetFramebufferSizeCallback(handle, glfw_framebuffer_size_callback);

    if (auto result = setup_imgui(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Galaxy Controller initialized successfully");
    return {};
}

std::expected<void, std::string> GalaxyController::setup_imgui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    std::vector<vk::DescriptorPoolSize> pool_sizes = {
        {vk::DescriptorType::eSampler, 100},
        {vk::DescriptorType::eCombinedImageSampler, 100},
        {vk::DescriptorType::eSampledImage, 100},
        {vk::DescriptorType::eUniformBuffer, 100},
        {vk::DescriptorType::eStorageBuffer, 100}
    };

    auto imgui_pool_info = vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(100)
        .setPoolSizes(pool_sizes);

    auto pool_res = m_context->device().createDescriptorPool(imgui_pool_info);
    if (pool_res.result != vk::Result::eSuccess) {
        ImGui::DestroyContext();
        return std::unexpected(fmt::format("Failed to create ImGui descriptor pool: {}", vk::to_string(pool_res.result)));
    }
    m_imgui_descriptor_pool = pool_res.value;

    ImGui_ImplGlfw_InitForVulkan(m_window->get_window_handle(), true);

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(m_context->instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(m_context->physical_device());
    init_info.Device = static_cast<VkDevice>(m_context->device());
    init_info.QueueFamily = m_context->queue_indices().graphics;
    init_info.Queue = static_cast<VkQueue>(m_context->graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_imgui_descriptor_pool);
    init_info.MinImageCount = 2;
    init_info.ImageCount = m_window->image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(m_window->render_pass());
    init_info.Allocator = nullptr;
    init_info.CheckVkResultFn = nullptr;

    // Unwinds a partial setup so cleanup() does not shut down backends that never started
    auto abort_setup = [this](bool vulkan_backend, const char* message) -> std::unexpected<std::string> {
        if (vulkan_backend) {
            ImGui_ImplVulkan_Shutdown();
        }
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        m_context->device().destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
        return std::unexpected(std::string(message));
    };

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        return abort_setup(false, "Failed to initialize ImGui Vulkan backend");
    }
    if (!ImGui_ImplVulkan_CreateFontsTexture()) {
        return abort_setup(true, "Failed to upload ImGui font texture");
    }

    return {};
}

void GalaxyController::render_ui_callbacks(const std::vector<UICallback>& callbacks) {
    for (const auto& callback : callbacks) {
        switch (callback.get_callback_type()) {
            case CallbackType::Continuous: {
                if (auto* cb = callback.as_continuous()) {
                    float value = cb->getter();
                    if (ImGui::SliderFloat(callback.field_name.c_str(), &value, cb->min, cb->max, "%.3f")) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Discrete: {
                if (auto* cb = callback.as_discrete()) {
                    int value = cb->getter();
                    if (ImGui::SliderInt(callback.field_name.c_str(), &value, cb->min, cb->max)) {
                        cb->setter(value);
                    }
                }
                break;
            }
            case CallbackType::Color: {
                if (auto* cb = callback.as_color()) {
                    Color value = cb->getter();
                    if (ImGui::ColorEdit3(callback.field_name.c_str(), glm::value_ptr(value))) {
                        cb->setter(value);
                    }
                }
                break;
            }
        }

        // Regenerate once the interaction with this widget ends
        if (ImGui::IsItemDeactivatedAfterEdit()) {
            callback.commit();
        }
    }
}

void GalaxyController::render_ui() {
    ImGui::Begin("Galaxy");

    render_ui_callbacks(m_ui_callbacks);

    ImGui::Separator();
    if (ImGui::Button("Regenerate")) {
        if (auto result = m_model->regenerate(); !result) {
            Logger::instance().error("{}", result.error());
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset Camera")) {
        m_camera->reset();
    }

    ImGui::Separator();
    if (auto* drawable = m_model->displayed()) {
        ImGui::Text("%s: %u", drawable->name().data(), drawable->point_count());
    } else {
        ImGui::TextDisabled("No galaxy displayed");
    }
    ImGui::Text("Generation: %llu", static_cast<unsigned long long>(m_model->generation()));
    ImGui::Text("Drag: orbit  Scroll: zoom");
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);
    ImGui::End();
}

std::expected<void, std::string> GalaxyController::draw_frame() {
    auto image_available = m_renderer->begin_frame(m_current_frame);
    if (!image_available) {
        return std::unexpected(image_available.error());
    }

    auto acquire_result = m_window->acquire_next_image(*image_available);
    if (!acquire_result) {
        // Swapchain was recreated, per-image resources follow
        return m_renderer->handle_swapchain_recreation(m_window->image_count());
    }
    uint32_t image_index = *acquire_result;

    FrameRenderInfo render_info{
        .image_index = image_index,
        .current_frame = m_current_frame,
        .image_available_semaphore = *image_available,
        .framebuffer = m_window->get_framebuffer(image_index),
        .extent = m_window->extent(),
        .render_pass = m_window->render_pass(),
        .clear_values = {
            vk::ClearColorValue(std::array<float, 4>{0.0f, 0.0f, 0.0f, 1.0f}),
            vk::ClearDepthStencilValue(1.0f, 0)
        },
        .scene = m_scene,
        .camera = *m_camera,
        .imgui_draw_data = ImGui::GetDrawData()
    };

    auto render_finished = m_renderer->render_frame(render_info, m_context->graphics_queue());
    if (!render_finished) {
        return std::unexpected(render_finished.error());
    }

    // A failed present marks the swapchain for recreation on the next acquire
    if (!m_window->present(m_context->graphics_queue(), *render_finished, image_index)) {
        Logger::instance().debug("Present reported a stale swapchain");
    }

    m_current_frame = (m_current_frame + 1) % PointsRenderer::MAX_FRAMES_IN_FLIGHT;
    return {};
}

std::expected<void, std::string> GalaxyController::run() {
    if (auto result = m_model->regenerate(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Starting main loop...");

    std::expected<void, std::string> status;
    while (!m_window->should_close()) {
        glfwPollEvents();

        m_camera->update();

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        render_ui();
        ImGui::Render();

        if (status = draw_frame(); !status) {
            break;
        }
    }

    auto idle_res = m_context->device().waitIdle();
    GALAXY_CHECK_VK_RESULT_VOID(idle_res, "Failed to wait for device idle: {}");

    Logger::instance().info("Shutdown complete");
    return status;
}

void GalaxyController::cleanup() {
    if (m_context && m_context->device()) {
        if (auto result = m_context->device().waitIdle(); result != vk::Result::eSuccess) {
            Logger::instance().error("waitIdle during shutdown failed: {}", vk::to_string(result));
        }
    }

    if (m_imgui_descriptor_pool) {
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();

        m_context->device().destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
    }

    // Release the galaxy before the factory and device it was built with
    m_model.reset();
}

} // namespace galaxy
