#include <galaxy/Window.hpp>
#include <galaxy/Logger.hpp>
#include <algorithm>
#include <array>
#include <stdexcept>

namespace galaxy {

void Window::ensure_glfw_initialized() {
    static bool initialized = false;
    if (!initialized) {
        if (!glfwInit()) {
            throw std::runtime_error("Failed to initialize GLFW");
        }
        initialized = true;
    }
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    int width,
    int height,
    std::string_view title
) {
    std::unique_ptr<Window> window;
    try {
        window = std::unique_ptr<Window>(new Window(context, width, height, title));
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("Window creation failed: {}", e.what()));
    }

    if (auto result = window->initialize(); !result) {
        return std::unexpected(result.error());
    }

    Logger::instance().info("Created window {}x{} with {} swapchain images",
        window->m_extent.width, window->m_extent.height, window->image_count());
    return window;
}

Window::Window(const VulkanContext& context, int width, int height, std::string_view title)
    : m_width(width)
    , m_height(height)
    , m_context(&context)
    , m_device(context.device())
{
    ensure_glfw_initialized();

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    std::string title_str(title);
    m_window_handle = glfwCreateWindow(width, height, title_str.c_str(), nullptr, nullptr);
    if (!m_window_handle) {
        throw std::runtime_error("Failed to create GLFW window");
    }
}

Window::~Window() {
    cleanup();
    if (m_window_handle) {
        glfwDestroyWindow(m_window_handle);
    }
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_window_handle);
}

std::expected<void, std::string> Window::initialize() {
    if (auto result = create_surface(); !result) {
        return result;
    }
    if (auto result = create_swapchain(); !result) {
        return result;
    }
    if (auto result = create_depth_resources(); !result) {
        return result;
    }
    if (auto result = create_render_pass(); !result) {
        return result;
    }
    return create_framebuffers();
}

std::expected<void, std::string> Window::create_surface() {
    VkSurfaceKHR surface_c;
    VkResult result = glfwCreateWindowSurface(
        static_cast<VkInstance>(m_context->instance()),
        m_window_handle,
        nullptr,
        &surface_c
    );

    if (result != VK_SUCCESS) {
        return std::unexpected(fmt::format("Failed to create window surface: {}",
            vk::to_string(static_cast<vk::Result>(result))));
    }

    m_surface = vk::SurfaceKHR(surface_c);
    return {};
}

std::expected<void, std::string> Window::create_swapchain() {
    auto physical_device = m_context->physical_device();

    auto capabilities_res = physical_device.getSurfaceCapabilitiesKHR(m_surface);
    GALAXY_CHECK_VK_RESULT(capabilities_res, "Could not query surface capabilities: {}");
    auto formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    GALAXY_CHECK_VK_RESULT(formats_res, "Could not query surface formats: {}");
    auto modes_res = physical_device.getSurfacePresentModesKHR(m_surface);
    GALAXY_CHECK_VK_RESULT(modes_res, "Could not query present modes: {}");

    if (formats_res.value.empty() || modes_res.value.empty()) {
        return std::unexpected("Inadequate swapchain support");
    }

    const auto& capabilities = capabilities_res.value;
    m_surface_format = choose_surface_format(formats_res.value);
    m_present_mode = choose_present_mode(modes_res.value);
    m_extent = choose_extent(capabilities);

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0) {
        image_count = std::min(image_count, capabilities.maxImageCount);
    }

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    GALAXY_CHECK_VK_RESULT(swapchain_res, "Could not create swapchain: {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    GALAXY_CHECK_VK_RESULT(images_res, "Could not get swapchain images: {}");
    m_swapchain_images = std::move(images_res.value);

    m_image_views.clear();
    for (const auto& image : m_swapchain_images) {
        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_surface_format.format)
            .setSubresourceRange({vk::ImageAspectFlagBits::eColor, 0, 1, 0, 1});
        auto view_res = m_device.createImageView(view_info);
        GALAXY_CHECK_VK_RESULT(view_res, "Could not create swapchain image view: {}");
        m_image_views.push_back(view_res.value);
    }

    return {};
}

std::expected<void, std::string> Window::create_render_pass() {
    auto color_attachment = vk::AttachmentDescription()
        .setFormat(m_surface_format.format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eStore)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::ePresentSrcKHR);

    auto depth_attachment = vk::AttachmentDescription()
        .setFormat(m_depth_format)
        .setSamples(vk::SampleCountFlagBits::e1)
        .setLoadOp(vk::AttachmentLoadOp::eClear)
        .setStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
        .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setFinalLayout(vk::ImageLayout::eDepthStencilAttachmentOptimal);

    vk::AttachmentReference color_ref(0, vk::ImageLayout::eColorAttachmentOptimal);
    vk::AttachmentReference depth_ref(1, vk::ImageLayout::eDepthStencilAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref)
        .setPDepthStencilAttachment(&depth_ref);

    auto stages = vk::PipelineStageFlagBits::eColorAttachmentOutput |
                  vk::PipelineStageFlagBits::eEarlyFragmentTests;
    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(stages)
        .setDstStageMask(stages)
        .setDstAccessMask(
            vk::AccessFlagBits::eColorAttachmentWrite |
            vk::AccessFlagBits::eDepthStencilAttachmentWrite);

    std::array attachments = {color_attachment, depth_attachment};

    auto render_pass_info = vk::RenderPassCreateInfo()
        .setAttachments(attachments)
        .setSubpasses(subpass)
        .setDependencies(dependency);

    auto render_pass_res = m_device.createRenderPass(render_pass_info);
    GALAXY_CHECK_VK_RESULT(render_pass_res, "Could not create render pass: {}");
    m_render_pass = render_pass_res.value;
    return {};
}

std::expected<void, std::string> Window::create_framebuffers() {
    m_framebuffers.clear();
    for (const auto& view : m_image_views) {
        std::array attachments = {view, m_depth_image_view};

        auto framebuffer_info = vk::FramebufferCreateInfo()
            .setRenderPass(m_render_pass)
            .setAttachments(attachments)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1);
        auto framebuffer_res = m_device.createFramebuffer(framebuffer_info);
        GALAXY_CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer: {}");
        m_framebuffers.push_back(framebuffer_res.value);
    }
    return {};
}

std::expected<void, std::string> Window::create_depth_resources() {
    auto format = find_depth_format();
    if (!format) {
        return std::unexpected(format.error());
    }
    m_depth_format = *format;

    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setExtent(vk::Extent3D(m_extent.width, m_extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setFormat(m_depth_format)
        .setTiling(vk::ImageTiling::eOptimal)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setUsage(vk::ImageUsageFlagBits::eDepthStencilAttachment)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setSamples(vk::SampleCountFlagBits::e1);

    auto image_res = m_device.createImage(image_info);
    GALAXY_CHECK_VK_RESULT(image_res, "Could not create depth image: {}");
    m_depth_image = image_res.value;

    auto mem_requirements = m_device.getImageMemoryRequirements(m_depth_image);
    auto memory_type = m_context->find_memory_type(
        mem_requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!memory_type) {
        return std::unexpected(fmt::format("Depth image: {}", memory_type.error()));
    }

    auto alloc_info = vk::MemoryAllocateInfo()
        .setAllocationSize(mem_requirements.size)
        .setMemoryTypeIndex(*memory_type);

    auto memory_res = m_device.allocateMemory(alloc_info);
    GALAXY_CHECK_VK_RESULT(memory_res, "Could not allocate depth memory: {}");
    m_depth_memory = memory_res.value;

    auto bind_res = m_device.bindImageMemory(m_depth_image, m_depth_memory, 0);
    GALAXY_CHECK_VK_RESULT_VOID(bind_res, "Could not bind depth image memory: {}");

    auto view_info = vk::ImageViewCreateInfo()
        .setImage(m_depth_image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(m_depth_format)
        .setSubresourceRange({vk::ImageAspectFlagBits::eDepth, 0, 1, 0, 1});
    auto view_res = m_device.createImageView(view_info);
    GALAXY_CHECK_VK_RESULT(view_res, "Could not create depth image view: {}");
    m_depth_image_view = view_res.value;
    return {};
}

std::expected<vk::Format, std::string> Window::find_depth_format() const {
    for (auto format : {vk::Format::eD32Sfloat, vk::Format::eD32SfloatS8Uint, vk::Format::eD24UnormS8Uint}) {
        auto props = m_context->physical_device().getFormatProperties(format);
        if (props.optimalTilingFeatures & vk::FormatFeatureFlagBits::eDepthStencilAttachment) {
            return format;
        }
    }
    return std::unexpected("No supported depth format");
}

std::optional<uint32_t> Window::acquire_next_image(vk::Semaphore signal_semaphore, uint64_t timeout) {
    if (m_needs_resize) {
        m_needs_resize = false;
        if (auto result = recreate_swapchain(); !result) {
            Logger::instance().error("Failed to recreate swapchain: {}", result.error());
        }
        return std::nullopt;
    }

    auto next_image_res = m_device.acquireNextImageKHR(m_swapchain, timeout, signal_semaphore, nullptr);
    switch (next_image_res.result) {
        case vk::Result::eSuccess:
            return next_image_res.value;
        case vk::Result::eSuboptimalKHR:
            // The semaphore is signaled, so render this frame and recreate after present
            m_needs_resize = true;
            return next_image_res.value;
        case vk::Result::eErrorOutOfDateKHR:
            if (auto result = recreate_swapchain(); !result) {
                Logger::instance().error("Failed to recreate swapchain: {}", result.error());
            }
            return std::nullopt;
        default:
            Logger::instance().error("acquireNextImageKHR error: {}", vk::to_string(next_image_res.result));
            return std::nullopt;
    }
}

bool Window::present(vk::Queue present_queue, vk::Semaphore wait_semaphore, uint32_t image_index) {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    // Out-of-date is a regular outcome here, so go through the C entry point
    auto present_result = static_cast<vk::Result>(VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(present_queue),
        reinterpret_cast<const VkPresentInfoKHR*>(&present_info)));

    if (present_result == vk::Result::eErrorOutOfDateKHR || present_result == vk::Result::eSuboptimalKHR) {
        m_needs_resize = true;
        return false;
    }
    if (present_result != vk::Result::eSuccess) {
        Logger::instance().error("presentKHR error: {}", vk::to_string(present_result));
        return false;
    }
    return true;
}

std::expected<void, std::string> Window::recreate_swapchain() {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_window_handle, &width, &height);

    // Minimized: wait until the window has an area again
    while (width == 0 || height == 0) {
        glfwWaitEvents();
        glfwGetFramebufferSize(m_window_handle, &width, &height);
    }

    m_width = width;
    m_height = height;

    auto idle_res = m_device.waitIdle();
    GALAXY_CHECK_VK_RESULT_VOID(idle_res, "waitIdle before swapchain recreation failed: {}");

    cleanup_swapchain();

    if (auto result = create_swapchain(); !result) {
        return result;
    }
    if (auto result = create_depth_resources(); !result) {
        return result;
    }
    if (auto result = create_framebuffers(); !result) {
        return result;
    }

    Logger::instance().info("Swapchain recreated: {}x{}", m_extent.width, m_extent.height);
    return {};
}

void Window::cleanup_swapchain() {
    for (auto& fb : m_framebuffers) {
        m_device.destroyFramebuffer(fb);
    }
    m_framebuffers.clear();

    if (m_depth_image_view) {
        m_device.destroyImageView(m_depth_image_view);
        m_depth_image_view = nullptr;
    }
    if (m_depth_image) {
        m_device.destroyImage(m_depth_image);
        m_depth_image = nullptr;
    }
    if (m_depth_memory) {
        m_device.freeMemory(m_depth_memory);
        m_depth_memory = nullptr;
    }

    for (auto& view : m_image_views) {
        m_device.destroyImageView(view);
    }
    m_image_views.clear();
    m_swapchain_images.clear();

    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

void Window::cleanup() {
    if (!m_device) {
        return;
    }

    cleanup_swapchain();

    if (m_render_pass) {
        m_device.destroyRenderPass(m_render_pass);
        m_render_pass = nullptr;
    }
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
        m_surface = nullptr;
    }
}

vk::SurfaceFormatKHR Window::choose_surface_format(
    const std::vector<vk::SurfaceFormatKHR>& available_formats
) const {
    auto it = std::ranges::find_if(available_formats, [](const vk::SurfaceFormatKHR& format) {
        return format.format == vk::Format::eB8G8R8A8Srgb &&
               format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear;
    });
    return it != available_formats.end() ? *it : available_formats.front();
}

vk::PresentModeKHR Window::choose_present_mode(
    const std::vector<vk::PresentModeKHR>& available_modes
) const {
    if (std::ranges::find(available_modes, vk::PresentModeKHR::eMailbox) != available_modes.end()) {
        return vk::PresentModeKHR::eMailbox;
    }
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D Window::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const {
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }

    return vk::Extent2D{
        std::clamp(static_cast<uint32_t>(m_width),
            capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(m_height),
            capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    };
}

} // namespace galaxy
