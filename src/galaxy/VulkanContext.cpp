#include <galaxy/VulkanContext.hpp>
#include <galaxy/Logger.hpp>
#include <algorithm>
#include <cstring>
#include <optional>
#include <set>
#include <stdexcept>

VULKAN_HPP_DEFAULT_DISPATCH_LOADER_DYNAMIC_STORAGE

namespace galaxy {

namespace {

#ifdef NDEBUG
constexpr bool ENABLE_VALIDATION = false;
#else
constexpr bool ENABLE_VALIDATION = true;
#endif

constexpr std::array VALIDATION_LAYERS = {
    "VK_LAYER_KHRONOS_validation"
};

vk::Bool32 debug_callback(
    vk::DebugUtilsMessageSeverityFlagBitsEXT severity,
    [[maybe_unused]] vk::DebugUtilsMessageTypeFlagsEXT type,
    const vk::DebugUtilsMessengerCallbackDataEXT* callback_data,
    [[maybe_unused]] void* user_data)
{
    auto& logger = Logger::instance();
    logger.set_pattern(fmt::format("[Galaxy]{:<30}[%^%5l%$] %v", "[VulkanDebug]"));
    switch (severity) {
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eVerbose:
            logger.trace("{}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eInfo:
            logger.debug("{}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning:
            logger.warn("{}", callback_data->pMessage);
            break;
        case vk::DebugUtilsMessageSeverityFlagBitsEXT::eError:
            logger.error("{}", callback_data->pMessage);
            break;
        default:
            logger.info("{}", callback_data->pMessage);
            break;
    }
    return vk::False;
}

bool check_validation_layer_support()
{
    auto available_res = vk::enumerateInstanceLayerProperties();
    if (available_res.result != vk::Result::eSuccess) {
        Logger::instance().warn("Could not query instance layers: {}", vk::to_string(available_res.result));
        return false;
    }

    for (const char* layer_name : VALIDATION_LAYERS) {
        bool found = std::ranges::any_of(available_res.value, [layer_name](const vk::LayerProperties& layer) {
            return std::strcmp(layer_name, layer.layerName) == 0;
        });
        if (!found) {
            Logger::instance().warn("Validation layer {} not available", layer_name);
            return false;
        }
    }
    return true;
}

vk::DebugUtilsMessengerCreateInfoEXT make_debug_messenger_create_info()
{
    return vk::DebugUtilsMessengerCreateInfoEXT()
        .setMessageSeverity(
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eWarning |
            vk::DebugUtilsMessageSeverityFlagBitsEXT::eError)
        .setMessageType(
            vk::DebugUtilsMessageTypeFlagBitsEXT::eGeneral |
            vk::DebugUtilsMessageTypeFlagBitsEXT::eValidation |
            vk::DebugUtilsMessageTypeFlagBitsEXT::ePerformance)
        .setPfnUserCallback(debug_callback);
}

vk::Instance create_instance(std::string_view title)
{
    static vk::detail::DynamicLoader dl;
    auto vkGetInstanceProcAddr = dl.getProcAddress<PFN_vkGetInstanceProcAddr>("vkGetInstanceProcAddr");
    VULKAN_HPP_DEFAULT_DISPATCHER.init(vkGetInstanceProcAddr);

    auto app_info = vk::ApplicationInfo()
        .setPApplicationName(title.data())
        .setApplicationVersion(VK_MAKE_VERSION(1, 0, 0))
        .setPEngineName("GalaxyGenerator")
        .setEngineVersion(VK_MAKE_VERSION(1, 0, 0))
        .setApiVersion(VK_API_VERSION_1_3);

    uint32_t glfw_extension_count = 0;
    const char** glfw_extensions = glfwGetRequiredInstanceExtensions(&glfw_extension_count);
    if (!glfw_extensions) {
        throw std::runtime_error{"GLFW found no Vulkan presentation support"};
    }

    std::vector<const char*> extensions(glfw_extensions, glfw_extensions + glfw_extension_count);
    if constexpr (ENABLE_VALIDATION) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    for (const auto* ext : extensions) {
        Logger::instance().debug("Instance extension: {}", ext);
    }

    auto create_info = vk::InstanceCreateInfo()
        .setPApplicationInfo(&app_info)
        .setPEnabledExtensionNames(extensions);

    vk::DebugUtilsMessengerCreateInfoEXT debug_create_info;
    if constexpr (ENABLE_VALIDATION) {
        if (check_validation_layer_support()) {
            create_info.setPEnabledLayerNames(VALIDATION_LAYERS);
            debug_create_info = make_debug_messenger_create_info();
            create_info.setPNext(&debug_create_info);
            Logger::instance().info("Validation layers enabled");
        }
    }

    auto instance_res = vk::createInstance(create_info);
    if (instance_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{fmt::format("Failed to create instance: {}", vk::to_string(instance_res.result))};
    }
    VULKAN_HPP_DEFAULT_DISPATCHER.init(instance_res.value);
    Logger::instance().debug("Created Vulkan instance");
    return instance_res.value;
}

vk::DebugUtilsMessengerEXT create_debug_messenger(vk::Instance instance)
{
    if constexpr (!ENABLE_VALIDATION) {
        return nullptr;
    }

    auto messenger_res = instance.createDebugUtilsMessengerEXT(make_debug_messenger_create_info());
    if (messenger_res.result != vk::Result::eSuccess) {
        // Validation output is optional
        Logger::instance().warn("Failed to create debug messenger: {}", vk::to_string(messenger_res.result));
        return nullptr;
    }
    Logger::instance().debug("Created debug messenger");
    return messenger_res.value;
}

vk::PhysicalDevice select_physical_device(vk::Instance instance)
{
    auto devices_res = instance.enumeratePhysicalDevices();
    if (devices_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{fmt::format("Failed to enumerate physical devices: {}", vk::to_string(devices_res.result))};
    }

    for (auto preferred : {vk::PhysicalDeviceType::eDiscreteGpu, vk::PhysicalDeviceType::eIntegratedGpu}) {
        for (const auto& dev : devices_res.value) {
            auto props = dev.getProperties();
            if (props.deviceType == preferred) {
                Logger::instance().info("Selected GPU: {} ({})", props.deviceName.data(), vk::to_string(preferred));
                return dev;
            }
        }
    }

    throw std::runtime_error{"No suitable physical device found"};
}

QueueFamilyIndices find_queue_families(vk::PhysicalDevice physical_device)
{
    auto queue_families = physical_device.getQueueFamilyProperties();

    std::optional<uint32_t> graphics;
    std::optional<uint32_t> compute;

    for (uint32_t i = 0; i < queue_families.size(); i++) {
        const auto& family = queue_families[i];

        if (!graphics && (family.queueFlags & vk::QueueFlagBits::eGraphics)) {
            graphics = i;
        }
        if (family.queueFlags & vk::QueueFlagBits::eCompute) {
            if (!compute || !(family.queueFlags & vk::QueueFlagBits::eGraphics)) {
                compute = i;
            }
        }
    }

    if (!graphics || !compute) {
        throw std::runtime_error{"Failed to find required queue families"};
    }

    Logger::instance().debug("Queue families - graphics: {}, compute: {}", *graphics, *compute);
    return {*graphics, *compute};
}

vk::Device create_logical_device(vk::PhysicalDevice physical_device, const QueueFamilyIndices& indices)
{
    std::vector<vk::DeviceQueueCreateInfo> queue_create_infos;
    std::set<uint32_t> unique_families = {indices.graphics, indices.compute};

    float queue_priority = 1.0f;
    for (uint32_t family : unique_families) {
        queue_create_infos.push_back(vk::DeviceQueueCreateInfo()
            .setQueueFamilyIndex(family)
            .setQueueCount(1)
            .setPQueuePriorities(&queue_priority));
    }

    std::vector<const char*> extensions = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};

    // Point sizes above one pixel
    auto supported = physical_device.getFeatures();
    vk::PhysicalDeviceFeatures features{};
    features.largePoints = supported.largePoints;
    if (!supported.largePoints) {
        Logger::instance().warn("Device lacks largePoints, points render at 1px");
    }

    vk::PhysicalDeviceVulkan11Features vulkan11_features{};
    vulkan11_features.shaderDrawParameters = VK_TRUE;

    vk::PhysicalDeviceFeatures2 features2{};
    features2.features = features;
    features2.pNext = &vulkan11_features;

    auto create_info = vk::DeviceCreateInfo()
        .setQueueCreateInfos(queue_create_infos)
        .setPEnabledExtensionNames(extensions)
        .setPNext(&features2);

    auto device_res = physical_device.createDevice(create_info);
    if (device_res.result != vk::Result::eSuccess) {
        throw std::runtime_error{fmt::format("Failed to create device: {}", vk::to_string(device_res.result))};
    }
    Logger::instance().debug("Created logical device");
    return device_res.value;
}

} // anonymous namespace

VulkanContext::VulkanContext(std::string_view title)
    : m_instance(create_instance(title))
    , m_debug_messenger(create_debug_messenger(m_instance))
    , m_physical_device(select_physical_device(m_instance))
    , m_queue_indices(find_queue_families(m_physical_device))
    , m_device(create_logical_device(m_physical_device, m_queue_indices))
    , m_graphics_queue(m_device.getQueue(m_queue_indices.graphics, 0))
    , m_compute_queue(m_device.getQueue(m_queue_indices.compute, 0))
{
    VULKAN_HPP_DEFAULT_DISPATCHER.init(m_device);

    auto limits = m_physical_device.getProperties().limits;
    if (m_physical_device.getFeatures().largePoints) {
        m_max_point_size = limits.pointSizeRange[1];
    }

    Logger::instance().info("VulkanContext initialized (VK_HEADER_VERSION {}, max point size {})",
        VK_HEADER_VERSION, m_max_point_size);
}

VulkanContext::~VulkanContext()
{
    if (m_device) {
        m_device.destroy();
        Logger::instance().trace("Destroyed logical device");
    }

    if (m_debug_messenger) {
        m_instance.destroyDebugUtilsMessengerEXT(m_debug_messenger);
        Logger::instance().trace("Destroyed debug messenger");
    }

    if (m_instance) {
        m_instance.destroy();
        Logger::instance().trace("Destroyed instance");
    }
}

std::expected<uint32_t, std::string> VulkanContext::find_memory_type(
    uint32_t type_filter,
    vk::MemoryPropertyFlags properties) const
{
    auto mem_props = m_physical_device.getMemoryProperties();

    for (uint32_t i = 0; i < mem_props.memoryTypeCount; i++) {
        if ((type_filter & (1u << i)) &&
            (mem_props.memoryTypes[i].propertyFlags & properties) == properties) {
            return i;
        }
    }

    return std::unexpected(fmt::format("No memory type with {}", vk::to_string(properties)));
}

} // namespace galaxy
