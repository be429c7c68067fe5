#ifndef GALAXYGENERATOR_VULKANCONTEXT_HPP
#define GALAXYGENERATOR_VULKANCONTEXT_HPP

#include "VulkanCommon.hpp"
#include <expected>
#include <string>
#include <string_view>

namespace galaxy
{

struct QueueFamilyIndices
{
	uint32_t graphics;
	uint32_t compute;

	[[nodiscard]] bool has_dedicated_compute() const { return compute != graphics; }
};

/**
 * @brief Vulkan instance, device and queues shared by the whole viewer
 *
 * Construction throws std::runtime_error when no usable device exists.
 */
class VulkanContext
{
public:
	explicit VulkanContext(std::string_view title);
	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] const QueueFamilyIndices& queue_indices() const { return m_queue_indices; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
	[[nodiscard]] vk::Queue compute_queue() const { return m_compute_queue; }

	/**
	 * @brief Find a memory type matching `type_filter` with all of `properties`
	 */
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(
		uint32_t type_filter,
		vk::MemoryPropertyFlags properties) const;

	/**
	 * @brief Largest point size the device rasterizes (pixels)
	 */
	[[nodiscard]] float max_point_size() const { return m_max_point_size; }

private:
	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	QueueFamilyIndices m_queue_indices;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
	vk::Queue m_compute_queue;
	float m_max_point_size = 1.0f;
};

} // namespace galaxy

#endif // GALAXYGENERATOR_VULKANCONTEXT_HPP
