#include <catch2/catch_test_macros.hpp>
#include <galaxy/Logger.hpp>
#include <galaxy/VulkanContext.hpp>
#include <galaxy/Window.hpp>

using namespace galaxy;

namespace
{

// The instance asks GLFW for its surface extensions
VulkanContext make_context()
{
	Window::ensure_glfw_initialized();
	return VulkanContext("Test App");
}

} // namespace

TEST_CASE("VulkanContext creation", "[vulkan]")
{
	Logger::instance().set_level(spdlog::level::trace);
	Window::ensure_glfw_initialized();
	SECTION("constructs without throwing")
	{
		REQUIRE_NOTHROW(VulkanContext("Test App"));
	}
}

TEST_CASE("VulkanContext provides valid handles", "[vulkan]")
{
	auto ctx = make_context();

	SECTION("instance is valid")
	{
		REQUIRE(ctx.instance());
	}

	SECTION("physical device is valid")
	{
		REQUIRE(ctx.physical_device());
	}

	SECTION("device is valid")
	{
		REQUIRE(ctx.device());
	}

	SECTION("graphics queue is valid")
	{
		REQUIRE(ctx.graphics_queue());
	}
}

TEST_CASE("VulkanContext queue indices are reasonable", "[vulkan]")
{
	auto ctx = make_context();

	auto indices = ctx.queue_indices();
	auto queue_families = ctx.physical_device().getQueueFamilyProperties();

	SECTION("graphics index is within bounds")
	{
		REQUIRE(indices.graphics < queue_families.size());
	}

	SECTION("graphics queue supports graphics")
	{
		auto flags = queue_families[indices.graphics].queueFlags;
		REQUIRE((flags & vk::QueueFlagBits::eGraphics));
	}
}

TEST_CASE("VulkanContext point size limits", "[vulkan]")
{
	auto ctx = make_context();

	SECTION("max point size is at least one pixel")
	{
		REQUIRE(ctx.max_point_size() >= 1.0f);
	}

	SECTION("max point size follows the largePoints feature")
	{
		if (!ctx.physical_device().getFeatures().largePoints)
		{
			REQUIRE(ctx.max_point_size() == 1.0f);
		}
		else
		{
			REQUIRE(ctx.max_point_size() == ctx.physical_device().getProperties().limits.pointSizeRange[1]);
		}
	}
}

TEST_CASE("VulkanContext finds memory types", "[vulkan]")
{
	auto ctx = make_context();

	SECTION("host-visible coherent memory exists")
	{
		auto type = ctx.find_memory_type(
			~0u, vk::MemoryPropertyFlagBits::eHostVisible | vk::MemoryPropertyFlagBits::eHostCoherent);
		REQUIRE(type.has_value());
	}

	SECTION("empty type filter is an error")
	{
		auto type = ctx.find_memory_type(0u, vk::MemoryPropertyFlagBits::eDeviceLocal);
		REQUIRE_FALSE(type.has_value());
		REQUIRE_FALSE(type.error().empty());
	}
}
