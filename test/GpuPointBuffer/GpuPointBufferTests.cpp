#include <catch2/catch_test_macros.hpp>

#include <galaxy/GalaxyGenerator.hpp>
#include <galaxy/GpuPointBuffer.hpp>
#include <galaxy/Logger.hpp>
#include <galaxy/VulkanContext.hpp>
#include <galaxy/Window.hpp>

using namespace galaxy;

namespace
{

VulkanContext make_context()
{
	Window::ensure_glfw_initialized();
	return VulkanContext("Point Buffer Test");
}

} // namespace

TEST_CASE("GpuPointBuffer uploads point clouds", "[vulkan][buffer]")
{
	Logger::instance().set_level(spdlog::level::trace);
	auto ctx = make_context();

	auto pool_res = ctx.device().createCommandPool(vk::CommandPoolCreateInfo()
		.setFlags(vk::CommandPoolCreateFlagBits::eTransient)
		.setQueueFamilyIndex(ctx.queue_indices().graphics));
	REQUIRE(pool_res.result == vk::Result::eSuccess);
	vk::CommandPool pool = pool_res.value;

	SECTION("generated galaxy is uploaded in full")
	{
		DefaultRandomSource random(3);
		auto points = generate(GalaxyParameters{}, random);

		auto buffer = GpuPointBuffer::create(ctx, pool, ctx.graphics_queue(), points);
		REQUIRE(buffer.has_value());
		REQUIRE(buffer->buffer());
		REQUIRE(buffer->vertex_count() == points.count());
		REQUIRE(buffer->size_bytes() == points.count() * sizeof(PointVertex));
	}

	SECTION("empty point buffer creates no storage")
	{
		auto buffer = GpuPointBuffer::create(ctx, pool, ctx.graphics_queue(), PointBuffer{});
		REQUIRE(buffer.has_value());
		REQUIRE_FALSE(buffer->buffer());
		REQUIRE(buffer->vertex_count() == 0);
	}

	SECTION("moved-from buffer gives up its storage")
	{
		DefaultRandomSource random(3);
		auto points = generate(GalaxyParameters{}, random);
		auto buffer = GpuPointBuffer::create(ctx, pool, ctx.graphics_queue(), points);
		REQUIRE(buffer.has_value());

		GpuPointBuffer moved(std::move(*buffer));
		REQUIRE(moved.buffer());
		REQUIRE_FALSE(buffer->buffer());
		REQUIRE(buffer->vertex_count() == 0);
	}

	// Every upload freed its transfer command buffer and waited for the copy
	REQUIRE(ctx.device().waitIdle() == vk::Result::eSuccess);
	ctx.device().destroyCommandPool(pool);
}
