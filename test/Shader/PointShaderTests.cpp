#include <catch2/catch_test_macros.hpp>

#include <galaxy/GpuPointBuffer.hpp>
#include <galaxy/Logger.hpp>
#include <galaxy/Shader.hpp>
#include <galaxy/VulkanContext.hpp>
#include <galaxy/Window.hpp>

using namespace galaxy;

namespace
{

VulkanContext make_context()
{
	Window::ensure_glfw_initialized();
	return VulkanContext("Shader Test");
}

} // namespace

TEST_CASE("Point vertex shader loads correctly", "[vulkan][shader][vertex]")
{
	Logger::instance().set_level(spdlog::level::trace);
	auto ctx = make_context();

	auto shader_result = Shader::create_shader(ctx.device(), "points/points.vert.slang");
	REQUIRE(shader_result.has_value());
	auto& shader = shader_result.value();

	SECTION("shader module is valid")
	{
		REQUIRE(shader.get_shader_module());
	}

	SECTION("shader has vertex stage")
	{
		REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eVertex);
		REQUIRE(shader.get_details().stage() == vk::ShaderStageFlagBits::eVertex);
	}

	SECTION("shader has one descriptor (view UBO)")
	{
		const auto& descriptors = shader.get_descriptor_infos();
		REQUIRE(descriptors.size() == 1);

		const auto& desc = descriptors[0];
		REQUIRE(desc.name == "view");
		REQUIRE(desc.binding == 0);
		REQUIRE(desc.set == 0);
		REQUIRE(desc.descriptor_count == 1);
		REQUIRE(desc.type == vk::DescriptorType::eUniformBuffer);
		REQUIRE(desc.size == 80); // float4x4 (64) + float2 (8) + 2 floats (8)
	}

	SECTION("shader has material push constants")
	{
		const auto& push_constant = shader.get_push_constant_info();
		REQUIRE(push_constant.has_value());
		REQUIRE(push_constant->size == 16);
	}

	SECTION("vertex input matches PointVertex")
	{
		const auto* vertex_details = std::get_if<VertexDetails>(&shader.get_details());
		REQUIRE(vertex_details != nullptr);

		REQUIRE(vertex_details->bindings.size() == 1);
		REQUIRE(vertex_details->bindings[0].stride == sizeof(PointVertex));

		REQUIRE(vertex_details->inputs.size() == 2);
		REQUIRE(vertex_details->inputs[0].name == "position");
		REQUIRE(vertex_details->inputs[0].offset == 0);
		REQUIRE(vertex_details->inputs[0].format == vk::Format::eR32G32B32Sfloat);
		REQUIRE(vertex_details->inputs[1].name == "color");
		REQUIRE(vertex_details->inputs[1].offset == 12);
		REQUIRE(vertex_details->inputs[1].format == vk::Format::eR32G32B32Sfloat);
	}

	SECTION("outputs skip system values")
	{
		const auto& vertex_details = std::get<VertexDetails>(shader.get_details());
		REQUIRE(vertex_details.outputs.size() == 1);
		REQUIRE(vertex_details.outputs[0].name == "color");
	}
}

TEST_CASE("Point fragment shader loads correctly", "[vulkan][shader][fragment]")
{
	auto ctx = make_context();

	auto shader_result = Shader::create_shader(ctx.device(), "points/points.frag.slang");
	REQUIRE(shader_result.has_value());
	auto& shader = shader_result.value();

	SECTION("shader has fragment stage")
	{
		REQUIRE(shader.stage() == vk::ShaderStageFlagBits::eFragment);
	}

	SECTION("shader has no descriptors or push constants")
	{
		REQUIRE(shader.get_descriptor_infos().empty());
		REQUIRE_FALSE(shader.get_push_constant_info().has_value());
	}

	SECTION("fragment reads color and writes one attachment")
	{
		const auto* fragment_details = std::get_if<FragmentDetails>(&shader.get_details());
		REQUIRE(fragment_details != nullptr);
		REQUIRE(fragment_details->inputs.size() == 1);
		REQUIRE(fragment_details->inputs[0].format == vk::Format::eR32G32B32Sfloat);
		REQUIRE(fragment_details->outputs.size() == 1);
	}
}

TEST_CASE("Point shader stages link", "[vulkan][shader][validation]")
{
	auto ctx = make_context();

	auto vert = Shader::create_shader(ctx.device(), "points/points.vert.slang");
	auto frag = Shader::create_shader(ctx.device(), "points/points.frag.slang");
	REQUIRE(vert.has_value());
	REQUIRE(frag.has_value());

	SECTION("vertex outputs feed fragment inputs")
	{
		REQUIRE(vert->get_details().matches(frag->get_details()));
	}

	SECTION("fragment is the end of the chain")
	{
		REQUIRE_FALSE(frag->get_details().matches(vert->get_details()));
	}

	SECTION("vertex cannot feed vertex")
	{
		REQUIRE_FALSE(vert->get_details().matches(vert->get_details()));
	}
}

TEST_CASE("Missing shader module reports an error", "[vulkan][shader]")
{
	auto ctx = make_context();

	auto shader_result = Shader::create_shader(ctx.device(), "points/does_not_exist.slang");
	REQUIRE_FALSE(shader_result.has_value());
	REQUIRE_FALSE(shader_result.error().empty());
}
