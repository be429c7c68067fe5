#ifndef GALAXYGENERATOR_SHADER_HPP
#define GALAXYGENERATOR_SHADER_HPP
#include <expected>
#include <optional>
#include <slang.h>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "VulkanCommon.hpp"

namespace galaxy
{

struct DescriptorInfo
{
	std::string name;
	std::size_t size; // Size per descriptor
	std::size_t binding; // Binding ID
	std::size_t set; // Set ID
	std::size_t descriptor_count; // 1 if not array
	vk::DescriptorType type;
	vk::ShaderStageFlagBits stage;
};

struct PushConstantInfo
{
	std::string name;
	std::size_t offset;
	std::size_t size;
	vk::ShaderStageFlags stage;
};

struct StageVariable
{
	std::string name;
	uint32_t location;
	vk::Format format;
};

struct VertexAttribute
{
	std::string name;
	uint32_t location;
	uint32_t binding;
	uint32_t offset; // Within binding's stride
	vk::Format format;

	[[nodiscard]] vk::VertexInputAttributeDescription to_attribute_description() const
	{
		return vk::VertexInputAttributeDescription()
			.setLocation(location)
			.setBinding(binding)
			.setFormat(format)
			.setOffset(offset);
	}
};

struct VertexBinding
{
	uint32_t binding;
	uint32_t stride;
	std::string name; // Struct name of the entry point parameter

	[[nodiscard]] vk::VertexInputBindingDescription to_binding_description(
		vk::VertexInputRate input_rate = vk::VertexInputRate::eVertex) const
	{
		return vk::VertexInputBindingDescription()
			.setBinding(binding)
			.setStride(stride)
			.setInputRate(input_rate);
	}
};

struct ShaderDetails;

struct VertexDetails
{
	std::vector<VertexAttribute> inputs;
	std::vector<VertexBinding> bindings;
	std::vector<StageVariable> outputs;

	explicit VertexDetails(slang::IComponentType* linked);
	[[nodiscard]] bool matches(const ShaderDetails& next) const;
};

struct FragmentDetails
{
	std::vector<StageVariable> inputs;
	std::vector<StageVariable> outputs; // Color attachments

	explicit FragmentDetails(slang::IComponentType* linked);
	[[nodiscard]] bool matches(const ShaderDetails& next) const; // Always false, end of chain
};

using ShaderDetailsBase = std::variant<VertexDetails, FragmentDetails>;

/**
 * @brief Reflected stage interface of a compiled shader
 *
 * Only the vertex and fragment stages are supported; other stages fail in
 * Shader::create_shader().
 */
struct ShaderDetails : ShaderDetailsBase
{
	using ShaderDetailsBase::ShaderDetailsBase;

	[[nodiscard]] bool matches(const ShaderDetails& next) const;
	[[nodiscard]] vk::ShaderStageFlagBits stage() const;
};

/**
 * @brief Slang shader compiled to SPIR-V, with its reflection data
 */
class Shader
{
public:
	/**
	 * @brief Compile a Slang module found under GALAXY_SHADER_DIR
	 *
	 * @param device Device that owns the shader module
	 * @param name Module path relative to the shader directory
	 * @param entry_point Entry point function name
	 * @return Shader or compiler/driver error message
	 */
	static std::expected<Shader, std::string> create_shader(vk::Device device, std::string_view name,
															std::string_view entry_point = "main");

	[[nodiscard]] const std::vector<DescriptorInfo>& get_descriptor_infos() const { return m_descriptor_infos; }
	[[nodiscard]] const std::optional<PushConstantInfo>& get_push_constant_info() const { return m_push_constant_info; }
	[[nodiscard]] vk::ShaderModule get_shader_module() const { return m_shader_module; }
	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_stage; }
	[[nodiscard]] const ShaderDetails& get_details() const { return m_details; }
	[[nodiscard]] vk::PipelineShaderStageCreateInfo create_pipeline_shader_stage_create_info() const;

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;

	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage, ShaderDetails details,
		   std::vector<DescriptorInfo> descriptor_infos, std::optional<PushConstantInfo> push_constant_info,
		   std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_shader_module;
	vk::ShaderStageFlagBits m_stage;
	ShaderDetails m_details;
	std::vector<DescriptorInfo> m_descriptor_infos;
	std::optional<PushConstantInfo> m_push_constant_info;
	std::string m_entry_point;
};

} // namespace galaxy

#endif // GALAXYGENERATOR_SHADER_HPP
