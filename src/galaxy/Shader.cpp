#include <galaxy/Logger.hpp>
#include <galaxy/Shader.hpp>
#include <algorithm>
#include <map>
#include <slang-com-ptr.h>
#include <utility>

namespace galaxy
{

// ============================================================================
// Slang Session Management
// ============================================================================
// One global session and one SPIR-V session, created on first use.
// ============================================================================

namespace
{

Slang::ComPtr<slang::IGlobalSession> create_global_session()
{
	Slang::ComPtr<slang::IGlobalSession> session;
	SlangGlobalSessionDesc desc = {};
	if (SLANG_FAILED(slang::createGlobalSession(&desc, session.writeRef())))
	{
		Logger::instance().error("Failed to create Slang global session");
		return nullptr;
	}
	Logger::instance().debug("Created Slang global session");
	return session;
}

Slang::ComPtr<slang::ISession> create_spirv_session(slang::IGlobalSession* global)
{
	Slang::ComPtr<slang::ISession> session;
	if (!global)
	{
		return session;
	}

	slang::TargetDesc target_desc = {};
	target_desc.format = SLANG_SPIRV;
	target_desc.profile = global->findProfile("spirv_1_5");

	const char* search_paths[] = {GALAXY_SHADER_DIR};

	slang::SessionDesc session_desc = {};
	session_desc.targets = &target_desc;
	session_desc.targetCount = 1;
	session_desc.searchPaths = search_paths;
	session_desc.searchPathCount = 1;
	// glm matrices are column-major
	session_desc.defaultMatrixLayoutMode = SLANG_MATRIX_LAYOUT_COLUMN_MAJOR;

	global->createSession(session_desc, session.writeRef());
	Logger::instance().debug("Created SPIR-V session with search path: {}", GALAXY_SHADER_DIR);
	return session;
}

slang::ISession* get_session()
{
	static Slang::ComPtr<slang::IGlobalSession> global = create_global_session();
	static Slang::ComPtr<slang::ISession> session = create_spirv_session(global);
	return session.get();
}

} // anonymous namespace

// ============================================================================
// Shader Compilation
// ============================================================================

namespace
{

/// Returns the diagnostics text if the blob holds any
std::optional<std::string> check_diagnostics(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return std::nullopt;
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

/// Load a module, find the entry point and combine both into one component
std::expected<Slang::ComPtr<slang::IComponentType>, std::string> load_shader_program(std::string_view name,
																					 std::string_view entry_point)
{
	Logger::instance().debug("Loading shader module '{}' with entry point '{}'", name, entry_point);

	auto* session = get_session();
	if (!session)
	{
		return std::unexpected{"Slang session unavailable"};
	}

	std::string module_name{name};
	std::string entry_name{entry_point};
	Slang::ComPtr<slang::IBlob> diagnostics;

	Slang::ComPtr<slang::IModule> module(session->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		auto error = check_diagnostics(diagnostics.get()).value_or("no diagnostics");
		return std::unexpected{fmt::format("Failed to load module '{}': {}", name, error)};
	}
	if (auto warning = check_diagnostics(diagnostics.get()))
	{
		Logger::instance().warn("Module '{}': {}", name, *warning);
	}

	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected{fmt::format("Entry point '{}' not found in '{}'", entry_point, name)};
	}

	slang::IComponentType* components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> program;
	session->createCompositeComponentType(components, 2, program.writeRef(), diagnostics.writeRef());
	if (!program)
	{
		auto error = check_diagnostics(diagnostics.get()).value_or("no diagnostics");
		return std::unexpected{fmt::format("Failed to compose '{}': {}", name, error)};
	}

	return program;
}

std::expected<Slang::ComPtr<slang::IComponentType>, std::string> link_program(
	Slang::ComPtr<slang::IComponentType> program)
{
	Slang::ComPtr<slang::IComponentType> linked;
	Slang::ComPtr<slang::IBlob> diagnostics;

	program->link(linked.writeRef(), diagnostics.writeRef());
	if (!linked)
	{
		auto error = check_diagnostics(diagnostics.get()).value_or("no diagnostics");
		return std::unexpected{fmt::format("Failed to link program: {}", error)};
	}

	Logger::instance().trace("Linked shader program");
	return linked;
}

std::expected<Slang::ComPtr<slang::IBlob>, std::string> get_spirv_code(slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;

	linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef());
	if (!code)
	{
		auto error = check_diagnostics(diagnostics.get()).value_or("no diagnostics");
		return std::unexpected{fmt::format("Failed to generate SPIR-V: {}", error)};
	}

	Logger::instance().trace("Generated SPIR-V code: {} bytes", code->getBufferSize());
	return code;
}

std::expected<vk::ShaderModule, std::string> create_shader_module(vk::Device device, slang::IBlob* spirv)
{
	auto create_info = vk::ShaderModuleCreateInfo()
						   .setCodeSize(spirv->getBufferSize())
						   .setPCode(static_cast<const uint32_t*>(spirv->getBufferPointer()));

	auto module_res = device.createShaderModule(create_info);
	GALAXY_CHECK_VK_RESULT(module_res, "Failed to create shader module: {}");
	return module_res.value;
}

} // anonymous namespace

// ============================================================================
// Reflection
// ============================================================================
// Descriptor bindings, push constants and stage interfaces from the Slang
// program layout.
// ============================================================================

namespace
{

/// Float/int/uint vectors of 1-4 components
vk::Format to_vk_format(slang::TypeReflection* type)
{
	auto scalar = type->getScalarType();
	auto count = std::max<std::size_t>(type->getElementCount(), 1);

	using ST = slang::TypeReflection::ScalarType;

	if (count <= 4)
	{
		if (scalar == ST::Float32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sfloat, vk::Format::eR32G32Sfloat,
											  vk::Format::eR32G32B32Sfloat, vk::Format::eR32G32B32A32Sfloat};
			return formats[count - 1];
		}
		if (scalar == ST::Int32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Sint, vk::Format::eR32G32Sint,
											  vk::Format::eR32G32B32Sint, vk::Format::eR32G32B32A32Sint};
			return formats[count - 1];
		}
		if (scalar == ST::UInt32)
		{
			constexpr vk::Format formats[] = {vk::Format::eR32Uint, vk::Format::eR32G32Uint,
											  vk::Format::eR32G32B32Uint, vk::Format::eR32G32B32A32Uint};
			return formats[count - 1];
		}
	}

	Logger::instance().warn("Unknown stage variable format, defaulting to R32G32B32A32Sfloat");
	return vk::Format::eR32G32B32A32Sfloat;
}

uint32_t format_size(vk::Format format)
{
	switch (format)
	{
		case vk::Format::eR32Sfloat:
		case vk::Format::eR32Sint:
		case vk::Format::eR32Uint: return 4;
		case vk::Format::eR32G32Sfloat:
		case vk::Format::eR32G32Sint:
		case vk::Format::eR32G32Uint: return 8;
		case vk::Format::eR32G32B32Sfloat:
		case vk::Format::eR32G32B32Sint:
		case vk::Format::eR32G32B32Uint: return 12;
		default: return 16;
	}
}

std::expected<vk::ShaderStageFlagBits, std::string> to_vk_shader_stage(SlangStage stage)
{
	switch (stage)
	{
		case SLANG_STAGE_VERTEX: return vk::ShaderStageFlagBits::eVertex;
		case SLANG_STAGE_FRAGMENT: return vk::ShaderStageFlagBits::eFragment;
		default: return std::unexpected{fmt::format("Unsupported shader stage {}", static_cast<int>(stage))};
	}
}

vk::DescriptorType to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;

	auto base_type =
		static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(BaseMask));
	bool is_mutable = (static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base_type)
	{
		case Sampler: return vk::DescriptorType::eSampler;
		case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		default:
			Logger::instance().warn("Unhandled binding type {}, assuming uniform buffer",
									static_cast<uint32_t>(binding_type));
			return vk::DescriptorType::eUniformBuffer;
	}
}

/// Size of a type layout, unwrapping arrays and containers
std::size_t extract_size(slang::TypeLayoutReflection* type_layout)
{
	auto size = type_layout->getSize();
	if (size > 0)
	{
		return size;
	}

	auto* element_type = type_layout->getElementTypeLayout();
	if (element_type && element_type != type_layout)
	{
		return extract_size(element_type);
	}
	return 0;
}

std::vector<DescriptorInfo> extract_descriptors(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	slang::ProgramLayout* layout = linked->getLayout();
	std::vector<DescriptorInfo> descriptors;

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param = layout->getParameterByIndex(i);
		auto* type_layout = param->getTypeLayout();

		for (unsigned r = 0; r < type_layout->getBindingRangeCount(); r++)
		{
			auto binding_type = type_layout->getBindingRangeType(r);
			if (binding_type == slang::BindingType::VaryingInput ||
				binding_type == slang::BindingType::VaryingOutput ||
				binding_type == slang::BindingType::PushConstant)
			{
				continue;
			}

			auto* leaf_type = type_layout->getBindingRangeLeafTypeLayout(r);
			descriptors.push_back(DescriptorInfo{
				.name = param->getName(),
				.size = leaf_type ? extract_size(leaf_type) : 0,
				.binding = param->getBindingIndex() + r,
				.set = param->getBindingSpace(),
				.descriptor_count = static_cast<std::size_t>(type_layout->getBindingRangeBindingCount(r)),
				.type = to_vk_descriptor_type(binding_type),
				.stage = stage});

			const auto& info = descriptors.back();
			Logger::instance().trace("  Binding: set={} binding={} name='{}' type={} size={}", info.set, info.binding,
									 info.name, vk::to_string(info.type), info.size);
		}
	}

	return descriptors;
}

std::optional<PushConstantInfo> extract_push_constants(slang::IComponentType* linked, vk::ShaderStageFlagBits stage)
{
	slang::ProgramLayout* layout = linked->getLayout();

	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param = layout->getParameterByIndex(i);
		auto* type_layout = param->getTypeLayout();
		for (unsigned r = 0; r < type_layout->getBindingRangeCount(); r++)
		{
			if (type_layout->getBindingRangeType(r) == slang::BindingType::PushConstant)
			{
				auto size = extract_size(type_layout);
				Logger::instance().debug("Push constant '{}': size={}", param->getName(), size);
				return PushConstantInfo{.name = param->getName(), .offset = 0, .size = size, .stage = stage};
			}
		}
	}
	return std::nullopt;
}

slang::EntryPointReflection* get_entry_point(slang::IComponentType* linked)
{
	auto* layout = linked->getLayout();
	if (layout->getEntryPointCount() == 0)
	{
		return nullptr;
	}
	return layout->getEntryPointByIndex(0);
}

slang::TypeLayoutReflection* unwrap_to_struct(slang::TypeLayoutReflection* type)
{
	if (!type)
		return nullptr;
	if (type->getKind() == slang::TypeReflection::Kind::Struct)
		return type;
	if (auto* element = type->getElementTypeLayout(); element && element != type)
		return unwrap_to_struct(element);
	return nullptr;
}

/// Struct fields as stage variables; SV_ system values map to builtins and are skipped
std::vector<StageVariable> extract_variables(slang::TypeLayoutReflection* struct_type)
{
	std::vector<StageVariable> vars;
	for (unsigned f = 0; f < struct_type->getFieldCount(); f++)
	{
		auto* field = struct_type->getFieldByIndex(f);
		if (auto* semantic = field->getSemanticName(); semantic && std::string_view(semantic).starts_with("SV_"))
		{
			continue;
		}
		vars.push_back({.name = field->getName(),
						.location = field->getBindingIndex(),
						.format = to_vk_format(field->getTypeLayout()->getType())});
	}
	return vars;
}

std::vector<StageVariable> extract_inputs(slang::EntryPointReflection* entry)
{
	std::vector<StageVariable> inputs;
	for (unsigned p = 0; p < entry->getParameterCount(); p++)
	{
		if (auto* struct_type = unwrap_to_struct(entry->getParameterByIndex(p)->getTypeLayout()))
		{
			auto vars = extract_variables(struct_type);
			inputs.insert(inputs.end(), vars.begin(), vars.end());
		}
	}
	return inputs;
}

std::vector<StageVariable> extract_outputs(slang::EntryPointReflection* entry)
{
	if (auto* result = entry->getResultVarLayout())
	{
		if (auto* struct_type = unwrap_to_struct(result->getTypeLayout()))
		{
			return extract_variables(struct_type);
		}
	}
	return {};
}

/// Every consumer input needs a producer output at the same location and format
bool interfaces_match(const std::vector<StageVariable>& producer, const std::vector<StageVariable>& consumer)
{
	std::map<uint32_t, const StageVariable*> producer_map;
	for (const auto& var : producer)
	{
		producer_map[var.location] = &var;
	}

	bool valid = true;
	for (const auto& input : consumer)
	{
		auto it = producer_map.find(input.location);
		if (it == producer_map.end())
		{
			Logger::instance().error("Fragment input '{}' at location {} has no matching vertex output", input.name,
									 input.location);
			valid = false;
		}
		else if (it->second->format != input.format)
		{
			Logger::instance().error("Location {}: vertex outputs {} but fragment expects {}", input.location,
									 vk::to_string(it->second->format), vk::to_string(input.format));
			valid = false;
		}
	}
	return valid;
}

} // anonymous namespace

// ============================================================================
// Shader Stage Details
// ============================================================================

VertexDetails::VertexDetails(slang::IComponentType* linked)
{
	auto* entry = get_entry_point(linked);
	if (!entry)
		return;

	// Each struct parameter of the entry point is one vertex buffer binding
	for (uint32_t param_idx = 0; param_idx < entry->getParameterCount(); ++param_idx)
	{
		auto* type_layout = entry->getParameterByIndex(param_idx)->getTypeLayout();
		if (type_layout->getKind() != slang::TypeReflection::Kind::Struct)
		{
			continue;
		}

		uint32_t binding = static_cast<uint32_t>(bindings.size());
		uint32_t offset = 0;
		for (uint32_t f = 0; f < type_layout->getFieldCount(); ++f)
		{
			auto* field = type_layout->getFieldByIndex(f);
			auto format = to_vk_format(field->getTypeLayout()->getType());
			inputs.push_back({.name = field->getName(),
							  .location = field->getBindingIndex(),
							  .binding = binding,
							  .offset = offset,
							  .format = format});
			offset += format_size(format);
		}

		const char* struct_name = type_layout->getType()->getName();
		bindings.push_back({.binding = binding, .stride = offset, .name = struct_name ? struct_name : ""});
	}

	outputs = extract_outputs(entry);
	Logger::instance().debug("VertexDetails: {} inputs across {} bindings, {} outputs", inputs.size(),
							 bindings.size(), outputs.size());
}

bool VertexDetails::matches(const ShaderDetails& next) const
{
	return std::visit(overloaded{[this](const FragmentDetails& f) { return interfaces_match(outputs, f.inputs); },
								 [](const VertexDetails&)
								 {
									 Logger::instance().error("Invalid pipeline: vertex cannot feed a vertex stage");
									 return false;
								 }},
					  next);
}

FragmentDetails::FragmentDetails(slang::IComponentType* linked)
{
	auto* entry = get_entry_point(linked);
	if (!entry)
		return;

	inputs = extract_inputs(entry);
	outputs = extract_outputs(entry);
	Logger::instance().debug("FragmentDetails: {} inputs, {} outputs", inputs.size(), outputs.size());
}

bool FragmentDetails::matches(const ShaderDetails&) const
{
	Logger::instance().error("Invalid pipeline: fragment is the final stage");
	return false;
}

bool ShaderDetails::matches(const ShaderDetails& next) const
{
	return std::visit([&next](const auto& details) { return details.matches(next); }, *this);
}

vk::ShaderStageFlagBits ShaderDetails::stage() const
{
	return std::visit(overloaded{[](const VertexDetails&) { return vk::ShaderStageFlagBits::eVertex; },
								 [](const FragmentDetails&) { return vk::ShaderStageFlagBits::eFragment; }},
					  *this);
}

// ============================================================================
// Shader Class
// ============================================================================

std::expected<Shader, std::string> Shader::create_shader(vk::Device device, std::string_view name,
														 std::string_view entry_point)
{
	Logger::instance().info("Creating shader '{}':'{}'", name, entry_point);

	auto linked =
		load_shader_program(name, entry_point).and_then([](auto prog) { return link_program(std::move(prog)); });
	if (!linked)
	{
		return std::unexpected{linked.error()};
	}

	auto* entry = get_entry_point(linked->get());
	if (!entry)
	{
		return std::unexpected{fmt::format("'{}' has no entry point after linking", name)};
	}

	auto stage = to_vk_shader_stage(entry->getStage());
	if (!stage)
	{
		return std::unexpected{stage.error()};
	}

	auto spirv = get_spirv_code(linked->get());
	if (!spirv)
	{
		return std::unexpected{spirv.error()};
	}

	auto module = create_shader_module(device, spirv->get());
	if (!module)
	{
		return std::unexpected{module.error()};
	}

	ShaderDetails details = *stage == vk::ShaderStageFlagBits::eVertex
								? ShaderDetails{VertexDetails{linked->get()}}
								: ShaderDetails{FragmentDetails{linked->get()}};
	auto push_constants = extract_push_constants(linked->get(), *stage);
	auto descriptors = extract_descriptors(linked->get(), *stage);

	Logger::instance().info("Shader '{}' created ({} descriptors, push constants: {})", name, descriptors.size(),
							push_constants ? push_constants->size : 0);

	return Shader{device,		   *module, *stage, std::move(details), std::move(descriptors), push_constants,
				  std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::create_pipeline_shader_stage_create_info() const
{
	return vk::PipelineShaderStageCreateInfo{}
		.setStage(m_stage)
		.setModule(m_shader_module)
		.setPName(m_entry_point.c_str());
}

Shader::Shader(vk::Device device, vk::ShaderModule shader_module, vk::ShaderStageFlagBits stage,
			   ShaderDetails details, std::vector<DescriptorInfo> descriptor_infos,
			   std::optional<PushConstantInfo> push_constant_info, std::string entry_point)
	: m_device(device)
	, m_shader_module(shader_module)
	, m_stage(stage)
	, m_details(std::move(details))
	, m_descriptor_infos(std::move(descriptor_infos))
	, m_push_constant_info(std::move(push_constant_info))
	, m_entry_point(std::move(entry_point))
{
}

Shader::~Shader()
{
	if (m_shader_module)
	{
		m_device.destroyShaderModule(m_shader_module);
		Logger::instance().trace("Destroyed shader module");
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_shader_module(std::exchange(other.m_shader_module, nullptr))
	, m_stage(other.m_stage)
	, m_details(std::move(other.m_details))
	, m_descriptor_infos(std::move(other.m_descriptor_infos))
	, m_push_constant_info(std::move(other.m_push_constant_info))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_shader_module)
		{
			m_device.destroyShaderModule(m_shader_module);
		}

		m_device = other.m_device;
		m_shader_module = std::exchange(other.m_shader_module, nullptr);
		m_stage = other.m_stage;
		m_details = std::move(other.m_details);
		m_descriptor_infos = std::move(other.m_descriptor_infos);
		m_push_constant_info = std::move(other.m_push_constant_info);
		m_entry_point = std::move(other.m_entry_point);
	}
	return *this;
}

} // namespace galaxy
