//
// Created by chris on 1/7/26.
//
#include <evergreen/Logger.hpp>
#include <evergreen/render/Shader.hpp>
#include <algorithm>
#include <format>
#include <slang-com-ptr.h>
#include <utility>

namespace evergreen::render
{

// ============================================================================
// Slang session
// ============================================================================

namespace
{

struct SlangSession
{
	Slang::ComPtr<slang::IGlobalSession> global;
	Slang::ComPtr<slang::ISession> spirv;
	std::string error;
};

SlangSession open_session()
{
	SlangSession out;
	SlangGlobalSessionDesc global_desc = {};
	if (SLANG_FAILED(slang::createGlobalSession(&global_desc, out.global.writeRef())))
	{
		out.error = "Could not create the Slang global session";
		return out;
	}

	slang::TargetDesc target = {};
	target.format = SLANG_SPIRV;
	target.profile = out.global->findProfile("spirv_1_5");

	const char* search_paths[] = {SHADER_DIR};
	slang::SessionDesc desc = {};
	desc.targets = &target;
	desc.targetCount = 1;
	desc.searchPaths = search_paths;
	desc.searchPathCount = 1;

	if (SLANG_FAILED(out.global->createSession(desc, out.spirv.writeRef())))
	{
		out.error = "Could not create the Slang SPIR-V session";
		return out;
	}
	Logger::instance().debug("Slang SPIR-V session searching {}", SHADER_DIR);
	return out;
}

std::expected<slang::ISession*, std::string> session()
{
	static SlangSession s = open_session();
	if (!s.spirv)
	{
		return std::unexpected(s.error);
	}
	return s.spirv.get();
}

/// Diagnostics text, if the compiler produced any.
std::optional<std::string> diagnostics_text(slang::IBlob* diagnostics)
{
	if (!diagnostics || diagnostics->getBufferSize() == 0)
	{
		return std::nullopt;
	}
	return std::string{static_cast<const char*>(diagnostics->getBufferPointer()), diagnostics->getBufferSize()};
}

std::expected<Slang::ComPtr<slang::IComponentType>, std::string> compile(std::string_view name,
                                                                         std::string_view entry_point)
{
	auto s = session();
	if (!s) return std::unexpected(s.error());

	std::string module_name{name};
	std::string entry_name{entry_point};
	Slang::ComPtr<slang::IBlob> diagnostics;

	Slang::ComPtr<slang::IModule> module((*s)->loadModule(module_name.c_str(), diagnostics.writeRef()));
	if (!module)
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or(std::format("Module '{}' not found", name)));
	}
	if (auto warnings = diagnostics_text(diagnostics.get()))
	{
		Logger::instance().warn("Slang on '{}': {}", name, *warnings);
	}

	Slang::ComPtr<slang::IEntryPoint> entry;
	module->findEntryPointByName(entry_name.c_str(), entry.writeRef());
	if (!entry)
	{
		return std::unexpected(std::format("Entry point '{}' not found in '{}'", entry_point, name));
	}

	slang::IComponentType* components[] = {module, entry};
	Slang::ComPtr<slang::IComponentType> composite;
	if (SLANG_FAILED((*s)->createCompositeComponentType(components, 2, composite.writeRef(), diagnostics.writeRef())))
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("Composite creation failed"));
	}

	Slang::ComPtr<slang::IComponentType> linked;
	if (SLANG_FAILED(composite->link(linked.writeRef(), diagnostics.writeRef())))
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("Link failed"));
	}
	return linked;
}

std::expected<vk::ShaderModule, std::string> create_module(vk::Device device, slang::IComponentType* linked)
{
	Slang::ComPtr<slang::IBlob> code;
	Slang::ComPtr<slang::IBlob> diagnostics;
	if (SLANG_FAILED(linked->getEntryPointCode(0, 0, code.writeRef(), diagnostics.writeRef())) || !code)
	{
		return std::unexpected(diagnostics_text(diagnostics.get()).value_or("SPIR-V generation failed"));
	}

	auto module_res = device.createShaderModule(vk::ShaderModuleCreateInfo()
		.setCodeSize(code->getBufferSize())
		.setPCode(static_cast<const uint32_t*>(code->getBufferPointer())));
	CHECK_VK_RESULT(module_res, "Could not create shader module: {}");
	Logger::instance().trace("Shader module from {} bytes of SPIR-V", code->getBufferSize());
	return module_res.value;
}

} // namespace

// ============================================================================
// Reflection
// ============================================================================

namespace
{

vk::ShaderStageFlagBits to_vk_stage(SlangStage stage)
{
	switch (stage)
	{
		case SLANG_STAGE_VERTEX: return vk::ShaderStageFlagBits::eVertex;
		case SLANG_STAGE_FRAGMENT: return vk::ShaderStageFlagBits::eFragment;
		case SLANG_STAGE_COMPUTE: return vk::ShaderStageFlagBits::eCompute;
		case SLANG_STAGE_GEOMETRY: return vk::ShaderStageFlagBits::eGeometry;
		default:
			Logger::instance().warn("Unsupported shader stage {}, treating as vertex", static_cast<int>(stage));
			return vk::ShaderStageFlagBits::eVertex;
	}
}

std::optional<vk::DescriptorType> to_vk_descriptor_type(slang::BindingType binding_type)
{
	using enum slang::BindingType;
	auto base = static_cast<slang::BindingType>(static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(BaseMask));
	bool is_mutable = (static_cast<uint32_t>(binding_type) & static_cast<uint32_t>(MutableFlag)) != 0;

	switch (base)
	{
		case Sampler: return vk::DescriptorType::eSampler;
		case Texture: return is_mutable ? vk::DescriptorType::eStorageImage : vk::DescriptorType::eSampledImage;
		case ConstantBuffer: return vk::DescriptorType::eUniformBuffer;
		case TypedBuffer: return is_mutable ? vk::DescriptorType::eStorageTexelBuffer : vk::DescriptorType::eUniformTexelBuffer;
		case RawBuffer: return vk::DescriptorType::eStorageBuffer;
		case CombinedTextureSampler: return vk::DescriptorType::eCombinedImageSampler;
		default: return std::nullopt;
	}
}

/// Size of a type, looking through arrays and buffers to the element.
std::size_t element_size(slang::TypeLayoutReflection* type)
{
	while (type)
	{
		if (auto size = type->getSize(); size > 0)
		{
			return size;
		}
		auto* element = type->getElementTypeLayout();
		if (element == type)
		{
			break;
		}
		type = element;
	}
	return 0;
}

std::vector<DescriptorInfo> reflect_descriptors(slang::ProgramLayout* layout, vk::ShaderStageFlagBits stage)
{
	std::vector<DescriptorInfo> out;
	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param = layout->getParameterByIndex(i);
		auto* type = param->getTypeLayout();
		for (unsigned r = 0; r < type->getBindingRangeCount(); r++)
		{
			auto vk_type = to_vk_descriptor_type(type->getBindingRangeType(r));
			if (!vk_type)
			{
				continue;
			}
			auto* leaf = type->getBindingRangeLeafTypeLayout(r);
			DescriptorInfo info{
				.name = param->getName(),
				.size = leaf ? element_size(leaf) : 0,
				.binding = param->getBindingIndex() + r,
				.set = param->getBindingSpace(),
				.descriptor_count = static_cast<uint32_t>(type->getBindingRangeBindingCount(r)),
				.type = *vk_type,
				.stages = stage,
			};
			Logger::instance().trace("  set={} binding={} '{}' {} x{}", info.set, info.binding, info.name,
			                         vk::to_string(info.type), info.descriptor_count);
			out.push_back(std::move(info));
		}
	}
	return out;
}

std::optional<PushConstantInfo> reflect_push_constants(slang::ProgramLayout* layout, vk::ShaderStageFlagBits stage)
{
	for (unsigned i = 0; i < layout->getParameterCount(); i++)
	{
		auto* param = layout->getParameterByIndex(i);
		auto* type = param->getTypeLayout();
		for (unsigned r = 0; r < type->getBindingRangeCount(); r++)
		{
			if (type->getBindingRangeType(r) == slang::BindingType::PushConstant)
			{
				return PushConstantInfo{
					.name = param->getName(),
					.offset = param->getOffset(),
					.size = element_size(type),
					.stages = stage,
				};
			}
		}
	}
	return std::nullopt;
}

} // namespace

// ============================================================================
// Shader
// ============================================================================

std::expected<Shader, std::string> Shader::create(vk::Device device, std::string_view name, std::string_view entry_point)
{
	auto linked = compile(name, entry_point);
	if (!linked)
	{
		Logger::instance().error("Compiling '{}:{}' failed: {}", name, entry_point, linked.error());
		return std::unexpected(linked.error());
	}

	auto* layout = (*linked)->getLayout();
	if (!layout || layout->getEntryPointCount() == 0)
	{
		return std::unexpected(std::format("'{}' has no reflectable entry point", name));
	}
	auto stage = to_vk_stage(layout->getEntryPointByIndex(0)->getStage());

	auto module = create_module(device, linked->get());
	if (!module)
	{
		return std::unexpected(module.error());
	}

	auto descriptors = reflect_descriptors(layout, stage);
	auto push_constants = reflect_push_constants(layout, stage);
	Logger::instance().info("Shader '{}' ({}) ready: {} descriptors, {} push constants", name,
	                        vk::to_string(stage), descriptors.size(), push_constants ? push_constants->size : 0);

	return Shader{device, *module, stage, std::move(descriptors), std::move(push_constants),
	              std::string{name}, std::string{entry_point}};
}

vk::PipelineShaderStageCreateInfo Shader::stage_create_info() const
{
	return vk::PipelineShaderStageCreateInfo{}
		.setStage(m_stage)
		.setModule(m_module)
		.setPName(m_entry_point.c_str());
}

std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string>
Shader::merge_bindings(std::initializer_list<const Shader*> shaders, uint32_t set)
{
	std::vector<vk::DescriptorSetLayoutBinding> merged;
	for (const auto* shader : shaders)
	{
		for (const auto& info : shader->descriptors())
		{
			if (info.set != set)
			{
				continue;
			}
			auto existing = std::ranges::find_if(merged, [&](const auto& b) { return b.binding == info.binding; });
			if (existing == merged.end())
			{
				merged.push_back(vk::DescriptorSetLayoutBinding()
					.setBinding(info.binding)
					.setDescriptorType(info.type)
					.setDescriptorCount(info.descriptor_count)
					.setStageFlags(info.stages));
				continue;
			}
			if (existing->descriptorType != info.type)
			{
				return std::unexpected(std::format("Binding {} is {} in one stage and {} in '{}'", info.binding,
				                                   vk::to_string(existing->descriptorType), vk::to_string(info.type),
				                                   shader->name()));
			}
			existing->stageFlags |= info.stages;
		}
	}
	std::ranges::sort(merged, {}, &vk::DescriptorSetLayoutBinding::binding);
	return merged;
}

std::optional<vk::PushConstantRange> Shader::merge_push_constants(std::initializer_list<const Shader*> shaders)
{
	std::optional<vk::PushConstantRange> range;
	for (const auto* shader : shaders)
	{
		const auto& pc = shader->push_constants();
		if (!pc)
		{
			continue;
		}
		if (!range)
		{
			range = vk::PushConstantRange(pc->stages, static_cast<uint32_t>(pc->offset), static_cast<uint32_t>(pc->size));
			continue;
		}
		auto begin = std::min<uint32_t>(range->offset, static_cast<uint32_t>(pc->offset));
		auto end = std::max<uint32_t>(range->offset + range->size, static_cast<uint32_t>(pc->offset + pc->size));
		range->offset = begin;
		range->size = end - begin;
		range->stageFlags |= pc->stages;
	}
	return range;
}

Shader::~Shader()
{
	if (m_module)
	{
		m_device.destroyShaderModule(m_module);
	}
}

Shader::Shader(Shader&& other) noexcept
	: m_device(other.m_device)
	, m_module(std::exchange(other.m_module, nullptr))
	, m_stage(other.m_stage)
	, m_descriptors(std::move(other.m_descriptors))
	, m_push_constants(std::move(other.m_push_constants))
	, m_name(std::move(other.m_name))
	, m_entry_point(std::move(other.m_entry_point))
{
}

Shader& Shader::operator=(Shader&& other) noexcept
{
	if (this != &other)
	{
		if (m_module)
		{
			m_device.destroyShaderModule(m_module);
		}
		m_device = other.m_device;
		m_module = std::exchange(other.m_module, nullptr);
		m_stage = other.m_stage;
		m_descriptors = std::move(other.m_descriptors);
		m_push_constants = std::move(other.m_push_constants);
		m_name = std::move(other.m_name);
		m_entry_point = std::move(other.m_entry_point);
	}
	return *this;
}

Shader::Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage,
               std::vector<DescriptorInfo> descriptors, std::optional<PushConstantInfo> push_constants,
               std::string name, std::string entry_point)
	: m_device(device)
	, m_module(module)
	, m_stage(stage)
	, m_descriptors(std::move(descriptors))
	, m_push_constants(std::move(push_constants))
	, m_name(std::move(name))
	, m_entry_point(std::move(entry_point))
{
}

} // namespace evergreen::render
