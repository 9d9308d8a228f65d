//
// Created by chris on 1/7/26.
//

#ifndef EVERGREEN_RENDER_SHADER_HPP
#define EVERGREEN_RENDER_SHADER_HPP
#include <cstddef>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <slang.h>

#include "VulkanCommon.hpp"

namespace evergreen::render
{

/**
 * @brief One descriptor binding found by reflection
 */
struct DescriptorInfo
{
	std::string name;
	std::size_t size;             ///< Bytes per element, 0 if unsized
	uint32_t binding;
	uint32_t set;
	uint32_t descriptor_count;    ///< 1 if not an array
	vk::DescriptorType type;
	vk::ShaderStageFlags stages;
};

struct PushConstantInfo
{
	std::string name;
	std::size_t offset;
	std::size_t size;
	vk::ShaderStageFlags stages;
};

/**
 * @brief Compiled Slang entry point wrapped in a vk::ShaderModule
 *
 * Modules are looked up relative to SHADER_DIR. Compilation happens at
 * runtime through a process-wide Slang session targeting SPIR-V 1.5.
 */
class Shader
{
public:
	/**
	 * @brief Compile entry point @p entry_point of module @p name
	 *
	 * @param name Module path below SHADER_DIR without extension,
	 *             e.g. "instanced/instanced_vert"
	 */
	static std::expected<Shader, std::string> create(vk::Device device, std::string_view name,
	                                                 std::string_view entry_point = "main");

	[[nodiscard]] vk::ShaderStageFlagBits stage() const { return m_stage; }
	[[nodiscard]] vk::ShaderModule module() const { return m_module; }
	[[nodiscard]] const std::vector<DescriptorInfo>& descriptors() const { return m_descriptors; }
	[[nodiscard]] const std::optional<PushConstantInfo>& push_constants() const { return m_push_constants; }
	[[nodiscard]] const std::string& name() const { return m_name; }

	[[nodiscard]] vk::PipelineShaderStageCreateInfo stage_create_info() const;

	/**
	 * @brief Union of the descriptor bindings of several stages
	 *
	 * Bindings that share (set, binding) are merged and their stage flags
	 * OR-ed; conflicting descriptor types are an error.
	 */
	static std::expected<std::vector<vk::DescriptorSetLayoutBinding>, std::string>
	merge_bindings(std::initializer_list<const Shader*> shaders, uint32_t set = 0);

	/**
	 * @brief One push constant range covering every stage that declares one
	 */
	static std::optional<vk::PushConstantRange> merge_push_constants(std::initializer_list<const Shader*> shaders);

	Shader(const Shader&) = delete;
	Shader& operator=(const Shader&) = delete;
	Shader(Shader&& other) noexcept;
	Shader& operator=(Shader&& other) noexcept;
	~Shader();

private:
	Shader(vk::Device device, vk::ShaderModule module, vk::ShaderStageFlagBits stage,
	       std::vector<DescriptorInfo> descriptors, std::optional<PushConstantInfo> push_constants,
	       std::string name, std::string entry_point);

	vk::Device m_device;
	vk::ShaderModule m_module;
	vk::ShaderStageFlagBits m_stage;
	std::vector<DescriptorInfo> m_descriptors;
	std::optional<PushConstantInfo> m_push_constants;
	std::string m_name;
	std::string m_entry_point;
};

} // namespace evergreen::render

#endif // EVERGREEN_RENDER_SHADER_HPP
