//
// Created by chris on 1/6/26.
//

#ifndef EVERGREEN_RENDER_VULKANCONTEXT_HPP
#define EVERGREEN_RENDER_VULKANCONTEXT_HPP

#include "VulkanCommon.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace evergreen::render {

/**
 * @brief Instance, device and the single graphics queue
 *
 * The viewer only draws, so one queue family that supports graphics (and is
 * later checked for presentation by the window) is all that is requested.
 */
class VulkanContext
{
public:
	/**
	 * @brief Bring up Vulkan for a window titled @p title
	 *
	 * GLFW must be initialized first; its required instance extensions are
	 * enabled. Validation layers are enabled in debug builds when present.
	 */
	static std::expected<std::unique_ptr<VulkanContext>, std::string> create(std::string_view title);

	~VulkanContext();

	VulkanContext(const VulkanContext&) = delete;
	VulkanContext& operator=(const VulkanContext&) = delete;
	VulkanContext(VulkanContext&&) = delete;
	VulkanContext& operator=(VulkanContext&&) = delete;

	[[nodiscard]] vk::Instance instance() const { return m_instance; }
	[[nodiscard]] vk::PhysicalDevice physical_device() const { return m_physical_device; }
	[[nodiscard]] vk::Device device() const { return m_device; }
	[[nodiscard]] uint32_t graphics_family() const { return m_graphics_family; }
	[[nodiscard]] vk::Queue graphics_queue() const { return m_graphics_queue; }
	[[nodiscard]] bool validation_enabled() const { return m_debug_messenger != nullptr; }

	/**
	 * @brief Memory type index matching @p type_bits with all @p properties
	 */
	[[nodiscard]] std::expected<uint32_t, std::string> find_memory_type(uint32_t type_bits,
	                                                                    vk::MemoryPropertyFlags properties) const;

private:
	VulkanContext() = default;

	vk::Instance m_instance;
	vk::DebugUtilsMessengerEXT m_debug_messenger;
	vk::PhysicalDevice m_physical_device;
	uint32_t m_graphics_family = 0;
	vk::Device m_device;
	vk::Queue m_graphics_queue;
};

} // namespace evergreen::render

#endif // EVERGREEN_RENDER_VULKANCONTEXT_HPP
