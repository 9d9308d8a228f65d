//
// Created by chris on 1/6/26.
//

#ifndef EVERGREEN_RENDER_VULKANCOMMON_HPP
#define EVERGREEN_RENDER_VULKANCOMMON_HPP
#include <vulkan/vulkan.hpp>
#include <GLFW/glfw3.h>
#include <expected>
#include <format>
#include <string>

// Early-return helpers for vk-hpp calls built with VULKAN_HPP_NO_EXCEPTIONS.
// The enclosing function must return std::expected<..., std::string>.

#define CHECK_VK_RESULT(res, msg) \
if (res.result != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, to_string(res.result))); \
}

#define CHECK_VK_RESULT_VOID(res, msg) \
if (res != vk::Result::eSuccess) \
{ \
	return std::unexpected(std::format(msg, to_string(res))); \
}

namespace evergreen::render {

/// Frames the CPU may record ahead of the GPU.
inline constexpr uint32_t MAX_FRAMES_IN_FLIGHT = 2;

} // namespace evergreen::render

#endif // EVERGREEN_RENDER_VULKANCOMMON_HPP
