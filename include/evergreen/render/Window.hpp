#pragma once

#include "VulkanCommon.hpp"
#include "VulkanContext.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evergreen::render {

/**
 * @brief Keeps GLFW initialized for as long as it lives
 *
 * Create one before the VulkanContext; GLFW must know about Vulkan before
 * the instance extensions are queried.
 */
class GlfwSession {
public:
    static std::expected<std::unique_ptr<GlfwSession>, std::string> create();
    ~GlfwSession();

    GlfwSession(const GlfwSession&) = delete;
    GlfwSession& operator=(const GlfwSession&) = delete;

private:
    GlfwSession() = default;
};

/**
 * @brief GLFW window together with everything needed to present into it
 *
 * Owns the surface, swapchain, depth buffer, render pass and framebuffers
 * and rebuilds the size-dependent parts on resize or when the swapchain
 * goes out of date. Input callbacks are installed by the owner through
 * handle().
 */
class Window {
public:
    static std::expected<std::unique_ptr<Window>, std::string> create(
        const VulkanContext& context,
        int width,
        int height,
        std::string_view title
    );

    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    [[nodiscard]] bool should_close() const;
    void request_close();

    [[nodiscard]] int width() const { return m_width; }
    [[nodiscard]] int height() const { return m_height; }
    [[nodiscard]] GLFWwindow* handle() const { return m_handle; }

    [[nodiscard]] vk::RenderPass render_pass() const { return m_render_pass; }
    [[nodiscard]] vk::Extent2D extent() const { return m_extent; }
    [[nodiscard]] uint32_t image_count() const { return static_cast<uint32_t>(m_swapchain_images.size()); }
    [[nodiscard]] vk::Framebuffer framebuffer(uint32_t index) const { return m_framebuffers[index]; }

    /**
     * @brief Acquire the next swapchain image
     *
     * Returns nullopt when the swapchain had to be rebuilt (or the window is
     * minimized); the caller skips the frame and tries again.
     */
    [[nodiscard]] std::optional<uint32_t> acquire_next_image(vk::Semaphore signal_semaphore,
                                                             uint64_t timeout = UINT64_MAX);

    /**
     * @brief Queue @p image_index for presentation
     *
     * @return false if the swapchain is out of date and will be rebuilt on
     *         the next acquire
     */
    [[nodiscard]] bool present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index);

    /// Rebuild the swapchain before the next acquire.
    void mark_resize_needed() { m_needs_resize = true; }

    /// Increments every time the swapchain is rebuilt.
    [[nodiscard]] uint64_t swapchain_generation() const { return m_generation; }

private:
    Window(const VulkanContext& context, GLFWwindow* handle, int width, int height);

    std::expected<void, std::string> create_surface();
    std::expected<void, std::string> create_swapchain();
    std::expected<void, std::string> create_depth_resources();
    std::expected<void, std::string> create_render_pass();
    std::expected<void, std::string> create_framebuffers();
    std::expected<void, std::string> recreate_swapchain();

    [[nodiscard]] std::optional<vk::Format> find_depth_format() const;
    [[nodiscard]] vk::SurfaceFormatKHR choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats) const;
    [[nodiscard]] vk::PresentModeKHR choose_present_mode(const std::vector<vk::PresentModeKHR>& modes) const;
    [[nodiscard]] vk::Extent2D choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const;

    void destroy_swapchain();

    GLFWwindow* m_handle = nullptr;
    int m_width = 0;
    int m_height = 0;

    const VulkanContext* m_context = nullptr;
    vk::Device m_device;

    vk::SurfaceKHR m_surface;
    vk::SurfaceFormatKHR m_surface_format;
    vk::PresentModeKHR m_present_mode = vk::PresentModeKHR::eFifo;
    vk::SwapchainKHR m_swapchain;
    vk::Extent2D m_extent;
    std::vector<vk::Image> m_swapchain_images;
    std::vector<vk::ImageView> m_image_views;
    std::vector<vk::Framebuffer> m_framebuffers;
    vk::RenderPass m_render_pass;

    vk::Image m_depth_image;
    vk::DeviceMemory m_depth_memory;
    vk::ImageView m_depth_view;
    vk::Format m_depth_format = vk::Format::eUndefined;

    bool m_needs_resize = false;
    uint64_t m_generation = 0;
};

} // namespace evergreen::render
