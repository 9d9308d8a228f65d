#include <evergreen/render/Window.hpp>
#include <evergreen/Logger.hpp>
#include <algorithm>
#include <array>
#include <format>

namespace evergreen::render {

namespace {

void glfw_error_callback(int code, const char* description) {
    Logger::instance().error("GLFW error {}: {}", code, description);
}

vk::ImageSubresourceRange single_level(vk::ImageAspectFlags aspect) {
    return vk::ImageSubresourceRange()
        .setAspectMask(aspect)
        .setBaseMipLevel(0)
        .setLevelCount(1)
        .setBaseArrayLayer(0)
        .setLayerCount(1);
}

} // namespace

std::expected<std::unique_ptr<GlfwSession>, std::string> GlfwSession::create() {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        return std::unexpected("Failed to initialize GLFW");
    }
    if (!glfwVulkanSupported()) {
        glfwTerminate();
        return std::unexpected("GLFW found no Vulkan loader");
    }
    return std::unique_ptr<GlfwSession>(new GlfwSession());
}

GlfwSession::~GlfwSession() {
    glfwTerminate();
}

std::expected<std::unique_ptr<Window>, std::string> Window::create(
    const VulkanContext& context,
    int width,
    int height,
    std::string_view title
) {
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    std::string owned_title{title};
    GLFWwindow* handle = glfwCreateWindow(width, height, owned_title.c_str(), nullptr, nullptr);
    if (!handle) {
        return std::unexpected("Failed to create GLFW window");
    }

    std::unique_ptr<Window> window{new Window(context, handle, width, height)};
    if (auto result = window->create_surface(); !result) return std::unexpected(result.error());

    auto present_res = context.physical_device().getSurfaceSupportKHR(context.graphics_family(), window->m_surface);
    CHECK_VK_RESULT(present_res, "Could not query present support: {}");
    if (!present_res.value) {
        return std::unexpected("Graphics queue family cannot present to this surface");
    }

    if (auto result = window->create_swapchain(); !result) return std::unexpected(result.error());
    if (auto result = window->create_depth_resources(); !result) return std::unexpected(result.error());
    if (auto result = window->create_render_pass(); !result) return std::unexpected(result.error());
    if (auto result = window->create_framebuffers(); !result) return std::unexpected(result.error());

    Logger::instance().info("Window {}x{} with {} swapchain images", window->m_extent.width,
                            window->m_extent.height, window->image_count());
    return window;
}

Window::Window(const VulkanContext& context, GLFWwindow* handle, int width, int height)
    : m_handle(handle)
    , m_width(width)
    , m_height(height)
    , m_context(&context)
    , m_device(context.device())
{
}

Window::~Window() {
    if (m_device) {
        destroy_swapchain();
        if (m_render_pass) {
            m_device.destroyRenderPass(m_render_pass);
        }
    }
    if (m_surface) {
        m_context->instance().destroySurfaceKHR(m_surface);
    }
    if (m_handle) {
        glfwDestroyWindow(m_handle);
    }
}

bool Window::should_close() const {
    return glfwWindowShouldClose(m_handle);
}

void Window::request_close() {
    glfwSetWindowShouldClose(m_handle, GLFW_TRUE);
}

std::expected<void, std::string> Window::create_surface() {
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    VkResult result = glfwCreateWindowSurface(static_cast<VkInstance>(m_context->instance()), m_handle, nullptr, &surface);
    if (result != VK_SUCCESS) {
        return std::unexpected(std::format("Failed to create window surface: {}", to_string(vk::Result(result))));
    }
    m_surface = vk::SurfaceKHR(surface);
    return {};
}

std::expected<void, std::string> Window::create_swapchain() {
    auto physical_device = m_context->physical_device();

    auto capabilities_res = physical_device.getSurfaceCapabilitiesKHR(m_surface);
    CHECK_VK_RESULT(capabilities_res, "Could not query surface capabilities: {}");
    auto formats_res = physical_device.getSurfaceFormatsKHR(m_surface);
    CHECK_VK_RESULT(formats_res, "Could not query surface formats: {}");
    auto modes_res = physical_device.getSurfacePresentModesKHR(m_surface);
    CHECK_VK_RESULT(modes_res, "Could not query present modes: {}");
    if (formats_res.value.empty() || modes_res.value.empty()) {
        return std::unexpected("Surface offers no formats or present modes");
    }

    const auto& capabilities = capabilities_res.value;
    m_surface_format = choose_surface_format(formats_res.value);
    m_present_mode = choose_present_mode(modes_res.value);
    m_extent = choose_extent(capabilities);

    uint32_t image_count = capabilities.minImageCount + 1;
    if (capabilities.maxImageCount > 0) {
        image_count = std::min(image_count, capabilities.maxImageCount);
    }

    auto swapchain_info = vk::SwapchainCreateInfoKHR()
        .setSurface(m_surface)
        .setMinImageCount(image_count)
        .setImageFormat(m_surface_format.format)
        .setImageColorSpace(m_surface_format.colorSpace)
        .setImageExtent(m_extent)
        .setImageArrayLayers(1)
        .setImageUsage(vk::ImageUsageFlagBits::eColorAttachment)
        .setImageSharingMode(vk::SharingMode::eExclusive)
        .setPreTransform(capabilities.currentTransform)
        .setCompositeAlpha(vk::CompositeAlphaFlagBitsKHR::eOpaque)
        .setPresentMode(m_present_mode)
        .setClipped(true);

    auto swapchain_res = m_device.createSwapchainKHR(swapchain_info);
    CHECK_VK_RESULT(swapchain_res, "Could not create swapchain: {}");
    m_swapchain = swapchain_res.value;

    auto images_res = m_device.getSwapchainImagesKHR(m_swapchain);
    CHECK_VK_RESULT(images_res, "Could not get swapchain images: {}");
    m_swapchain_images = std::move(images_res.value);

    m_image_views.clear();
    for (const auto& image : m_swapchain_images) {
        auto view_info = vk::ImageViewCreateInfo()
            .setImage(image)
            .setViewType(vk::ImageViewType::e2D)
            .setFormat(m_surface_format.format)
            .setSubresourceRange(single_level(vk::ImageAspectFlagBits::eColor));
        auto view_res = m_device.createImageView(view_info);
        CHECK_VK_RESULT(view_res, "Could not create swapchain image view: {}");
        m_image_views.push_back(view_res.value);
    }
    return {};
}

std::expected<void, std::string> Window::create_depth_resources() {
    auto format = find_depth_format();
    if (!format) {
        return std::unexpected("No supported depth format");
    }
    m_depth_format = *format;

    auto image_info = vk::ImageCreateInfo()
        .setImageType(vk::ImageType::e2D)
        .setExtent(vk::Extent3D(m_extent.width, m_extent.height, 1))
        .setMipLevels(1)
        .setArrayLayers(1)
        .setFormat(m_depth_format)
        .setTiling(vk::ImageTiling::eOptimal)
        .setInitialLayout(vk::ImageLayout::eUndefined)
        .setUsage(vk::ImageUsageFlagBits::eDepthStencilAttachment)
        .setSharingMode(vk::SharingMode::eExclusive)
        .setSamples(vk::SampleCountFlagBits::e1);

    auto image_res = m_device.createImage(image_info);
    CHECK_VK_RESULT(image_res, "Could not create depth image: {}");
    m_depth_image = image_res.value;

    auto requirements = m_device.getImageMemoryRequirements(m_depth_image);
    auto memory_type = m_context->find_memory_type(requirements.memoryTypeBits, vk::MemoryPropertyFlagBits::eDeviceLocal);
    if (!memory_type) {
        return std::unexpected(std::format("Depth buffer: {}", memory_type.error()));
    }

    auto memory_res = m_device.allocateMemory(vk::MemoryAllocateInfo()
        .setAllocationSize(requirements.size)
        .setMemoryTypeIndex(*memory_type));
    CHECK_VK_RESULT(memory_res, "Could not allocate depth memory: {}");
    m_depth_memory = memory_res.value;

    auto bind_res = m_device.bindImageMemory(m_depth_image, m_depth_memory, 0);
    CHECK_VK_RESULT_VOID(bind_res, "Could not bind depth memory: {}");

    auto view_res = m_device.createImageView(vk::ImageViewCreateInfo()
        .setImage(m_depth_image)
        .setViewType(vk::ImageViewType::e2D)
        .setFormat(m_depth_format)
        .setSubresourceRange(single_level(vk::ImageAspectFlagBits::eDepth)));
    CHECK_VK_RESULT(view_res, "Could not create depth view: {}");
    m_depth_view = view_res.value;
    return {};
}

std::expected<void, std::string> Window::create_render_pass() {
    std::array<vk::AttachmentDescription, 2> attachments = {
        vk::AttachmentDescription()
            .setFormat(m_surface_format.format)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setLoadOp(vk::AttachmentLoadOp::eClear)
            .setStoreOp(vk::AttachmentStoreOp::eStore)
            .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
            .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setInitialLayout(vk::ImageLayout::eUndefined)
            .setFinalLayout(vk::ImageLayout::ePresentSrcKHR),
        vk::AttachmentDescription()
            .setFormat(m_depth_format)
            .setSamples(vk::SampleCountFlagBits::e1)
            .setLoadOp(vk::AttachmentLoadOp::eClear)
            .setStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setStencilLoadOp(vk::AttachmentLoadOp::eDontCare)
            .setStencilStoreOp(vk::AttachmentStoreOp::eDontCare)
            .setInitialLayout(vk::ImageLayout::eUndefined)
            .setFinalLayout(vk::ImageLayout::eDepthStencilAttachmentOptimal)
    };

    auto color_ref = vk::AttachmentReference(0, vk::ImageLayout::eColorAttachmentOptimal);
    auto depth_ref = vk::AttachmentReference(1, vk::ImageLayout::eDepthStencilAttachmentOptimal);

    auto subpass = vk::SubpassDescription()
        .setPipelineBindPoint(vk::PipelineBindPoint::eGraphics)
        .setColorAttachments(color_ref)
        .setPDepthStencilAttachment(&depth_ref);

    constexpr auto stages = vk::PipelineStageFlagBits::eColorAttachmentOutput |
                            vk::PipelineStageFlagBits::eEarlyFragmentTests;
    auto dependency = vk::SubpassDependency()
        .setSrcSubpass(VK_SUBPASS_EXTERNAL)
        .setDstSubpass(0)
        .setSrcStageMask(stages)
        .setDstStageMask(stages)
        .setDstAccessMask(vk::AccessFlagBits::eColorAttachmentWrite |
                          vk::AccessFlagBits::eDepthStencilAttachmentWrite);

    auto render_pass_res = m_device.createRenderPass(vk::RenderPassCreateInfo()
        .setAttachments(attachments)
        .setSubpasses(subpass)
        .setDependencies(dependency));
    CHECK_VK_RESULT(render_pass_res, "Could not create render pass: {}");
    m_render_pass = render_pass_res.value;
    return {};
}

std::expected<void, std::string> Window::create_framebuffers() {
    m_framebuffers.clear();
    for (const auto& view : m_image_views) {
        std::array<vk::ImageView, 2> attachments = {view, m_depth_view};
        auto framebuffer_res = m_device.createFramebuffer(vk::FramebufferCreateInfo()
            .setRenderPass(m_render_pass)
            .setAttachments(attachments)
            .setWidth(m_extent.width)
            .setHeight(m_extent.height)
            .setLayers(1));
        CHECK_VK_RESULT(framebuffer_res, "Could not create framebuffer: {}");
        m_framebuffers.push_back(framebuffer_res.value);
    }
    return {};
}

std::optional<vk::Format> Window::find_depth_format() const {
    for (auto format : {vk::Format::eD32Sfloat, vk::Format::eD32SfloatS8Uint, vk::Format::eD24UnormS8Uint}) {
        auto props = m_context->physical_device().getFormatProperties(format);
        if (props.optimalTilingFeatures & vk::FormatFeatureFlagBits::eDepthStencilAttachment) {
            return format;
        }
    }
    return std::nullopt;
}

std::optional<uint32_t> Window::acquire_next_image(vk::Semaphore signal_semaphore, uint64_t timeout) {
    if (m_needs_resize) {
        if (auto result = recreate_swapchain(); !result) {
            Logger::instance().error("Failed to recreate swapchain: {}", result.error());
        }
        return std::nullopt;
    }

    auto acquire_res = m_device.acquireNextImageKHR(m_swapchain, timeout, signal_semaphore, nullptr);
    switch (acquire_res.result) {
        case vk::Result::eSuccess:
            return acquire_res.value;
        case vk::Result::eSuboptimalKHR:
            // The semaphore will still be signalled, so this image must be used
            m_needs_resize = true;
            return acquire_res.value;
        case vk::Result::eErrorOutOfDateKHR:
            m_needs_resize = true;
            return std::nullopt;
        default:
            Logger::instance().error("acquireNextImageKHR failed: {}", to_string(acquire_res.result));
            return std::nullopt;
    }
}

bool Window::present(vk::Queue queue, vk::Semaphore wait_semaphore, uint32_t image_index) {
    auto present_info = vk::PresentInfoKHR()
        .setWaitSemaphores(wait_semaphore)
        .setSwapchains(m_swapchain)
        .setImageIndices(image_index);

    // vk-hpp treats eErrorOutOfDateKHR as fatal here, so go through the C entry point
    auto result = static_cast<vk::Result>(VULKAN_HPP_DEFAULT_DISPATCHER.vkQueuePresentKHR(
        static_cast<VkQueue>(queue), reinterpret_cast<const VkPresentInfoKHR*>(&present_info)));

    if (result == vk::Result::eErrorOutOfDateKHR || result == vk::Result::eSuboptimalKHR) {
        m_needs_resize = true;
        return result == vk::Result::eSuboptimalKHR;
    }
    if (result != vk::Result::eSuccess) {
        Logger::instance().error("queuePresentKHR failed: {}", to_string(result));
        return false;
    }
    return true;
}

std::expected<void, std::string> Window::recreate_swapchain() {
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    if (width == 0 || height == 0) {
        // Minimized; keep the old swapchain and check again next frame
        glfwWaitEventsTimeout(0.1);
        return {};
    }

    auto wait_res = m_device.waitIdle();
    CHECK_VK_RESULT_VOID(wait_res, "waitIdle before swapchain rebuild failed: {}");

    m_width = width;
    m_height = height;
    destroy_swapchain();

    if (auto result = create_swapchain(); !result) return result;
    if (auto result = create_depth_resources(); !result) return result;
    if (auto result = create_framebuffers(); !result) return result;

    m_needs_resize = false;
    m_generation++;
    Logger::instance().info("Swapchain recreated: {}x{}", m_extent.width, m_extent.height);
    return {};
}

void Window::destroy_swapchain() {
    for (auto framebuffer : m_framebuffers) {
        m_device.destroyFramebuffer(framebuffer);
    }
    m_framebuffers.clear();

    if (m_depth_view) {
        m_device.destroyImageView(m_depth_view);
        m_depth_view = nullptr;
    }
    if (m_depth_image) {
        m_device.destroyImage(m_depth_image);
        m_depth_image = nullptr;
    }
    if (m_depth_memory) {
        m_device.freeMemory(m_depth_memory);
        m_depth_memory = nullptr;
    }

    for (auto view : m_image_views) {
        m_device.destroyImageView(view);
    }
    m_image_views.clear();

    if (m_swapchain) {
        m_device.destroySwapchainKHR(m_swapchain);
        m_swapchain = nullptr;
    }
}

vk::SurfaceFormatKHR Window::choose_surface_format(const std::vector<vk::SurfaceFormatKHR>& formats) const {
    for (const auto& format : formats) {
        if (format.format == vk::Format::eB8G8R8A8Srgb && format.colorSpace == vk::ColorSpaceKHR::eSrgbNonlinear) {
            return format;
        }
    }
    return formats.front();
}

vk::PresentModeKHR Window::choose_present_mode(const std::vector<vk::PresentModeKHR>& modes) const {
    if (std::ranges::find(modes, vk::PresentModeKHR::eMailbox) != modes.end()) {
        return vk::PresentModeKHR::eMailbox;
    }
    return vk::PresentModeKHR::eFifo;
}

vk::Extent2D Window::choose_extent(const vk::SurfaceCapabilitiesKHR& capabilities) const {
    if (capabilities.currentExtent.width != UINT32_MAX) {
        return capabilities.currentExtent;
    }
    int width = 0;
    int height = 0;
    glfwGetFramebufferSize(m_handle, &width, &height);
    return {
        std::clamp(static_cast<uint32_t>(width), capabilities.minImageExtent.width, capabilities.maxImageExtent.width),
        std::clamp(static_cast<uint32_t>(height), capabilities.minImageExtent.height, capabilities.maxImageExtent.height)
    };
}

} // namespace evergreen::render
