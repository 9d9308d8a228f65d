#include <evergreen/render/SceneApplication.hpp>
#include <evergreen/Logger.hpp>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_vulkan.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <format>

namespace evergreen::render {

void glfw_key_callback(GLFWwindow* window, int key, [[maybe_unused]] int scancode, int action, [[maybe_unused]] int mods) {
    auto* app = static_cast<SceneApplication*>(glfwGetWindowUserPointer(window));
    if (!app || action != GLFW_PRESS) return;
    if (app->m_imgui_ready && ImGui::GetIO().WantCaptureKeyboard) return;

    switch (key) {
        case GLFW_KEY_SPACE:
            app->m_scene->toggle_mode();
            break;
        case GLFW_KEY_G:
            app->toggle_gesture_source();
            break;
        case GLFW_KEY_R:
            app->m_camera->reset();
            break;
        case GLFW_KEY_ESCAPE:
            app->m_window->request_close();
            break;
        default:
            break;
    }
}

void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, [[maybe_unused]] int mods) {
    auto* app = static_cast<SceneApplication*>(glfwGetWindowUserPointer(window));
    if (!app || button != GLFW_MOUSE_BUTTON_LEFT) return;

    if (action == GLFW_PRESS) {
        if (app->m_imgui_ready && ImGui::GetIO().WantCaptureMouse) return;
        app->m_left_down = true;
        app->m_drag_distance = 0.0;
        glfwGetCursorPos(window, &app->m_last_x, &app->m_last_y);
    } else if (action == GLFW_RELEASE && app->m_left_down) {
        app->m_left_down = false;
        if (app->m_drag_distance < app->m_config.click_slop) {
            app->m_scene->toggle_mode();
        }
    }
}

void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos) {
    auto* app = static_cast<SceneApplication*>(glfwGetWindowUserPointer(window));
    if (!app || !app->m_left_down) return;

    double dx = xpos - app->m_last_x;
    double dy = ypos - app->m_last_y;
    app->m_last_x = xpos;
    app->m_last_y = ypos;
    app->m_drag_distance += std::hypot(dx, dy);

    // Small jitters during a click must not move the camera
    if (app->m_drag_distance >= app->m_config.click_slop) {
        app->m_camera->handle_mouse_movement(dx, dy);
    }
}

void glfw_scroll_callback(GLFWwindow* window, [[maybe_unused]] double xoffset, double yoffset) {
    auto* app = static_cast<SceneApplication*>(glfwGetWindowUserPointer(window));
    if (!app) return;
    if (app->m_imgui_ready && ImGui::GetIO().WantCaptureMouse) return;
    app->m_camera->handle_mouse_scroll(yoffset);
}

void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    auto* app = static_cast<SceneApplication*>(glfwGetWindowUserPointer(window));
    if (!app) return;
    app->m_window->mark_resize_needed();
    if (width > 0 && height > 0) {
        app->m_camera->handle_resize(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
    }
}

SceneApplication::SceneApplication(const ViewerConfig& config)
    : m_config(config)
{
}

SceneApplication::~SceneApplication() {
    if (m_gesture_source) {
        m_gesture_source->stop();
    }
    if (m_context && m_context->device()) {
        auto wait_res = m_context->device().waitIdle();
        if (wait_res != vk::Result::eSuccess) {
            Logger::instance().error("waitIdle on shutdown failed: {}", to_string(wait_res));
        }
    }
    shutdown_imgui();
    m_renderer.reset();
    m_window.reset();
}

std::expected<std::unique_ptr<SceneApplication>, std::string> SceneApplication::create(const ViewerConfig& config) {
    std::unique_ptr<SceneApplication> app{new SceneApplication(config)};
    if (auto result = app->initialize(); !result) {
        return std::unexpected(result.error());
    }
    return app;
}

std::expected<void, std::string> SceneApplication::initialize() {
    Logger::instance().info("Starting {}", m_config.window_title);

    auto glfw = GlfwSession::create();
    if (!glfw) return std::unexpected(glfw.error());
    m_glfw = std::move(*glfw);

    auto context = VulkanContext::create(m_config.window_title);
    if (!context) return std::unexpected(std::format("Vulkan context: {}", context.error()));
    m_context = std::move(*context);

    auto window = Window::create(*m_context, static_cast<int>(m_config.window_width),
                                 static_cast<int>(m_config.window_height), m_config.window_title);
    if (!window) return std::unexpected(std::format("Window: {}", window.error()));
    m_window = std::move(*window);
    m_swapchain_generation = m_window->swapchain_generation();

    auto scene = HolidayScene::create(m_config.scene);
    if (!scene) return std::unexpected(std::format("Scene: {}", scene.error()));
    m_scene = std::move(*scene);

    auto renderer = SceneRenderer::create(*m_context, m_window->render_pass(), m_window->image_count(), *m_scene);
    if (!renderer) return std::unexpected(std::format("Renderer: {}", renderer.error()));
    m_renderer = std::move(*renderer);

    m_camera = std::make_unique<Camera3D>(m_window->extent().width, m_window->extent().height, m_config.camera);

    // Coming back together frames the tree again
    m_scene->controller().on_mode_changed([camera = m_camera.get()](InteractionMode, InteractionMode current) {
        if (current == InteractionMode::Tree) {
            camera->reset();
        }
    });

    m_gesture_source = std::make_unique<SyntheticGestureSource>(m_config.gesture);

    // Installed before ImGui so its GLFW backend chains to these
    GLFWwindow* handle = m_window->handle();
    glfwSetWindowUserPointer(handle, this);
    glfwSetKeyCallback(handle, glfw_key_callback);
    glfwSetMouseButtonCallback(handle, glfw_mouse_button_callback);
    glfwSetCursorPosCallback(handle, glfw_cursor_callback);
    glfwSetScrollCallback(handle, glfw_scroll_callback);
    glfwSetFramebufferSizeCallback(handle, glfw_framebuffer_size_callback);

    if (auto result = setup_imgui(); !result) {
        return result;
    }

    if (m_config.start_gesture_source) {
        toggle_gesture_source();
    }
    return {};
}

std::expected<void, std::string> SceneApplication::setup_imgui() {
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();

    std::array pool_sizes = {
        vk::DescriptorPoolSize(vk::DescriptorType::eCombinedImageSampler, 16),
        vk::DescriptorPoolSize(vk::DescriptorType::eUniformBuffer, 16),
        vk::DescriptorPoolSize(vk::DescriptorType::eStorageBuffer, 16),
    };
    auto pool_res = m_context->device().createDescriptorPool(vk::DescriptorPoolCreateInfo()
        .setFlags(vk::DescriptorPoolCreateFlagBits::eFreeDescriptorSet)
        .setMaxSets(16)
        .setPoolSizes(pool_sizes));
    CHECK_VK_RESULT(pool_res, "Failed to create ImGui descriptor pool: {}");
    m_imgui_descriptor_pool = pool_res.value;

    if (!ImGui_ImplGlfw_InitForVulkan(m_window->handle(), true)) {
        return std::unexpected("ImGui GLFW backend failed to initialize");
    }

    ImGui_ImplVulkan_InitInfo init_info{};
    init_info.Instance = static_cast<VkInstance>(m_context->instance());
    init_info.PhysicalDevice = static_cast<VkPhysicalDevice>(m_context->physical_device());
    init_info.Device = static_cast<VkDevice>(m_context->device());
    init_info.QueueFamily = m_context->graphics_family();
    init_info.Queue = static_cast<VkQueue>(m_context->graphics_queue());
    init_info.DescriptorPool = static_cast<VkDescriptorPool>(m_imgui_descriptor_pool);
    init_info.MinImageCount = 2;
    init_info.ImageCount = m_window->image_count();
    init_info.MSAASamples = VK_SAMPLE_COUNT_1_BIT;
    init_info.RenderPass = static_cast<VkRenderPass>(m_window->render_pass());

    if (!ImGui_ImplVulkan_Init(&init_info)) {
        return std::unexpected("ImGui Vulkan backend failed to initialize");
    }
    ImGui_ImplVulkan_CreateFontsTexture();
    m_imgui_ready = true;
    return {};
}

void SceneApplication::shutdown_imgui() {
    if (m_imgui_ready) {
        ImGui_ImplVulkan_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        m_imgui_ready = false;
    }
    if (m_imgui_descriptor_pool) {
        m_context->device().destroyDescriptorPool(m_imgui_descriptor_pool);
        m_imgui_descriptor_pool = nullptr;
    }
}

void SceneApplication::toggle_gesture_source() {
    if (m_gesture_source->running()) {
        m_gesture_source->stop();
        m_scene->stop_gestures();
        return;
    }
    if (auto result = m_gesture_source->start(m_scene->gesture_channel()); !result) {
        Logger::instance().warn("Gesture source '{}' unavailable: {}", m_gesture_source->name(), result.error());
    }
}

void SceneApplication::render_ui_callbacks(const std::vector<UICallback>& callbacks) {
    for (const auto& callback : callbacks) {
        switch (callback.get_callback_type()) {
            case CallbackType::Continuous: {
                const auto* cb = callback.as_continuous();
                float value = cb->getter();
                int flags = cb->logarithmic ? ImGuiSliderFlags_Logarithmic : 0;
                if (ImGui::SliderFloat(callback.field_name.c_str(), &value, cb->min, cb->max, "%.3f", flags)) {
                    cb->setter(value);
                }
                break;
            }
            case CallbackType::Discrete: {
                const auto* cb = callback.as_discrete();
                int value = cb->getter();
                if (ImGui::SliderInt(callback.field_name.c_str(), &value, cb->min, cb->max)) {
                    cb->setter(value);
                }
                break;
            }
            case CallbackType::Toggle: {
                const auto* cb = callback.as_toggle();
                bool value = cb->getter();
                if (ImGui::Checkbox(callback.field_name.c_str(), &value)) {
                    cb->setter(value);
                }
                break;
            }
        }
    }
}

void SceneApplication::render_ui() {
    ImGui::SetNextWindowPos(ImVec2(10.0f, 10.0f), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(360.0f, 0.0f), ImGuiCond_FirstUseEver);
    ImGui::Begin("Evergreen");

    const auto& scene = *m_scene;
    ImGui::Text("Mode: %s", to_string(scene.current_mode()).data());
    ImGui::Text("Rotation speed: %.2f", scene.rotation_speed());
    ImGui::Text("Snow landed: %u / %u", scene.snow().landed_count(), scene.snow().size());

    const auto& mapper = scene.gesture_mapper();
    if (m_gesture_source->running()) {
        ImGui::Text("Gesture (%s): hand %s, ratio %.2f, x %.2f", m_gesture_source->name().data(),
                    mapper.hand_open() ? "open" : "closed", mapper.smoothed_ratio(), mapper.smoothed_x());
    } else {
        ImGui::TextDisabled("Gesture: off (G to start)");
    }

    if (ImGui::Button(scene.current_mode() == InteractionMode::Tree ? "Explode" : "Assemble")) {
        m_scene->toggle_mode();
    }
    ImGui::SameLine();
    if (ImGui::Button(m_gesture_source->running() ? "Stop Gestures" : "Start Gestures")) {
        toggle_gesture_source();
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset Camera")) {
        m_camera->reset();
    }

    ImGui::Separator();
    for (const auto& group : m_scene->get_ui_callback_groups()) {
        if (group.callbacks.empty()) {
            continue;
        }
        ImGui::PushID(group.title.c_str());
        if (ImGui::CollapsingHeader(group.title.c_str())) {
            render_ui_callbacks(group.callbacks);
        }
        ImGui::PopID();
    }

    ImGui::Separator();
    ImGui::Text("Click: toggle  Drag: orbit  Scroll: zoom  Space: toggle");
    ImGui::Text("Camera: dist %.1f  az %.0f  el %.0f", m_camera->distance(), m_camera->azimuth(), m_camera->elevation());
    ImGui::Text("FPS: %.1f  instances: %u", ImGui::GetIO().Framerate, m_renderer->instance_count());
    ImGui::End();
}

std::expected<void, std::string> SceneApplication::handle_swapchain_change() {
    if (m_window->swapchain_generation() == m_swapchain_generation) {
        return {};
    }
    m_swapchain_generation = m_window->swapchain_generation();
    ImGui_ImplVulkan_SetMinImageCount(2);
    m_camera->handle_resize(m_window->extent().width, m_window->extent().height);
    return m_renderer->handle_swapchain_recreation(m_window->image_count());
}

std::expected<void, std::string> SceneApplication::run() {
    Logger::instance().info("Entering frame loop");

    auto last_time = std::chrono::steady_clock::now();
    const auto queue = m_context->graphics_queue();

    while (!m_window->should_close()) {
        auto now = std::chrono::steady_clock::now();
        float delta_time = std::min(std::chrono::duration<float>(now - last_time).count(), m_config.max_delta_time);
        last_time = now;

        glfwPollEvents();

        m_scene->tick(delta_time);
        m_camera->advance_auto_rotation(m_scene->rotation_speed(), delta_time);

        ImGui_ImplVulkan_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();
        render_ui();
        ImGui::Render();

        auto image_available = m_renderer->begin_frame();
        if (!image_available) return std::unexpected(image_available.error());

        auto image_index = m_window->acquire_next_image(*image_available);
        if (auto changed = handle_swapchain_change(); !changed) return changed;
        if (!image_index) {
            continue;
        }

        FrameInfo info{
            .image_index = *image_index,
            .image_available = *image_available,
            .framebuffer = m_window->framebuffer(*image_index),
            .extent = m_window->extent(),
            .render_pass = m_window->render_pass(),
            .camera = *m_camera,
            .imgui_draw_data = ImGui::GetDrawData(),
        };

        auto finished = m_renderer->render_frame(*m_scene, info, queue);
        if (!finished) return std::unexpected(finished.error());

        if (!m_window->present(queue, *finished, *image_index)) {
            Logger::instance().debug("Present reported an outdated swapchain");
        }
    }

    auto wait_res = m_context->device().waitIdle();
    CHECK_VK_RESULT_VOID(wait_res, "waitIdle after frame loop failed: {}");
    Logger::instance().info("Frame loop finished after {} ticks", m_scene->frame());
    return {};
}

} // namespace evergreen::render
