#pragma once

#include "SceneRenderer.hpp"
#include "VulkanContext.hpp"
#include "Window.hpp"
#include <evergreen/Camera3D.hpp>
#include <evergreen/GestureSource.hpp>
#include <evergreen/HolidayScene.hpp>
#include <evergreen/UICallback.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace evergreen::render {

/**
 * @brief Viewer settings
 */
struct ViewerConfig {
    uint32_t window_width = 1280;
    uint32_t window_height = 720;
    std::string window_title = "Evergreen";

    SceneConfig scene;
    CameraConfig camera;
    SyntheticGestureConfig gesture;
    bool start_gesture_source = false;

    float click_slop = 5.0f;          ///< Pixels a press may travel and still count as a click
    float max_delta_time = 0.1f;      ///< Longer frames (window drags, breakpoints) are clamped
};

/**
 * @brief Owns the window, renderer and scene and runs the frame loop
 *
 * Input:
 * - Left click (moved less than click_slop): toggle Tree / Exploded
 * - Left drag: orbit the camera
 * - Scroll: zoom
 * - Space: toggle Tree / Exploded
 * - G: start or stop the synthetic gesture source
 * - R: reset the camera
 * - Esc: close
 *
 * Mouse input is ignored while ImGui has the cursor.
 */
class SceneApplication {
public:
    static std::expected<std::unique_ptr<SceneApplication>, std::string> create(const ViewerConfig& config = {});

    ~SceneApplication();

    SceneApplication(const SceneApplication&) = delete;
    SceneApplication& operator=(const SceneApplication&) = delete;

    /**
     * @brief Run until the window is closed
     */
    std::expected<void, std::string> run();

    /**
     * @brief Start the gesture source if stopped, stop it otherwise
     */
    void toggle_gesture_source();

    [[nodiscard]] HolidayScene& scene() { return *m_scene; }

private:
    explicit SceneApplication(const ViewerConfig& config);

    std::expected<void, std::string> initialize();
    std::expected<void, std::string> setup_imgui();
    std::expected<void, std::string> handle_swapchain_change();

    void render_ui();
    void render_ui_callbacks(const std::vector<UICallback>& callbacks);
    void shutdown_imgui();

    friend void glfw_key_callback(GLFWwindow* window, int key, int scancode, int action, int mods);
    friend void glfw_mouse_button_callback(GLFWwindow* window, int button, int action, int mods);
    friend void glfw_cursor_callback(GLFWwindow* window, double xpos, double ypos);
    friend void glfw_scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
    friend void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

    ViewerConfig m_config;

    // Destroyed bottom-up: GPU objects before the context, the context before GLFW
    std::unique_ptr<GlfwSession> m_glfw;
    std::unique_ptr<VulkanContext> m_context;
    std::unique_ptr<Window> m_window;
    std::unique_ptr<HolidayScene> m_scene;
    std::unique_ptr<SceneRenderer> m_renderer;
    std::unique_ptr<Camera3D> m_camera;
    std::unique_ptr<GestureSource> m_gesture_source;

    // Drag tracking for click-vs-orbit
    bool m_left_down = false;
    double m_last_x = 0.0;
    double m_last_y = 0.0;
    double m_drag_distance = 0.0;

    vk::DescriptorPool m_imgui_descriptor_pool;
    bool m_imgui_ready = false;
    uint64_t m_swapchain_generation = 0;
};

} // namespace evergreen::render
