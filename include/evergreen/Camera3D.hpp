#pragma once

#include "Camera.hpp"

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cstdint>

namespace evergreen {

/**
 * @brief Orbit limits and home pose
 */
struct CameraConfig {
    glm::vec3 home_eye{0.0f, 5.0f, 25.0f};
    glm::vec3 target{0.0f};
    float fov = 45.0f;                  ///< Vertical, degrees
    float near_plane = 0.1f;
    float far_plane = 200.0f;

    float min_distance = 5.0f;
    float max_distance = 40.0f;
    float min_elevation = 0.0f;         ///< Degrees; 0 keeps the eye above the ground plane
    float max_elevation = 89.0f;

    float degrees_per_speed = 6.0f;     ///< Auto-rotation at speed 1 (one orbit per minute)
    float mouse_sensitivity = 0.25f;    ///< Degrees per pixel
    float scroll_sensitivity = 1.0f;    ///< Distance per scroll unit
};

/**
 * @brief Orbital 3D camera around a fixed focus point
 *
 * - Mouse drag orbits (azimuth/elevation), elevation clamped above the horizon
 * - Scroll zooms within [min_distance, max_distance]
 * - Auto-rotation turns the azimuth at a commanded speed
 * - No panning; the focus point stays at the scene centre
 * - Lazy matrix computation with dirty flags
 */
class Camera3D : public Camera {
public:
    explicit Camera3D(uint32_t viewport_width = 1280, uint32_t viewport_height = 720,
                      const CameraConfig& config = {});

    [[nodiscard]] glm::mat4 view_matrix();
    [[nodiscard]] glm::mat4 projection_matrix();
    [[nodiscard]] glm::mat4 view_projection_matrix() override;

    [[nodiscard]] glm::vec3 position() override;

    /**
     * @brief Handle mouse drag for orbit rotation
     *
     * @param xoffset Mouse X delta in pixels
     * @param yoffset Mouse Y delta in pixels
     */
    void handle_mouse_movement(double xoffset, double yoffset);

    /**
     * @brief Handle mouse scroll event (positive = zoom in)
     */
    void handle_mouse_scroll(double yoffset);

    void handle_resize(uint32_t width, uint32_t height) override;

    /**
     * @brief Turn around the target by speed * degrees_per_speed per second
     */
    void advance_auto_rotation(float speed, float delta_time);

    void set_distance(float distance);
    void set_rotation(float azimuth, float elevation);

    /**
     * @brief Return to the home eye position
     */
    void reset();

    [[nodiscard]] glm::vec3 eye() const;
    [[nodiscard]] glm::vec3 target() const { return m_config.target; }
    [[nodiscard]] float distance() const { return m_distance; }
    [[nodiscard]] float azimuth() const { return m_azimuth; }
    [[nodiscard]] float elevation() const { return m_elevation; }
    [[nodiscard]] float aspect_ratio() const { return m_aspect_ratio; }
    [[nodiscard]] const CameraConfig& config() const { return m_config; }

private:
    void update_view_matrix();
    void update_projection_matrix();

    CameraConfig m_config;

    // Spherical coordinates around the target
    float m_distance = 0.0f;
    float m_azimuth = 0.0f;     ///< Degrees, [0, 360)
    float m_elevation = 0.0f;   ///< Degrees

    float m_aspect_ratio;

    glm::mat4 m_view_matrix{1.0f};
    glm::mat4 m_projection_matrix{1.0f};

    bool m_view_dirty = true;
    bool m_projection_dirty = true;
};

} // namespace evergreen
