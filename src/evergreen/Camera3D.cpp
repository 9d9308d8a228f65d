#include <evergreen/Camera3D.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace evergreen {

namespace {

float wrap_degrees(float angle) {
    angle = std::fmod(angle, 360.0f);
    return angle < 0.0f ? angle + 360.0f : angle;
}

} // namespace

Camera3D::Camera3D(uint32_t viewport_width, uint32_t viewport_height, const CameraConfig& config)
    : m_config(config)
    , m_aspect_ratio(static_cast<float>(viewport_width) / static_cast<float>(std::max(viewport_height, 1u)))
{
    reset();
}

void Camera3D::reset() {
    glm::vec3 offset = m_config.home_eye - m_config.target;
    float horizontal = std::sqrt(offset.x * offset.x + offset.z * offset.z);

    m_distance = std::clamp(glm::length(offset), m_config.min_distance, m_config.max_distance);
    m_elevation = std::clamp(glm::degrees(std::atan2(offset.y, horizontal)),
                             m_config.min_elevation, m_config.max_elevation);
    m_azimuth = wrap_degrees(glm::degrees(std::atan2(offset.z, offset.x)));
    m_view_dirty = true;
}

glm::vec3 Camera3D::eye() const {
    float azimuth_rad = glm::radians(m_azimuth);
    float elevation_rad = glm::radians(m_elevation);

    return m_config.target + m_distance * glm::vec3(
        std::cos(elevation_rad) * std::cos(azimuth_rad),
        std::sin(elevation_rad),
        std::cos(elevation_rad) * std::sin(azimuth_rad)
    );
}

void Camera3D::update_view_matrix() {
    if (!m_view_dirty) return;
    m_view_matrix = glm::lookAt(eye(), m_config.target, glm::vec3(0.0f, 1.0f, 0.0f));
    m_view_dirty = false;
}

void Camera3D::update_projection_matrix() {
    if (!m_projection_dirty) return;

    // GLM_FORCE_DEPTH_ZERO_TO_ONE gives Vulkan's [0, 1] depth range
    m_projection_matrix = glm::perspective(
        glm::radians(m_config.fov),
        m_aspect_ratio,
        m_config.near_plane,
        m_config.far_plane
    );
    m_projection_dirty = false;
}

glm::mat4 Camera3D::view_matrix() {
    update_view_matrix();
    return m_view_matrix;
}

glm::mat4 Camera3D::projection_matrix() {
    update_projection_matrix();
    return m_projection_matrix;
}

glm::mat4 Camera3D::view_projection_matrix() {
    update_view_matrix();
    update_projection_matrix();
    return m_projection_matrix * m_view_matrix;
}

glm::vec3 Camera3D::position() {
    return eye();
}

void Camera3D::handle_mouse_movement(double xoffset, double yoffset) {
    set_rotation(
        m_azimuth + static_cast<float>(xoffset) * m_config.mouse_sensitivity,
        m_elevation + static_cast<float>(yoffset) * m_config.mouse_sensitivity
    );
}

void Camera3D::handle_mouse_scroll(double yoffset) {
    set_distance(m_distance - static_cast<float>(yoffset) * m_config.scroll_sensitivity);
}

void Camera3D::handle_resize(uint32_t width, uint32_t height) {
    if (height == 0) return;
    m_aspect_ratio = static_cast<float>(width) / static_cast<float>(height);
    m_projection_dirty = true;
}

void Camera3D::advance_auto_rotation(float speed, float delta_time) {
    if (delta_time <= 0.0f || speed == 0.0f) return;
    m_azimuth = wrap_degrees(m_azimuth - speed * m_config.degrees_per_speed * delta_time);
    m_view_dirty = true;
}

void Camera3D::set_distance(float distance) {
    m_distance = std::clamp(distance, m_config.min_distance, m_config.max_distance);
    m_view_dirty = true;
}

void Camera3D::set_rotation(float azimuth, float elevation) {
    m_azimuth = wrap_degrees(azimuth);
    m_elevation = std::clamp(elevation, m_config.min_elevation, m_config.max_elevation);
    m_view_dirty = true;
}

} // namespace evergreen
