#include <evergreen/StarTopper.hpp>
#include <evergreen/Damping.hpp>
#include <evergreen/Logger.hpp>
#include <glm/gtc/constants.hpp>
#include <cassert>
#include <cmath>

namespace evergreen {

namespace {

glm::vec2 polar(float angle, float radius) {
    return {std::cos(angle) * radius, std::sin(angle) * radius};
}

glm::vec2 quadratic(const glm::vec2& p0, const glm::vec2& control, const glm::vec2& p1, float t) {
    float u = 1.0f - t;
    return u * u * p0 + 2.0f * u * t * control + t * t * p1;
}

} // namespace

StarTopper::StarTopper(const TopperConfig& config)
    : m_config(config)
    , m_outline(build_outline(config))
    , m_glow(config.glow_base)
{
    m_transform.position = {0.0f, config.tree_height, 0.0f};
}

std::expected<StarTopper, std::string> StarTopper::create(const TopperConfig& config) {
    if (!config.is_valid()) {
        return std::unexpected("Invalid topper configuration");
    }
    StarTopper topper(config);
    Logger::instance().debug("Star outline has {} points", topper.m_outline.size());
    return topper;
}

std::vector<glm::vec2> StarTopper::build_outline(const TopperConfig& config) {
    const float start = glm::half_pi<float>();
    const float step = glm::two_pi<float>() / static_cast<float>(config.points);
    const float control_radius = (config.outer_radius + config.inner_radius) * 0.5f * config.control_radius_scale;

    std::vector<glm::vec2> outline;
    outline.reserve(config.points * config.samples_per_curve * 2);

    for (uint32_t i = 0; i < config.points; i++) {
        float tip_angle = start + static_cast<float>(i) * step;
        float valley_angle = tip_angle + step * 0.5f;

        glm::vec2 tip = polar(tip_angle, config.outer_radius);
        glm::vec2 valley = polar(valley_angle, config.inner_radius);
        glm::vec2 next_tip = polar(tip_angle + step, config.outer_radius);
        glm::vec2 c1 = polar(tip_angle + step * 0.2f, control_radius);
        glm::vec2 c2 = polar(valley_angle + step * 0.3f, control_radius);

        // Each curve contributes its start point; the end is the next curve's start
        for (uint32_t s = 0; s < config.samples_per_curve; s++) {
            float t = static_cast<float>(s) / static_cast<float>(config.samples_per_curve);
            outline.push_back(quadratic(tip, c1, valley, t));
        }
        for (uint32_t s = 0; s < config.samples_per_curve; s++) {
            float t = static_cast<float>(s) / static_cast<float>(config.samples_per_curve);
            outline.push_back(quadratic(valley, c2, next_tip, t));
        }
    }
    return outline;
}

float StarTopper::target_height(float elapsed, InteractionMode mode) const {
    if (mode == InteractionMode::Exploded) {
        return m_config.exploded_height;
    }
    return m_config.tree_height + std::sin(elapsed * 2.0f) * m_config.hover_amplitude;
}

void StarTopper::update(float delta_time, float elapsed, InteractionMode mode) {
    m_transform.rotation = {
        std::cos(elapsed * 1.5f) * 0.05f,
        0.0f,
        std::sin(elapsed * 2.0f) * 0.1f
    };
    m_transform.position.y = damping::step(m_transform.position.y, target_height(elapsed, mode),
                                           m_config.height_damping, delta_time);
    m_glow = m_config.glow_base + std::sin(elapsed * 3.0f) * m_config.glow_amplitude;
}

void StarTopper::publish(InstanceSink& sink, uint32_t index) const {
    assert(index < sink.capacity());
    sink.set_transform(index, m_transform);
}

} // namespace evergreen
