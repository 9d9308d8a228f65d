#include <evergreen/InteractionController.hpp>
#include <evergreen/Damping.hpp>
#include <evergreen/Logger.hpp>
#include <cmath>

namespace evergreen {

InteractionController::InteractionController(const RotationConfig& config)
    : m_config(config)
    , m_speed(config.tree_idle_speed)
{
}

void InteractionController::toggle_mode() {
    request_mode(toggled(m_mode));
}

bool InteractionController::request_mode(InteractionMode mode) {
    if (mode == m_mode) {
        return false;
    }

    InteractionMode previous = m_mode;
    m_mode = mode;
    Logger::instance().info("Mode {} -> {}", to_string(previous), to_string(mode));

    for (const auto& listener : m_listeners) {
        listener(previous, mode);
    }
    return true;
}

void InteractionController::set_manual_rotation(float magnitude) {
    m_manual = std::isfinite(magnitude) ? magnitude : 0.0f;
}

void InteractionController::apply_gesture(const GestureOutput& output) {
    switch (output.edge) {
        case HandEdge::Opened:
            request_mode(InteractionMode::Exploded);
            break;
        case HandEdge::Closed:
            request_mode(InteractionMode::Tree);
            break;
        case HandEdge::None:
            break;
    }
    set_manual_rotation(output.rotation_command);
}

float InteractionController::target_rotation_speed() const {
    if (std::abs(m_manual) > m_config.manual_threshold) {
        return m_manual * m_config.manual_gain;
    }
    return m_mode == InteractionMode::Tree ? m_config.tree_idle_speed : m_config.exploded_idle_speed;
}

void InteractionController::update(float delta_time) {
    m_speed = damping::step(m_speed, target_rotation_speed(), m_config.damping, delta_time);
}

void InteractionController::on_mode_changed(ModeListener listener) {
    m_listeners.push_back(std::move(listener));
}

std::vector<UICallback> InteractionController::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Manual Gain", ContinuousCallback{
        .setter = [this](float v) { m_config.manual_gain = v; },
        .getter = [this]() { return m_config.manual_gain; },
        .min = 0.0f,
        .max = 20.0f
    });
    callbacks.emplace_back("Tree Idle Speed", ContinuousCallback{
        .setter = [this](float v) { m_config.tree_idle_speed = v; },
        .getter = [this]() { return m_config.tree_idle_speed; },
        .min = -5.0f,
        .max = 5.0f
    });
    callbacks.emplace_back("Rotation Damping", ContinuousCallback{
        .setter = [this](float v) { m_config.damping = v; },
        .getter = [this]() { return m_config.damping; },
        .min = 0.5f,
        .max = 20.0f
    });
    callbacks.emplace_back("Exploded", ToggleCallback{
        .setter = [this](bool v) { request_mode(v ? InteractionMode::Exploded : InteractionMode::Tree); },
        .getter = [this]() { return m_mode == InteractionMode::Exploded; }
    });
    return callbacks;
}

} // namespace evergreen
