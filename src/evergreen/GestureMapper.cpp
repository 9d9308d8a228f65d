#include <evergreen/GestureMapper.hpp>
#include <evergreen/Damping.hpp>
#include <evergreen/Logger.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace evergreen {

GestureMapper::GestureMapper(const GestureConfig& config)
    : m_config(config)
    , m_smoothed_ratio(config.initial_ratio)
    , m_smoothed_x(config.center)
{
}

void GestureMapper::reset() {
    m_smoothed_ratio = m_config.initial_ratio;
    m_smoothed_x = m_config.center;
    m_last_command = 0.0f;
    m_open = false;
}

float GestureMapper::rotation_command(float wrist_x, float center, float dead_zone, float sensitivity) {
    float upper = center + dead_zone;
    float lower = center - dead_zone;

    if (wrist_x > upper) {
        return (wrist_x - upper) * sensitivity;
    }
    if (wrist_x < lower) {
        return -(lower - wrist_x) * sensitivity;
    }
    return 0.0f;
}

GestureOutput GestureMapper::process(const GestureSample& sample) {
    m_samples++;
    GestureOutput output;

    m_smoothed_ratio = damping::smooth(m_smoothed_ratio, sample.open_ratio, m_config.ratio_alpha);

    if (!m_open && m_smoothed_ratio > m_config.open_threshold) {
        m_open = true;
        output.edge = HandEdge::Opened;
        Logger::instance().debug("Hand opened (ratio {:.3f})", m_smoothed_ratio);
    } else if (m_open && m_smoothed_ratio < m_config.close_threshold) {
        m_open = false;
        output.edge = HandEdge::Closed;
        Logger::instance().debug("Hand closed (ratio {:.3f})", m_smoothed_ratio);
    }

    m_smoothed_x = damping::smooth(m_smoothed_x, sample.wrist_x, m_config.position_alpha);
    m_last_command = rotation_command(m_smoothed_x, m_config.center, m_config.dead_zone, m_config.sensitivity);
    output.rotation_command = m_last_command;

    return output;
}

std::vector<UICallback> GestureMapper::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Open Threshold", ContinuousCallback{
        .setter = [this](float v) { m_config.open_threshold = std::max(v, m_config.close_threshold + 0.01f); },
        .getter = [this]() { return m_config.open_threshold; },
        .min = 1.0f,
        .max = 2.0f
    });
    callbacks.emplace_back("Close Threshold", ContinuousCallback{
        .setter = [this](float v) { m_config.close_threshold = std::min(v, m_config.open_threshold - 0.01f); },
        .getter = [this]() { return m_config.close_threshold; },
        .min = 1.0f,
        .max = 2.0f
    });
    callbacks.emplace_back("Dead Zone", ContinuousCallback{
        .setter = [this](float v) { m_config.dead_zone = v; },
        .getter = [this]() { return m_config.dead_zone; },
        .min = 0.0f,
        .max = 0.25f
    });
    callbacks.emplace_back("Sensitivity", ContinuousCallback{
        .setter = [this](float v) { m_config.sensitivity = v; },
        .getter = [this]() { return m_config.sensitivity; },
        .min = 0.0f,
        .max = 20.0f
    });
    return callbacks;
}

std::optional<GestureSample> measure_hand(std::span<const glm::vec2> landmarks) {
    if (landmarks.size() < HAND_LANDMARK_COUNT) {
        return std::nullopt;
    }

    constexpr std::array<std::size_t, 4> tips{8, 12, 16, 20};
    constexpr std::array<std::size_t, 4> knuckles{5, 9, 13, 17};
    const glm::vec2 wrist = landmarks[0];

    float tip_sum = 0.0f;
    float knuckle_sum = 0.0f;
    for (std::size_t i = 0; i < tips.size(); i++) {
        tip_sum += glm::distance(landmarks[tips[i]], wrist);
        knuckle_sum += glm::distance(landmarks[knuckles[i]], wrist);
    }

    if (knuckle_sum <= 0.0f || !std::isfinite(tip_sum)) {
        return std::nullopt;
    }

    return GestureSample{
        .open_ratio = tip_sum / knuckle_sum,
        .wrist_x = 1.0f - wrist.x
    };
}

} // namespace evergreen
