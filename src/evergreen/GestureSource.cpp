#include <evergreen/GestureSource.hpp>
#include <evergreen/Logger.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace evergreen {

SyntheticGestureSource::SyntheticGestureSource(const SyntheticGestureConfig& config)
    : m_config(config)
{
}

SyntheticGestureSource::~SyntheticGestureSource() {
    stop();
}

std::expected<void, std::string> SyntheticGestureSource::start(GestureChannel& channel) {
    if (!m_config.is_valid()) {
        return std::unexpected("Invalid synthetic gesture configuration");
    }
    if (running()) {
        return std::unexpected("Gesture source already running");
    }

    m_worker = std::jthread([this, &channel](std::stop_token token) {
        run(std::move(token), channel);
    });

    Logger::instance().info("Gesture source '{}' started", name());
    return {};
}

void SyntheticGestureSource::stop() {
    if (!m_worker.joinable()) {
        return;
    }
    m_worker.request_stop();
    m_worker.join();
    m_worker = std::jthread();
    Logger::instance().info("Gesture source '{}' stopped", name());
}

std::array<glm::vec2, HAND_LANDMARK_COUNT> SyntheticGestureSource::landmarks_at(float seconds) const {
    // Camera space: mirrored, so the wrist sits at 1 - x of the intended position
    float wrist_x = 0.5f + std::sin(seconds * glm::two_pi<float>() / m_config.sweep_period) * m_config.sweep_amplitude;
    bool open = static_cast<int>(seconds / m_config.toggle_period) % 2 == 1;
    float ratio = open ? m_config.open_ratio : m_config.closed_ratio;

    constexpr float PALM = 0.12f;
    std::array<glm::vec2, HAND_LANDMARK_COUNT> points{};
    const glm::vec2 wrist{1.0f - wrist_x, 0.8f};
    points.fill(wrist);

    // Fingers fan upward; landmark 4 + 4k is a tip, 1 + 4k its knuckle
    for (int finger = 1; finger <= 4; finger++) {
        float angle = glm::half_pi<float>() + (static_cast<float>(finger) - 2.5f) * 0.25f;
        glm::vec2 direction{std::cos(angle), -std::sin(angle)};
        for (int joint = 1; joint <= 4; joint++) {
            float reach = PALM * (1.0f + (ratio - 1.0f) * static_cast<float>(joint - 1) / 3.0f);
            points[static_cast<std::size_t>(finger * 4 + joint)] = wrist + direction * reach;
        }
    }
    // Thumb is not measured
    for (std::size_t joint = 1; joint <= 4; joint++) {
        points[joint] = wrist + glm::vec2(-0.03f * static_cast<float>(joint), -0.02f * static_cast<float>(joint));
    }
    return points;
}

void SyntheticGestureSource::run(std::stop_token token, GestureChannel& channel) const {
    using clock = std::chrono::steady_clock;
    const auto started = clock::now();
    auto next = started;

    while (!token.stop_requested()) {
        float seconds = std::chrono::duration<float>(clock::now() - started).count();
        auto landmarks = landmarks_at(seconds);
        if (auto sample = measure_hand(landmarks)) {
            channel.publish(*sample);
        }

        next += m_config.interval;
        std::this_thread::sleep_until(next);
    }
}

} // namespace evergreen
