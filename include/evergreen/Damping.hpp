#pragma once

#include <glm/glm.hpp>
#include <algorithm>

namespace evergreen::damping {

/**
 * @brief Blend factor of the damped-lerp law for one frame
 *
 * Returns min(1, rate * delta_time). A non-positive delta_time yields 0,
 * so a stalled frame never moves anything.
 *
 * @param rate Convergence rate in 1/s
 * @param delta_time Seconds since the previous frame
 */
[[nodiscard]] inline float blend_factor(float rate, float delta_time) {
    if (delta_time <= 0.0f || rate <= 0.0f) {
        return 0.0f;
    }
    return std::min(1.0f, rate * delta_time);
}

/**
 * @brief Move @p current toward @p target by one damped step
 *
 * current + (target - current) * min(1, rate * delta_time). The result
 * lies between current and target, so the step never overshoots.
 */
template<typename T>
[[nodiscard]] T step(const T& current, const T& target, float rate, float delta_time) {
    return current + (target - current) * blend_factor(rate, delta_time);
}

/**
 * @brief Fixed-alpha exponential filter for per-sample smoothing
 *
 * Used where updates arrive per detection frame rather than per render frame.
 */
[[nodiscard]] inline float smooth(float smoothed, float raw, float alpha) {
    return smoothed + (raw - smoothed) * std::clamp(alpha, 0.0f, 1.0f);
}

} // namespace evergreen::damping
