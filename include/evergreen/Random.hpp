#pragma once

#include <cstdint>
#include <random>

namespace evergreen {

/**
 * @brief Create the engine used by scene components
 *
 * @param seed Fixed seed for reproducible runs (0 = use random device)
 */
[[nodiscard]] inline std::mt19937 make_rng(uint32_t seed = 0) {
    if (seed == 0) {
        std::random_device rd;
        return std::mt19937(rd());
    }
    return std::mt19937(seed);
}

/// Uniform float in [0, 1).
[[nodiscard]] inline float uniform01(std::mt19937& rng) {
    return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng);
}

/// Uniform float in [-0.5, 0.5) scaled by @p extent.
[[nodiscard]] inline float centered(std::mt19937& rng, float extent) {
    return (uniform01(rng) - 0.5f) * extent;
}

} // namespace evergreen
