#pragma once

#include "UICallback.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace evergreen {

/**
 * @brief One detection frame from the gesture collaborator
 */
struct GestureSample {
    float open_ratio = 0.0f;   ///< Raw fingertip/knuckle distance ratio
    float wrist_x = 0.5f;      ///< Normalized horizontal wrist position, mirrored
};

/**
 * @brief Transition emitted by the hysteresis filter
 */
enum class HandEdge : uint8_t {
    None = 0,
    Opened = 1,
    Closed = 2
};

struct GestureOutput {
    HandEdge edge = HandEdge::None;
    float rotation_command = 0.0f;
};

/**
 * @brief Gesture thresholds and filter constants
 *
 * The thresholds and gains are empirical UX values, exposed as tuning
 * controls rather than fixed invariants.
 */
struct GestureConfig {
    float ratio_alpha = 0.25f;
    float position_alpha = 0.2f;
    float open_threshold = 1.35f;     ///< Closed -> Open above this
    float close_threshold = 1.25f;    ///< Open -> Closed below this
    float initial_ratio = 1.2f;
    float center = 0.5f;
    float dead_zone = 0.05f;
    float sensitivity = 6.0f;

    [[nodiscard]] bool is_valid() const {
        return ratio_alpha > 0.0f && ratio_alpha <= 1.0f &&
               position_alpha > 0.0f && position_alpha <= 1.0f &&
               close_threshold < open_threshold &&
               dead_zone >= 0.0f &&
               sensitivity >= 0.0f;
    }
};

/**
 * @brief Maps raw hand measurements to mode edges and a rotation command
 *
 * Both signals are smoothed with a fixed-alpha exponential filter. The open
 * ratio goes through a two-threshold hysteresis so a ratio hovering inside
 * [close_threshold, open_threshold] never toggles. Only transitions produce
 * an edge. The smoothed wrist position is mapped through a dead zone plus
 * linear gain.
 *
 * Frames without a hand are simply not fed in; the mapper keeps its state.
 */
class GestureMapper {
public:
    explicit GestureMapper(const GestureConfig& config = {});

    /**
     * @brief Feed one detection frame
     */
    GestureOutput process(const GestureSample& sample);

    /**
     * @brief Dead zone + linear gain transform of a wrist position
     *
     * Returns 0 inside [center - dead_zone, center + dead_zone], otherwise
     * the signed distance past the dead-zone edge times @p sensitivity.
     */
    [[nodiscard]] static float rotation_command(float wrist_x, float center, float dead_zone, float sensitivity);

    void reset();

    [[nodiscard]] bool hand_open() const { return m_open; }
    [[nodiscard]] float smoothed_ratio() const { return m_smoothed_ratio; }
    [[nodiscard]] float smoothed_x() const { return m_smoothed_x; }
    [[nodiscard]] float last_command() const { return m_last_command; }
    [[nodiscard]] uint64_t samples_processed() const { return m_samples; }

    [[nodiscard]] const GestureConfig& config() const { return m_config; }
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

private:
    GestureConfig m_config;
    float m_smoothed_ratio;
    float m_smoothed_x;
    float m_last_command = 0.0f;
    bool m_open = false;
    uint64_t m_samples = 0;
};

/// Number of landmarks in one detected hand.
inline constexpr std::size_t HAND_LANDMARK_COUNT = 21;

/**
 * @brief Reduce 21 normalized 2D hand landmarks to a gesture sample
 *
 * open_ratio = sum of wrist->fingertip distances (8, 12, 16, 20) divided by
 * the sum of wrist->knuckle distances (5, 9, 13, 17). wrist_x is mirrored
 * (1 - x) so moving the real hand right moves right on screen.
 *
 * @return Sample, or nothing for a malformed or degenerate hand
 */
[[nodiscard]] std::optional<GestureSample> measure_hand(std::span<const glm::vec2> landmarks);

} // namespace evergreen
