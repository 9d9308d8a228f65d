#pragma once

#include "GestureMapper.hpp"
#include "SceneTypes.hpp"
#include "UICallback.hpp"
#include <functional>
#include <vector>

namespace evergreen {

/**
 * @brief Auto-rotation tuning
 */
struct RotationConfig {
    float manual_threshold = 0.01f;   ///< Manual magnitude below this counts as idle
    float manual_gain = 8.0f;
    float tree_idle_speed = 1.0f;
    float exploded_idle_speed = 0.2f;
    float damping = 6.0f;             ///< Damped-lerp rate in 1/s

    [[nodiscard]] bool is_valid() const {
        return manual_threshold >= 0.0f && damping > 0.0f;
    }
};

/**
 * @brief Owner of the scene mode and the camera auto-rotation speed
 *
 * Mode changes are instantaneous and notify every registered listener once.
 * The rotation speed chases a target picked each frame: the scaled manual
 * command while one is active, otherwise the idle speed of the current mode.
 */
class InteractionController {
public:
    using ModeListener = std::function<void(InteractionMode previous, InteractionMode current)>;

    explicit InteractionController(const RotationConfig& config = {});

    /**
     * @brief Flip between Tree and Exploded (click-equivalent)
     */
    void toggle_mode();

    /**
     * @brief Switch to @p mode; a request for the current mode is a no-op
     *
     * @return true if the mode changed
     */
    bool request_mode(InteractionMode mode);

    [[nodiscard]] InteractionMode current_mode() const { return m_mode; }

    /**
     * @brief Signed manual rotation magnitude, 0 for none
     */
    void set_manual_rotation(float magnitude);
    [[nodiscard]] float manual_rotation() const { return m_manual; }

    /**
     * @brief Route one mapped gesture frame
     *
     * Opened requests Exploded, Closed requests Tree; the rotation command
     * replaces the manual magnitude.
     */
    void apply_gesture(const GestureOutput& output);

    /**
     * @brief Damp the rotation speed toward this frame's target
     */
    void update(float delta_time);

    [[nodiscard]] float target_rotation_speed() const;
    [[nodiscard]] float rotation_speed() const { return m_speed; }

    void on_mode_changed(ModeListener listener);

    [[nodiscard]] const RotationConfig& config() const { return m_config; }
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

private:
    RotationConfig m_config;
    InteractionMode m_mode = InteractionMode::Tree;
    float m_manual = 0.0f;
    float m_speed;
    std::vector<ModeListener> m_listeners;
};

} // namespace evergreen
