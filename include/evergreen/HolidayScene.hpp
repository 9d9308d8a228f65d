#pragma once

#include "GestureChannel.hpp"
#include "GestureMapper.hpp"
#include "GiftCluster.hpp"
#include "InstancePopulation.hpp"
#include "InteractionController.hpp"
#include "SnowSimulator.hpp"
#include "StarTopper.hpp"
#include "UICallback.hpp"
#include <cstdint>
#include <expected>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace evergreen {

/**
 * @brief Every tunable of the scene, with the shipped defaults
 */
struct SceneConfig {
    uint32_t seed = 0;   ///< 0 = random device

    PopulationConfig spheres{.count = 1200, .base_scale = 0.25f};
    PopulationConfig cubes{.count = 1800, .base_scale = 0.3f};
    SnowConfig snow;
    GiftConfig gifts;
    TopperConfig topper;
    GestureConfig gesture;
    RotationConfig rotation;

    glm::vec3 ribbon_color{0.031f, 0.031f, 0.031f};

    [[nodiscard]] bool is_valid() const {
        return spheres.is_valid() && cubes.is_valid() && snow.is_valid() &&
               gifts.is_valid() && topper.is_valid() && gesture.is_valid() && rotation.is_valid();
    }
};

/**
 * @brief Render-side destinations for one publish
 *
 * Null entries are skipped.
 */
struct SceneSinks {
    InstanceSink* spheres = nullptr;
    InstanceSink* cubes = nullptr;
    InstanceSink* snow = nullptr;
    InstanceSink* gift_boxes = nullptr;
    InstanceSink* gift_trim = nullptr;
    InstanceSink* topper = nullptr;
};

/**
 * @brief The holiday scene: tree ornaments, snow, gifts and star
 *
 * Owns every animated component and advances them once per render tick
 * with one shared (delta_time, elapsed, mode) triple. Gesture input arrives
 * through the channel from any thread and is consumed at the start of a tick.
 */
class HolidayScene {
public:
    static std::expected<std::unique_ptr<HolidayScene>, std::string> create(const SceneConfig& config = {});

    HolidayScene(const HolidayScene&) = delete;
    HolidayScene& operator=(const HolidayScene&) = delete;

    /**
     * @brief Advance the scene by @p delta_time seconds
     *
     * Non-positive deltas are ignored.
     */
    void tick(float delta_time);

    void publish(const SceneSinks& sinks) const;
    void publish_colors(const SceneSinks& sinks) const;

    // Scene control
    void toggle_mode() { m_controller.toggle_mode(); }
    [[nodiscard]] InteractionMode current_mode() const { return m_controller.current_mode(); }
    void set_manual_rotation(float magnitude) { m_controller.set_manual_rotation(magnitude); }
    [[nodiscard]] float rotation_speed() const { return m_controller.rotation_speed(); }

    [[nodiscard]] GestureChannel& gesture_channel() { return m_gesture_channel; }

    /**
     * @brief Forget all gesture input once the source has stopped
     *
     * Drops the last published sample, resets the mapper's smoothing and
     * hysteresis, and returns rotation to the idle speed of the current mode.
     * Call after the source's worker has been joined.
     */
    void stop_gestures();

    [[nodiscard]] float elapsed() const { return m_elapsed; }
    [[nodiscard]] uint64_t frame() const { return m_frame; }

    [[nodiscard]] const InstancePopulation& spheres() const { return m_spheres; }
    [[nodiscard]] const InstancePopulation& cubes() const { return m_cubes; }
    [[nodiscard]] const SnowSimulator& snow() const { return m_snow; }
    [[nodiscard]] const GiftCluster& gifts() const { return m_gifts; }
    [[nodiscard]] const StarTopper& topper() const { return m_topper; }
    [[nodiscard]] const GestureMapper& gesture_mapper() const { return m_mapper; }
    [[nodiscard]] InteractionController& controller() { return m_controller; }
    [[nodiscard]] const InteractionController& controller() const { return m_controller; }
    [[nodiscard]] const SceneConfig& config() const { return m_config; }

    [[nodiscard]] std::vector<UICallbackGroup> get_ui_callback_groups();

private:
    HolidayScene(const SceneConfig& config,
                 InstancePopulation spheres,
                 InstancePopulation cubes,
                 SnowSimulator snow,
                 GiftCluster gifts,
                 StarTopper topper);

    void drain_gestures();

    SceneConfig m_config;
    InstancePopulation m_spheres;
    InstancePopulation m_cubes;
    SnowSimulator m_snow;
    GiftCluster m_gifts;
    StarTopper m_topper;
    GestureMapper m_mapper;
    InteractionController m_controller;
    GestureChannel m_gesture_channel;

    float m_elapsed = 0.0f;
    uint64_t m_frame = 0;
};

} // namespace evergreen
