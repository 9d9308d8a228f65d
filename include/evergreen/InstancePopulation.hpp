#pragma once

#include "InstanceSink.hpp"
#include "PlacementGenerator.hpp"
#include "SceneTypes.hpp"
#include "UICallback.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <expected>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace evergreen {

/**
 * @brief Animation parameters of an instance population
 */
struct PopulationConfig {
    uint32_t count = 1200;
    float position_damping = 4.0f;                 ///< Damped-lerp rate in 1/s
    float base_scale = 0.25f;
    float pulse_amplitude = 0.05f;
    float pulse_frequency = 2.0f;                  ///< rad/s of the scale pulse
    glm::vec3 spin_rates{0.5f, 0.3f, 0.2f};        ///< rad/s around x, y, z
    PlacementConfig placement;

    [[nodiscard]] bool is_valid() const {
        return position_damping > 0.0f &&
               base_scale > 0.0f &&
               pulse_amplitude >= 0.0f &&
               pulse_amplitude < base_scale &&
               placement.is_valid();
    }
};

/**
 * @brief Fixed-size population of ornaments blending between two formations
 *
 * Owns the per-instance state as flat arrays sized once at creation:
 * current positions, the two target buffers and the base colors.
 * Every update() damps each current position toward the target buffer of the
 * active mode and recomputes rotation and scale as pure functions of elapsed
 * time and instance index. Nothing is allocated after create().
 */
class InstancePopulation {
public:
    /**
     * @brief Create a population and compute its placement
     *
     * Current positions start at the Tree formation.
     *
     * @param config Animation and placement parameters
     * @param palette Colors to draw from (must not be empty unless count is 0)
     * @param rng Random source for placement jitter and color picks
     * @return Population or error message
     */
    static std::expected<InstancePopulation, std::string> create(
        const PopulationConfig& config,
        std::span<const glm::vec3> palette,
        std::mt19937& rng
    );

    /**
     * @brief Advance one frame
     *
     * @param delta_time Seconds since the previous frame
     * @param elapsed Seconds since the scene started
     * @param mode Active formation
     */
    void update(float delta_time, float elapsed, InteractionMode mode);

    /**
     * @brief Write every transform of the current frame into @p sink
     */
    void publish(InstanceSink& sink) const;

    /**
     * @brief Write the base colors into @p sink (once, after creation)
     */
    void publish_colors(InstanceSink& sink) const;

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_current.size()); }
    [[nodiscard]] std::span<const glm::vec3> current_positions() const { return m_current; }
    [[nodiscard]] std::span<const glm::vec3> tree_targets() const { return m_placement.tree_targets; }
    [[nodiscard]] std::span<const glm::vec3> exploded_targets() const { return m_placement.exploded_targets; }
    [[nodiscard]] std::span<const glm::vec3> colors() const { return m_placement.colors; }
    [[nodiscard]] std::span<const InstanceTransform> transforms() const { return m_transforms; }

    /**
     * @brief Target buffer that belongs to @p mode
     */
    [[nodiscard]] std::span<const glm::vec3> targets_for(InteractionMode mode) const;

    /**
     * @brief Rotation of instance @p index at time @p elapsed
     */
    [[nodiscard]] glm::vec3 rotation_at(float elapsed, uint32_t index) const;

    /**
     * @brief Uniform scale of instance @p index at time @p elapsed
     */
    [[nodiscard]] float scale_at(float elapsed, uint32_t index) const;

    /**
     * @brief Tuning controls for the viewer
     */
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

    [[nodiscard]] const PopulationConfig& config() const { return m_config; }

private:
    InstancePopulation(const PopulationConfig& config, PlacementSet placement);

    PopulationConfig m_config;
    PlacementSet m_placement;
    std::vector<glm::vec3> m_current;
    std::vector<InstanceTransform> m_transforms;
};

} // namespace evergreen
