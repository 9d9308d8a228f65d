#pragma once

#include "InstanceSink.hpp"
#include "SceneTypes.hpp"
#include <glm/glm.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace evergreen {

struct TopperConfig {
    uint32_t points = 5;
    float outer_radius = 0.65f;
    float inner_radius = 0.35f;
    float control_radius_scale = 0.95f;   ///< Of the mean radius; below 1 keeps the arms plump
    uint32_t samples_per_curve = 8;
    float depth = 0.3f;                   ///< Extrusion depth

    float tree_height = 5.6f;
    float exploded_height = 20.0f;
    float hover_amplitude = 0.15f;
    float height_damping = 3.0f;          ///< 1/s

    float glow_base = 4.0f;
    float glow_amplitude = 1.5f;
    glm::vec3 color{1.0f, 0.843f, 0.0f};

    [[nodiscard]] bool is_valid() const {
        return points >= 2 && outer_radius > inner_radius && inner_radius > 0.0f &&
               samples_per_curve > 0 && depth > 0.0f && height_damping > 0.0f;
    }
};

/**
 * @brief Rounded star crowning the tree
 *
 * The outline is built once from quadratic Bezier arms (tip -> valley ->
 * next tip) starting at the top. Per frame the star wobbles, hovers and
 * damps its height toward the tree top or, when exploded, far above it.
 */
class StarTopper {
public:
    static std::expected<StarTopper, std::string> create(const TopperConfig& config = {});

    void update(float delta_time, float elapsed, InteractionMode mode);

    /**
     * @brief Write the single star instance into @p sink at @p index
     */
    void publish(InstanceSink& sink, uint32_t index = 0) const;

    /**
     * @brief Closed outline in the xy plane, counter-clockwise, first point not repeated
     */
    [[nodiscard]] std::span<const glm::vec2> outline() const { return m_outline; }

    /**
     * @brief Build the star outline for @p config
     */
    [[nodiscard]] static std::vector<glm::vec2> build_outline(const TopperConfig& config);

    [[nodiscard]] const InstanceTransform& transform() const { return m_transform; }
    [[nodiscard]] float glow() const { return m_glow; }
    [[nodiscard]] float target_height(float elapsed, InteractionMode mode) const;
    [[nodiscard]] const TopperConfig& config() const { return m_config; }

private:
    explicit StarTopper(const TopperConfig& config);

    TopperConfig m_config;
    std::vector<glm::vec2> m_outline;
    InstanceTransform m_transform;
    float m_glow;
};

} // namespace evergreen
