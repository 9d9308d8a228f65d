#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <expected>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace evergreen {

/**
 * @brief Cone spiral used for the Tree formation
 *
 * Instance i sits at height (i/N)*height - height/2, on a radius that shrinks
 * linearly from base_radius + tip_radius at the bottom to tip_radius at the top.
 */
struct TreeShape {
    float height = 10.0f;
    float base_radius = 3.5f;
    float tip_radius = 0.2f;          ///< Radius left over at the very top
    float angle_step = 2.39996f;      ///< Golden angle in radians
    float jitter = 0.3f;              ///< Full width of the horizontal jitter
};

/**
 * @brief Thick spherical shell used for the Exploded formation
 */
struct ExplosionShape {
    float base_radius = 15.0f;
    float radius_extent = 10.0f;      ///< Radius is base + U[0,1) * extent
};

struct ColorVariation {
    float lightness_chance = 0.2f;    ///< Probability of a lightness shift
    float lightness_offset = 0.2f;    ///< HSL lightness added when shifted
};

struct PlacementConfig {
    TreeShape tree;
    ExplosionShape explosion;
    ColorVariation color;

    [[nodiscard]] bool is_valid() const {
        return tree.height > 0.0f &&
               tree.base_radius >= 0.0f &&
               tree.tip_radius >= 0.0f &&
               tree.jitter >= 0.0f &&
               explosion.base_radius >= 0.0f &&
               explosion.radius_extent >= 0.0f &&
               color.lightness_chance >= 0.0f && color.lightness_chance <= 1.0f;
    }
};

/**
 * @brief Per-population target buffers, computed once
 *
 * tree_targets, exploded_targets and colors always have the same length.
 */
struct PlacementSet {
    std::vector<glm::vec3> tree_targets;
    std::vector<glm::vec3> exploded_targets;
    std::vector<glm::vec3> colors;

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(tree_targets.size()); }
};

/**
 * @brief Procedural placement of an instance population
 *
 * Produces the Tree and Exploded target positions and a color per instance.
 * The overall shape is fixed by the configuration, the fine detail (jitter,
 * shell thickness, color picks) comes from the caller's random engine.
 * Holds no mutable state, so one generator can serve any number of populations.
 */
class PlacementGenerator {
public:
    explicit PlacementGenerator(const PlacementConfig& config = {});

    /**
     * @brief Cone spiral positions for @p count instances (empty for 0)
     */
    [[nodiscard]] std::vector<glm::vec3> tree_targets(uint32_t count, std::mt19937& rng) const;

    /**
     * @brief Golden-spiral shell positions for @p count instances (empty for 0)
     */
    [[nodiscard]] std::vector<glm::vec3> exploded_targets(uint32_t count, std::mt19937& rng) const;

    /**
     * @brief Pick one palette entry per instance, occasionally lightened
     *
     * @return Colors, or an error if the palette is empty while count > 0
     */
    [[nodiscard]] std::expected<std::vector<glm::vec3>, std::string> assign_colors(
        uint32_t count,
        std::span<const glm::vec3> palette,
        std::mt19937& rng
    ) const;

    /**
     * @brief Generate the complete placement for one population
     */
    [[nodiscard]] std::expected<PlacementSet, std::string> generate(
        uint32_t count,
        std::span<const glm::vec3> palette,
        std::mt19937& rng
    ) const;

    /**
     * @brief Height of instance @p index before any jitter
     */
    [[nodiscard]] float tree_height(uint32_t index, uint32_t count) const;

    /**
     * @brief Cone radius of instance @p index before any jitter
     */
    [[nodiscard]] float tree_radius(uint32_t index, uint32_t count) const;

    [[nodiscard]] const PlacementConfig& config() const { return m_config; }

private:
    PlacementConfig m_config;
};

} // namespace evergreen
