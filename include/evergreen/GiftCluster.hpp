#pragma once

#include "InstanceSink.hpp"
#include "RibbonCurve.hpp"
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
 * @brief Placement and motion of the floating gift boxes
 */
struct GiftConfig {
    uint32_t count = 10;
    float min_distance = 3.5f;           ///< Between box centres
    uint32_t max_rounds = 100;
    uint32_t attempts_per_round = 50;

    float ring_radius = 7.0f;            ///< Ring radius in [ring_radius, ring_radius + ring_extent)
    float ring_extent = 8.0f;
    float height_extent = 8.0f;          ///< Height in [-extent/2, extent/2)
    float min_size = 1.0f;
    float size_extent = 0.8f;
    float max_tilt = 0.2f;               ///< Base x/z tilt in [0, max_tilt)

    float explode_scale = 1.5f;
    float explode_lift = 5.0f;           ///< Extra random rise when exploded

    float bob_amplitude = 0.15f;
    float sway_amplitude = 0.05f;
    float sway_frequency = 0.3f;
    float position_damping = 3.0f;       ///< 1/s
    float rotation_damping = 3.0f;       ///< 1/s
    float spin_rate = 0.3f;              ///< rad/s around y

    [[nodiscard]] bool is_valid() const {
        return min_distance >= 0.0f &&
               ring_radius >= 0.0f && ring_extent >= 0.0f &&
               height_extent >= 0.0f &&
               min_size > 0.0f && size_extent >= 0.0f &&
               position_damping > 0.0f && rotation_damping > 0.0f;
    }
};

struct Gift {
    uint32_t index = 0;
    float size = 1.0f;
    glm::vec3 color{1.0f};
    glm::vec3 home{0.0f};
    glm::vec3 exploded_target{0.0f};
    glm::vec3 base_rotation{0.0f};
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
};

/**
 * @brief Bow ribbon attached to one gift
 */
struct GiftRibbon {
    uint32_t gift = 0;
    RibbonCurve curve;
    glm::mat4 local_frame{1.0f};   ///< Ribbon space -> gift space
};

/**
 * @brief Ribboned gift boxes floating around the tree
 *
 * Boxes are placed once by rejection sampling on a ring around the tree and
 * then chase either their home position or a lifted exploded position,
 * bobbing and swaying as a function of elapsed time. Each box carries a
 * bow of two loop ribbons and two tail ribbons.
 *
 * Published instances per gift:
 * - one box (cube, gift color)
 * - three trim pieces in the ribbon color: two wrapping bands and the knot
 */
class GiftCluster {
public:
    /// Trim pieces (wrapping bands and knot) per gift.
    static constexpr uint32_t TRIM_PER_GIFT = 3;
    /// Bow ribbons per gift.
    static constexpr uint32_t RIBBONS_PER_GIFT = 4;

    static std::expected<GiftCluster, std::string> create(const GiftConfig& config, std::mt19937& rng);

    void update(float delta_time, float elapsed, InteractionMode mode);

    void publish_boxes(InstanceSink& sink) const;
    void publish_box_colors(InstanceSink& sink) const;
    void publish_trim(InstanceSink& sink) const;
    void publish_trim_colors(InstanceSink& sink, const glm::vec3& ribbon_color) const;

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_gifts.size()); }
    [[nodiscard]] std::span<const Gift> gifts() const { return m_gifts; }
    [[nodiscard]] std::span<const GiftRibbon> ribbons() const { return m_ribbons; }

    /**
     * @brief Box-space to world transform of gift @p index (no scale)
     */
    [[nodiscard]] glm::mat4 gift_frame(uint32_t index) const;

    /**
     * @brief Ribbon-space to world transform of ribbon @p index
     */
    [[nodiscard]] glm::mat4 ribbon_frame(uint32_t index) const;

    /**
     * @brief Position a gift is steering toward this frame
     */
    [[nodiscard]] glm::vec3 target_position(const Gift& gift, float elapsed, InteractionMode mode) const;

    [[nodiscard]] const GiftConfig& config() const { return m_config; }
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

private:
    GiftCluster(const GiftConfig& config, std::vector<Gift> gifts);

    void build_bow(const Gift& gift);

    GiftConfig m_config;
    std::vector<Gift> m_gifts;
    std::vector<GiftRibbon> m_ribbons;
};

} // namespace evergreen
