#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace evergreen {

enum class RibbonVariant : uint8_t {
    Loop = 0,   ///< Closed petal that starts and ends at the knot
    Tail = 1    ///< Open strand hanging away from the knot
};

/**
 * @brief Static shape parameters of one ribbon
 */
struct RibbonParams {
    RibbonVariant variant = RibbonVariant::Loop;
    float length = 1.5f;
    float width = 0.18f;
    float phase_offset = 0.0f;   ///< Decorrelates ribbons sharing one clock
    float speed = 1.5f;          ///< Breathing / flutter rate
    uint32_t segments = 32;

    [[nodiscard]] bool is_valid() const {
        return length > 0.0f && width > 0.0f && segments > 0;
    }
};

/**
 * @brief One point on the ribbon centreline plus the strip's half-width
 */
struct RibbonSample {
    glm::vec3 center{0.0f};
    glm::vec3 half_width{0.0f};
};

/**
 * @brief Procedural bow-ribbon centreline
 *
 * Every update() recomputes segments + 1 samples from elapsed time and the
 * fixed shape parameters. The sample buffer is allocated once; nothing is
 * carried over between frames besides the clock the caller supplies.
 *
 * Loop: a teardrop in the x/z plane with a sin(pi t) puff along y, so it
 * pinches to the knot at both ends. The whole curve breathes by a few
 * percent.
 *
 * Tail: extends along +x, drops with t^2 and flutters with an amplitude
 * that grows toward the free end.
 */
class RibbonCurve {
public:
    static std::expected<RibbonCurve, std::string> create(const RibbonParams& params);

    /**
     * @brief Recompute all samples for time @p elapsed
     *
     * @return View of the internal buffer, valid until the next update()
     */
    std::span<const RibbonSample> update(float elapsed);

    [[nodiscard]] std::span<const RibbonSample> samples() const { return m_samples; }
    [[nodiscard]] const RibbonParams& params() const { return m_params; }
    [[nodiscard]] uint32_t sample_count() const { return static_cast<uint32_t>(m_samples.size()); }

    /**
     * @brief Loop centreline at parameter @p t in [0, 1]
     */
    [[nodiscard]] static glm::vec3 loop_point(float t, float elapsed, const RibbonParams& params);

    /**
     * @brief Tail centreline at parameter @p t in [0, 1]
     */
    [[nodiscard]] static glm::vec3 tail_point(float t, float elapsed, const RibbonParams& params);

    /**
     * @brief Scale factor of the slow breathing oscillation
     */
    [[nodiscard]] static float breathing(float elapsed, const RibbonParams& params);

private:
    explicit RibbonCurve(const RibbonParams& params);

    RibbonParams m_params;
    std::vector<RibbonSample> m_samples;
};

} // namespace evergreen
