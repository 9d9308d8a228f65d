#include <evergreen/RibbonCurve.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace evergreen {

namespace {
constexpr float BREATHING_AMPLITUDE = 0.05f;
constexpr float FLUTTER_AMPLITUDE = 0.05f;

// Loop proportions relative to the ribbon length
constexpr float LOOP_RADIUS_DIVISOR = 3.2f;
constexpr float LOOP_REACH = 1.2f;
constexpr float LOOP_DEPTH = 0.5f;
constexpr float LOOP_PUFF = 1.5f;

constexpr float TAIL_REACH = 0.5f;
constexpr float TAIL_TWIST = 0.2f;
}

RibbonCurve::RibbonCurve(const RibbonParams& params)
    : m_params(params)
    , m_samples(params.segments + 1)
{
}

std::expected<RibbonCurve, std::string> RibbonCurve::create(const RibbonParams& params) {
    if (!params.is_valid()) {
        return std::unexpected("Invalid ribbon parameters");
    }
    RibbonCurve curve(params);
    curve.update(0.0f);
    return curve;
}

float RibbonCurve::breathing(float elapsed, const RibbonParams& params) {
    return 1.0f + std::sin(elapsed * params.speed + params.phase_offset) * BREATHING_AMPLITUDE;
}

glm::vec3 RibbonCurve::loop_point(float t, float elapsed, const RibbonParams& params) {
    float angle = t * glm::two_pi<float>();
    float radius = params.length / LOOP_RADIUS_DIVISOR;

    glm::vec3 p{
        std::sin(angle) * radius * LOOP_REACH,
        std::sin(t * glm::pi<float>()) * params.width * LOOP_PUFF,
        (std::cos(angle) - 1.0f) * radius * LOOP_DEPTH
    };
    return p * breathing(elapsed, params);
}

glm::vec3 RibbonCurve::tail_point(float t, float elapsed, const RibbonParams& params) {
    // Anchored at t = 0, free at t = 1
    float flutter = std::sin(elapsed * params.speed * 2.0f + t * 5.0f + params.phase_offset)
                  * FLUTTER_AMPLITUDE * t;

    return {
        t * params.length * TAIL_REACH + flutter,
        -t * t * params.length,
        std::sin(t * glm::pi<float>()) * params.width * TAIL_TWIST + flutter
    };
}

std::span<const RibbonSample> RibbonCurve::update(float elapsed) {
    const float step = 1.0f / static_cast<float>(m_params.segments);
    const glm::vec3 half_width{0.0f, 0.0f, m_params.width * 0.5f};

    for (uint32_t i = 0; i < m_samples.size(); i++) {
        float t = static_cast<float>(i) * step;
        m_samples[i].center = m_params.variant == RibbonVariant::Loop
            ? loop_point(t, elapsed, m_params)
            : tail_point(t, elapsed, m_params);
        m_samples[i].half_width = half_width;
    }
    return m_samples;
}

} // namespace evergreen
