#include <evergreen/GiftCluster.hpp>
#include <evergreen/Color.hpp>
#include <evergreen/Damping.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/Random.hpp>
#include <evergreen/Transform.hpp>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>

namespace evergreen {

namespace {

// Bow proportions relative to the box size
constexpr float RIBBON_WIDTH = 0.18f;
constexpr float RIBBON_LENGTH = 1.5f;
constexpr float TAIL_LENGTH = 1.3f;
constexpr float KNOT_SIZE = 0.22f;
constexpr float BAND_MARGIN = 0.01f;

std::vector<glm::vec3> balanced_colors(uint32_t count, std::mt19937& rng) {
    auto reds = parse_palette(palettes::gift_reds());
    auto greens = parse_palette(palettes::gift_greens());
    std::vector<glm::vec3> pool;
    if (!reds || !greens || reds->empty() || greens->empty()) {
        Logger::instance().error("Gift palettes failed to parse");
        return pool;
    }

    // Odd counts get the extra box in red
    uint32_t green_count = count / 2;
    uint32_t red_count = count - green_count;
    for (uint32_t i = 0; i < red_count; i++) {
        pool.push_back((*reds)[i % reds->size()]);
    }
    for (uint32_t i = 0; i < green_count; i++) {
        pool.push_back((*greens)[i % greens->size()]);
    }
    std::ranges::shuffle(pool, rng);
    return pool;
}

} // namespace

GiftCluster::GiftCluster(const GiftConfig& config, std::vector<Gift> gifts)
    : m_config(config)
    , m_gifts(std::move(gifts))
{
    m_ribbons.reserve(m_gifts.size() * RIBBONS_PER_GIFT);
    for (const auto& gift : m_gifts) {
        build_bow(gift);
    }
}

std::expected<GiftCluster, std::string> GiftCluster::create(const GiftConfig& config, std::mt19937& rng) {
    if (!config.is_valid()) {
        return std::unexpected("Invalid gift configuration");
    }

    auto colors = balanced_colors(config.count, rng);
    if (colors.size() < config.count) {
        return std::unexpected("Gift color pool could not be built");
    }

    std::vector<Gift> gifts;
    gifts.reserve(config.count);

    for (uint32_t round = 0; round < config.max_rounds && gifts.size() < config.count; round++) {
        glm::vec3 candidate{0.0f};
        float size = config.min_size;
        bool valid = false;

        for (uint32_t attempt = 0; attempt < config.attempts_per_round && !valid; attempt++) {
            float angle = uniform01(rng) * glm::two_pi<float>();
            float radius = config.ring_radius + uniform01(rng) * config.ring_extent;
            float height = centered(rng, config.height_extent);
            candidate = {std::cos(angle) * radius, height, std::sin(angle) * radius};
            size = config.min_size + uniform01(rng) * config.size_extent;

            valid = std::ranges::none_of(gifts, [&](const Gift& other) {
                return glm::distance(candidate, other.home) < config.min_distance;
            });
        }

        if (!valid) {
            continue;
        }

        auto index = static_cast<uint32_t>(gifts.size());
        glm::vec3 base_rotation{
            uniform01(rng) * config.max_tilt,
            uniform01(rng) * glm::pi<float>(),
            uniform01(rng) * config.max_tilt
        };
        glm::vec3 exploded = candidate * config.explode_scale + glm::vec3(0.0f, uniform01(rng) * config.explode_lift, 0.0f);

        gifts.push_back(Gift{
            .index = index,
            .size = size,
            .color = colors[index],
            .home = candidate,
            .exploded_target = exploded,
            .base_rotation = base_rotation,
            .position = candidate,
            .rotation = base_rotation
        });
    }

    if (gifts.size() < config.count) {
        Logger::instance().warn("Placed {} of {} gifts before giving up", gifts.size(), config.count);
    } else {
        Logger::instance().info("Placed {} gifts", gifts.size());
    }

    return GiftCluster(config, std::move(gifts));
}

void GiftCluster::build_bow(const Gift& gift) {
    const float width = gift.size * RIBBON_WIDTH;
    const float length = gift.size * RIBBON_LENGTH;
    const float knot = gift.size * KNOT_SIZE;
    const float offset = static_cast<float>(gift.index);

    struct BowPiece {
        RibbonParams params;
        float anchor_x;
        float roll;
    };

    const BowPiece pieces[RIBBONS_PER_GIFT] = {
        {{RibbonVariant::Loop, length, width, offset, 1.5f}, -knot * 0.4f, glm::half_pi<float>()},
        {{RibbonVariant::Loop, length, width, offset + 2.0f, 1.5f}, knot * 0.4f, -glm::half_pi<float>()},
        {{RibbonVariant::Tail, length * TAIL_LENGTH, width, offset + 4.0f, 1.8f}, -knot * 0.5f, 0.2f},
        {{RibbonVariant::Tail, length * TAIL_LENGTH, width, offset + 6.0f, 2.0f}, knot * 0.5f, -0.2f},
    };

    // Bow sits on the lid
    const glm::mat4 bow = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, gift.size * 0.5f, 0.0f));

    for (const auto& piece : pieces) {
        auto curve = RibbonCurve::create(piece.params);
        if (!curve) {
            Logger::instance().error("Bow ribbon for gift {}: {}", gift.index, curve.error());
            continue;
        }

        glm::mat4 frame = glm::translate(bow, glm::vec3(piece.anchor_x, 0.0f, 0.0f));
        frame = glm::rotate(frame, piece.roll, glm::vec3(0.0f, 0.0f, 1.0f));
        frame = glm::rotate(frame, glm::half_pi<float>(), glm::vec3(0.0f, 1.0f, 0.0f));

        m_ribbons.push_back(GiftRibbon{
            .gift = gift.index,
            .curve = std::move(*curve),
            .local_frame = frame
        });
    }
}

glm::vec3 GiftCluster::target_position(const Gift& gift, float elapsed, InteractionMode mode) const {
    glm::vec3 target = mode == InteractionMode::Exploded ? gift.exploded_target : gift.home;
    target.y += std::sin(elapsed + static_cast<float>(gift.index)) * m_config.bob_amplitude;
    return target;
}

void GiftCluster::update(float delta_time, float elapsed, InteractionMode mode) {
    if (delta_time <= 0.0f) {
        return;
    }

    const float rotation_blend = damping::blend_factor(m_config.rotation_damping, delta_time);
    for (auto& gift : m_gifts) {
        gift.position = damping::step(gift.position, target_position(gift, elapsed, mode),
                                      m_config.position_damping, delta_time);

        float sway_phase = elapsed * m_config.sway_frequency + static_cast<float>(gift.index);
        float sway_x = gift.base_rotation.x + std::sin(sway_phase) * m_config.sway_amplitude;
        float sway_z = gift.base_rotation.z + std::cos(sway_phase) * m_config.sway_amplitude;
        gift.rotation.x += (sway_x - gift.rotation.x) * rotation_blend;
        gift.rotation.z += (sway_z - gift.rotation.z) * rotation_blend;
        gift.rotation.y += m_config.spin_rate * delta_time;
    }

    for (auto& ribbon : m_ribbons) {
        ribbon.curve.update(elapsed);
    }
}

glm::mat4 GiftCluster::gift_frame(uint32_t index) const {
    assert(index < m_gifts.size());
    const auto& gift = m_gifts[index];
    return glm::translate(glm::mat4(1.0f), gift.position) * rotation_matrix(gift.rotation);
}

glm::mat4 GiftCluster::ribbon_frame(uint32_t index) const {
    assert(index < m_ribbons.size());
    const auto& ribbon = m_ribbons[index];
    return gift_frame(ribbon.gift) * ribbon.local_frame;
}

void GiftCluster::publish_boxes(InstanceSink& sink) const {
    assert(sink.capacity() >= size());
    for (const auto& gift : m_gifts) {
        sink.set_transform(gift.index, {
            .position = gift.position,
            .rotation = gift.rotation,
            .scale = glm::vec3(gift.size)
        });
    }
}

void GiftCluster::publish_box_colors(InstanceSink& sink) const {
    assert(sink.capacity() >= size());
    for (const auto& gift : m_gifts) {
        sink.set_color(gift.index, gift.color);
    }
}

void GiftCluster::publish_trim(InstanceSink& sink) const {
    assert(sink.capacity() >= size() * TRIM_PER_GIFT);
    for (const auto& gift : m_gifts) {
        const glm::mat4 rotation = rotation_matrix(gift.rotation);
        const float width = gift.size * RIBBON_WIDTH;
        const float wrap = gift.size + BAND_MARGIN;
        const float knot = gift.size * KNOT_SIZE;
        const uint32_t base = gift.index * TRIM_PER_GIFT;

        auto place = [&](uint32_t slot, const glm::vec3& offset, const glm::vec3& scale) {
            glm::vec3 world = gift.position + glm::vec3(rotation * glm::vec4(offset, 0.0f));
            sink.set_transform(base + slot, {.position = world, .rotation = gift.rotation, .scale = scale});
        };

        place(0, glm::vec3(0.0f), {width, wrap, wrap});
        place(1, glm::vec3(0.0f), {wrap, wrap, width});
        place(2, {0.0f, gift.size * 0.5f + knot * 0.5f, 0.0f}, {knot, knot * 0.8f, knot});
    }
}

void GiftCluster::publish_trim_colors(InstanceSink& sink, const glm::vec3& ribbon_color) const {
    assert(sink.capacity() >= size() * TRIM_PER_GIFT);
    for (uint32_t i = 0; i < size() * TRIM_PER_GIFT; i++) {
        sink.set_color(i, ribbon_color);
    }
}

std::vector<UICallback> GiftCluster::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Gift Spin", ContinuousCallback{
        .setter = [this](float v) { m_config.spin_rate = v; },
        .getter = [this]() { return m_config.spin_rate; },
        .min = -2.0f,
        .max = 2.0f
    });
    callbacks.emplace_back("Gift Bob", ContinuousCallback{
        .setter = [this](float v) { m_config.bob_amplitude = v; },
        .getter = [this]() { return m_config.bob_amplitude; },
        .min = 0.0f,
        .max = 1.0f
    });
    return callbacks;
}

} // namespace evergreen
