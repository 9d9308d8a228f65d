#include <evergreen/InstancePopulation.hpp>
#include <evergreen/Damping.hpp>
#include <evergreen/Logger.hpp>
#include <cassert>
#include <cmath>

namespace evergreen {

InstancePopulation::InstancePopulation(const PopulationConfig& config, PlacementSet placement)
    : m_config(config)
    , m_placement(std::move(placement))
    , m_current(m_placement.tree_targets)
    , m_transforms(m_placement.size())
{
    for (uint32_t i = 0; i < size(); i++) {
        m_transforms[i] = {
            .position = m_current[i],
            .rotation = rotation_at(0.0f, i),
            .scale = glm::vec3(scale_at(0.0f, i))
        };
    }
}

std::expected<InstancePopulation, std::string> InstancePopulation::create(
    const PopulationConfig& config,
    std::span<const glm::vec3> palette,
    std::mt19937& rng
) {
    if (!config.is_valid()) {
        return std::unexpected("Invalid population configuration");
    }

    PlacementGenerator generator(config.placement);
    auto placement = generator.generate(config.count, palette, rng);
    if (!placement) {
        Logger::instance().warn("Population placement failed: {}", placement.error());
        return std::unexpected(placement.error());
    }

    Logger::instance().info("Created instance population ({} instances)", config.count);
    return InstancePopulation(config, std::move(*placement));
}

std::span<const glm::vec3> InstancePopulation::targets_for(InteractionMode mode) const {
    return mode == InteractionMode::Exploded ? m_placement.exploded_targets : m_placement.tree_targets;
}

glm::vec3 InstancePopulation::rotation_at(float elapsed, uint32_t index) const {
    // Index doubles as phase so neighbours never tumble in sync
    float phase = static_cast<float>(index);
    return m_config.spin_rates * elapsed + glm::vec3(phase);
}

float InstancePopulation::scale_at(float elapsed, uint32_t index) const {
    float phase = static_cast<float>(index);
    return m_config.base_scale + std::sin(elapsed * m_config.pulse_frequency + phase) * m_config.pulse_amplitude;
}

void InstancePopulation::update(float delta_time, float elapsed, InteractionMode mode) {
    auto targets = targets_for(mode);
    float blend = damping::blend_factor(m_config.position_damping, delta_time);

    for (uint32_t i = 0; i < size(); i++) {
        m_current[i] += (targets[i] - m_current[i]) * blend;

        auto& transform = m_transforms[i];
        transform.position = m_current[i];
        transform.rotation = rotation_at(elapsed, i);
        transform.scale = glm::vec3(scale_at(elapsed, i));
    }
}

void InstancePopulation::publish(InstanceSink& sink) const {
    assert(sink.capacity() >= size());
    for (uint32_t i = 0; i < size(); i++) {
        sink.set_transform(i, m_transforms[i]);
    }
}

void InstancePopulation::publish_colors(InstanceSink& sink) const {
    assert(sink.capacity() >= size());
    for (uint32_t i = 0; i < size(); i++) {
        sink.set_color(i, m_placement.colors[i]);
    }
}

std::vector<UICallback> InstancePopulation::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Position Damping", ContinuousCallback{
        .setter = [this](float v) { m_config.position_damping = v; },
        .getter = [this]() { return m_config.position_damping; },
        .min = 0.5f,
        .max = 20.0f
    });
    callbacks.emplace_back("Pulse Amplitude", ContinuousCallback{
        .setter = [this](float v) { m_config.pulse_amplitude = v; },
        .getter = [this]() { return m_config.pulse_amplitude; },
        .min = 0.0f,
        .max = m_config.base_scale * 0.5f
    });
    return callbacks;
}

} // namespace evergreen
