#include <evergreen/SnowSimulator.hpp>
#include <evergreen/Common.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/Random.hpp>
#include <algorithm>
#include <cassert>
#include <cmath>

namespace evergreen {

SnowSimulator::SnowSimulator(const SnowConfig& config)
    : m_config(config)
    , m_particles(config.particle_count)
    , m_rng(make_rng(config.seed))
{
    for (auto& particle : m_particles) {
        spawn(particle, true);
    }
}

std::expected<SnowSimulator, std::string> SnowSimulator::create(const SnowConfig& config) {
    if (!config.is_valid()) {
        return std::unexpected("Invalid snow configuration");
    }

    SnowSimulator simulator(config);
    Logger::instance().info("Created snow simulator ({} particles)", config.particle_count);
    return simulator;
}

float SnowSimulator::random01() {
    return uniform01(m_rng);
}

void SnowSimulator::spawn(SnowParticle& particle, bool initial) {
    // sqrt keeps the disc uniformly covered instead of crowding the centre
    float radius = std::sqrt(random01()) * m_config.spawn_radius;
    float theta = random01() * glm::two_pi<float>();

    float altitude = initial
        ? m_config.initial_altitude + random01() * m_config.initial_altitude_range
        : m_config.respawn_altitude + random01() * m_config.respawn_altitude_range;

    particle.position = {radius * std::cos(theta), altitude, radius * std::sin(theta)};
    particle.fall_speed = m_config.min_fall_speed + random01() * m_config.fall_speed_range;
    particle.wobble_phase = random01() * glm::two_pi<float>();
    particle.state = SnowState::Falling;
}

void SnowSimulator::recycle(uint32_t index) {
    spawn(particle(index), false);
}

void SnowSimulator::reset_all() {
    for (auto& particle : m_particles) {
        spawn(particle, false);
    }
}

SnowParticle& SnowSimulator::particle(uint32_t index) {
    assert(index < m_particles.size());
    return m_particles[index];
}

uint32_t SnowSimulator::landed_count() const {
    return static_cast<uint32_t>(std::ranges::count_if(m_particles, [](const SnowParticle& p) {
        return p.state == SnowState::Landed;
    }));
}

void SnowSimulator::fall(SnowParticle& particle, float ticks, float elapsed) {
    auto& pos = particle.position;
    pos.y -= particle.fall_speed * ticks;

    float wobble = m_config.wobble_amplitude * ticks;
    pos.x += std::sin(elapsed + particle.wobble_phase) * wobble;
    pos.z += std::cos(elapsed * 0.8f + particle.wobble_phase) * wobble;

    // Re-rolled every tick so the snow line stays ragged
    float local_ground = m_config.ground_level + random01() * m_config.accumulation_height;
    if (pos.y > local_ground) {
        return;
    }

    float radius_sq = m_config.accumulation_radius * m_config.accumulation_radius;
    if (pos.x * pos.x + pos.z * pos.z < radius_sq) {
        pos.y = local_ground;
        particle.state = SnowState::Landed;
    } else {
        spawn(particle, false);
    }
}

void SnowSimulator::scatter(SnowParticle& particle, float delta_time) {
    auto& pos = particle.position;
    float length = glm::length(pos) + m_config.direction_epsilon;
    pos += (pos / length) * (m_config.scatter_speed * delta_time);

    pos.x += centered(m_rng, m_config.turbulence);
    pos.y += centered(m_rng, m_config.turbulence);
    pos.z += centered(m_rng, m_config.turbulence);

    particle.state = SnowState::Falling;
}

void SnowSimulator::step(float delta_time, float elapsed, InteractionMode mode) {
    if (m_previous_mode == InteractionMode::Exploded && mode == InteractionMode::Tree) {
        reset_all();
        Logger::instance().debug("Snow reset after returning to Tree mode");
    }
    m_previous_mode = mode;

    if (delta_time <= 0.0f) {
        return;
    }

    const float ticks = tick_scale(delta_time);
    const float melt_chance = std::min(1.0f, m_config.melt_chance * ticks);

    for (auto& particle : m_particles) {
        if (mode == InteractionMode::Exploded) {
            scatter(particle, delta_time);
            continue;
        }

        if (particle.state == SnowState::Falling) {
            fall(particle, ticks, elapsed);
        } else if (random01() < melt_chance) {
            spawn(particle, false);
        }
    }
}

void SnowSimulator::publish(InstanceSink& sink, float elapsed) const {
    assert(sink.capacity() >= size());
    for (uint32_t i = 0; i < size(); i++) {
        const auto& particle = m_particles[i];
        InstanceTransform transform{
            .position = particle.position,
            .rotation = {
                elapsed * m_config.tumble_rates.x + particle.wobble_phase,
                elapsed * m_config.tumble_rates.y + particle.wobble_phase,
                0.0f
            },
            .scale = glm::vec3(m_config.crystal_scale)
        };
        sink.set_transform(i, transform);
    }
}

std::vector<UICallback> SnowSimulator::get_ui_callbacks() {
    std::vector<UICallback> callbacks;
    callbacks.emplace_back("Accumulation Radius", ContinuousCallback{
        .setter = [this](float v) { m_config.accumulation_radius = v; },
        .getter = [this]() { return m_config.accumulation_radius; },
        .min = 0.0f,
        .max = 15.0f
    });
    callbacks.emplace_back("Melt Chance", ContinuousCallback{
        .setter = [this](float v) { m_config.melt_chance = v; },
        .getter = [this]() { return m_config.melt_chance; },
        .min = 0.0001f,
        .max = 0.05f,
        .logarithmic = true
    });
    callbacks.emplace_back("Scatter Speed", ContinuousCallback{
        .setter = [this](float v) { m_config.scatter_speed = v; },
        .getter = [this]() { return m_config.scatter_speed; },
        .min = 0.0f,
        .max = 40.0f
    });
    return callbacks;
}

} // namespace evergreen
