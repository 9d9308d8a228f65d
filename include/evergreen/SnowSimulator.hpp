#pragma once

#include "InstanceSink.hpp"
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

enum class SnowState : uint8_t {
    Falling = 0,
    Landed = 1
};

/**
 * @brief One snow crystal
 *
 * Records are recycled in place; a particle keeps its slot for the whole
 * lifetime of the simulator.
 */
struct SnowParticle {
    glm::vec3 position{0.0f};
    float fall_speed = 0.0f;          ///< Units per tick at the reference tick rate
    float wobble_phase = 0.0f;        ///< Radians, fixed until the particle is recycled
    SnowState state = SnowState::Falling;
};

/**
 * @brief Snow simulation parameters
 *
 * Per-tick quantities (fall speed, wobble, turbulence, melt chance) are
 * tuned for 60 ticks per second and rescaled by the real frame time.
 */
struct SnowConfig {
    uint32_t particle_count = 6000;
    uint32_t seed = 0;                       ///< 0 = random device

    // Spawning
    float spawn_radius = 45.0f;              ///< Disc the particles spawn over
    float initial_altitude = 5.0f;           ///< First spawn: altitude in [initial, initial + range)
    float initial_altitude_range = 40.0f;
    float respawn_altitude = 30.0f;          ///< Recycle: altitude in [respawn, respawn + range)
    float respawn_altitude_range = 15.0f;
    float min_fall_speed = 0.01f;
    float fall_speed_range = 0.03f;

    // Tree mode
    float wobble_amplitude = 0.005f;
    float ground_level = -5.0f;
    float accumulation_radius = 4.5f;        ///< Only particles inside this disc may land
    float accumulation_height = 0.2f;        ///< Random height of the local ground above ground_level
    float melt_chance = 0.001f;              ///< Per-tick chance a landed particle recycles

    // Exploded mode
    float scatter_speed = 15.0f;             ///< Units per second, radially outward
    float turbulence = 0.2f;                 ///< Full width of the per-axis random kick
    float direction_epsilon = 0.01f;         ///< Added to the length before normalizing

    // Rendering
    float crystal_scale = 0.04f;
    glm::vec2 tumble_rates{0.5f, 0.3f};

    [[nodiscard]] bool is_valid() const {
        return spawn_radius > 0.0f &&
               initial_altitude_range >= 0.0f &&
               respawn_altitude_range >= 0.0f &&
               min_fall_speed > 0.0f &&
               fall_speed_range >= 0.0f &&
               accumulation_radius >= 0.0f &&
               accumulation_height >= 0.0f &&
               melt_chance >= 0.0f && melt_chance <= 1.0f &&
               scatter_speed >= 0.0f &&
               turbulence >= 0.0f &&
               direction_epsilon > 0.0f &&
               crystal_scale > 0.0f;
    }
};

/**
 * @brief Falling, accumulating and scattering snow
 *
 * Each particle is either Falling or Landed. In Tree mode falling particles
 * drift down with a lateral wobble and either land inside the accumulation
 * disc or respawn high up if they reach the ground outside it. Landed
 * particles occasionally melt back into the sky so the snowfall never runs
 * dry. In Exploded mode every particle is blown radially outward and forced
 * back to Falling. Returning from Exploded to Tree respawns every particle,
 * clearing the accumulated snow.
 *
 * The particle buffer is allocated once in create() and never resized.
 */
class SnowSimulator {
public:
    /**
     * @brief Create a simulator and scatter the initial particles
     *
     * @param config Simulation parameters
     * @return Simulator or error message if the configuration is invalid
     */
    static std::expected<SnowSimulator, std::string> create(const SnowConfig& config = {});

    /**
     * @brief Advance one frame
     *
     * @param delta_time Seconds since the previous frame
     * @param elapsed Seconds since the scene started (drives the wobble)
     * @param mode Active scene mode
     */
    void step(float delta_time, float elapsed, InteractionMode mode);

    /**
     * @brief Write the crystal transforms of the current frame into @p sink
     */
    void publish(InstanceSink& sink, float elapsed) const;

    /**
     * @brief Respawn every particle high above the scene
     */
    void reset_all();

    /**
     * @brief Respawn particle @p index high above the scene
     */
    void recycle(uint32_t index);

    [[nodiscard]] uint32_t size() const { return static_cast<uint32_t>(m_particles.size()); }
    [[nodiscard]] std::span<const SnowParticle> particles() const { return m_particles; }
    [[nodiscard]] uint32_t landed_count() const;

    /**
     * @brief Mutable access to one particle (index must be < size())
     */
    [[nodiscard]] SnowParticle& particle(uint32_t index);

    [[nodiscard]] const SnowConfig& config() const { return m_config; }
    [[nodiscard]] std::vector<UICallback> get_ui_callbacks();

private:
    explicit SnowSimulator(const SnowConfig& config);

    void spawn(SnowParticle& particle, bool initial);
    void fall(SnowParticle& particle, float ticks, float elapsed);
    void scatter(SnowParticle& particle, float delta_time);

    [[nodiscard]] float random01();

    SnowConfig m_config;
    std::vector<SnowParticle> m_particles;
    std::mt19937 m_rng;
    InteractionMode m_previous_mode = InteractionMode::Tree;
};

} // namespace evergreen
