#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/SnowSimulator.hpp>
#include <cmath>

using namespace evergreen;
using Catch::Approx;

namespace {

constexpr float TICK = 1.0f / 60.0f;

SnowSimulator make_snow(uint32_t count, uint32_t seed = 5) {
    SnowConfig config;
    config.particle_count = count;
    config.seed = seed;
    auto snow = SnowSimulator::create(config);
    REQUIRE(snow.has_value());
    return std::move(*snow);
}

} // namespace

TEST_CASE("Snow spawns inside the configured volume", "[snow]")
{
    auto snow = make_snow(2000);
    const auto& config = snow.config();
    REQUIRE(snow.size() == 2000);
    REQUIRE(snow.landed_count() == 0);

    for (const auto& particle : snow.particles()) {
        REQUIRE(particle.state == SnowState::Falling);
        REQUIRE(std::hypot(particle.position.x, particle.position.z) <= config.spawn_radius + 1e-3f);
        REQUIRE(particle.position.y >= config.initial_altitude);
        REQUIRE(particle.position.y < config.initial_altitude + config.initial_altitude_range);
        REQUIRE(particle.fall_speed >= config.min_fall_speed);
        REQUIRE(particle.fall_speed < config.min_fall_speed + config.fall_speed_range);
    }
}

TEST_CASE("Particle count is conserved", "[snow]")
{
    auto snow = make_snow(500);
    float elapsed = 0.0f;
    for (int i = 0; i < 300; i++) {
        elapsed += TICK;
        auto mode = (i / 100) % 2 == 1 ? InteractionMode::Exploded : InteractionMode::Tree;
        snow.step(TICK, elapsed, mode);
        REQUIRE(snow.size() == 500);
    }
}

TEST_CASE("A particle near the axis lands after falling to the ground", "[snow]")
{
    auto snow = make_snow(1);
    auto& particle = snow.particle(0);
    particle.position = {0.0f, 10.0f, 0.0f};
    particle.fall_speed = 0.02f;

    const auto& config = snow.config();
    int ticks = 0;
    float elapsed = 0.0f;
    while (snow.particles()[0].state == SnowState::Falling && ticks < 2000) {
        elapsed += TICK;
        snow.step(TICK, elapsed, InteractionMode::Tree);
        ticks++;
    }

    // (10 - (-5)) / 0.02 = 750 ticks, minus up to accumulation_height / 0.02
    REQUIRE(snow.particles()[0].state == SnowState::Landed);
    REQUIRE(ticks >= 735);
    REQUIRE(ticks <= 752);

    const auto& landed = snow.particles()[0].position;
    REQUIRE(landed.y >= config.ground_level);
    REQUIRE(landed.y <= config.ground_level + config.accumulation_height);
    REQUIRE(snow.landed_count() == 1);
}

TEST_CASE("A particle outside the accumulation disc respawns instead of landing", "[snow]")
{
    auto snow = make_snow(1);
    auto& particle = snow.particle(0);
    particle.position = {20.0f, -4.99f, 0.0f};
    particle.fall_speed = 0.04f;

    snow.step(TICK, TICK, InteractionMode::Tree);

    const auto& after = snow.particles()[0];
    REQUIRE(after.state == SnowState::Falling);
    REQUIRE(after.position.y >= snow.config().respawn_altitude);
}

TEST_CASE("Exploded mode scatters everything and forces Falling", "[snow]")
{
    auto snow = make_snow(200);
    auto& particle = snow.particle(0);
    particle.position = {0.0f, -5.0f, 0.0f};
    particle.state = SnowState::Landed;

    std::vector<float> before;
    for (const auto& p : snow.particles()) {
        before.push_back(glm::length(p.position));
    }

    snow.step(0.1f, 0.1f, InteractionMode::Exploded);

    REQUIRE(snow.landed_count() == 0);
    // 15 units/s * 0.1 s outward beats the +-0.1 turbulence per axis
    for (uint32_t i = 0; i < snow.size(); i++) {
        REQUIRE(glm::length(snow.particles()[i].position) > before[i]);
    }
}

TEST_CASE("Particle at the origin never produces NaN", "[snow]")
{
    auto snow = make_snow(1);
    snow.particle(0).position = glm::vec3(0.0f);

    snow.step(TICK, TICK, InteractionMode::Exploded);

    const auto& pos = snow.particles()[0].position;
    REQUIRE(std::isfinite(pos.x));
    REQUIRE(std::isfinite(pos.y));
    REQUIRE(std::isfinite(pos.z));
}

TEST_CASE("Returning to Tree clears the accumulated snow", "[snow]")
{
    auto snow = make_snow(300);
    for (uint32_t i = 0; i < 100; i++) {
        auto& particle = snow.particle(i);
        particle.position = {0.0f, -5.0f, 0.0f};
        particle.state = SnowState::Landed;
    }
    REQUIRE(snow.landed_count() == 100);

    snow.step(TICK, TICK, InteractionMode::Exploded);
    snow.step(TICK, 2.0f * TICK, InteractionMode::Tree);

    REQUIRE(snow.landed_count() == 0);
    for (const auto& particle : snow.particles()) {
        REQUIRE(particle.position.y > snow.config().respawn_altitude - 1.0f);
    }
}

TEST_CASE("Landed snow eventually melts", "[snow]")
{
    SnowConfig config;
    config.particle_count = 50;
    config.seed = 9;
    config.melt_chance = 0.5f;
    auto snow = SnowSimulator::create(config);
    REQUIRE(snow.has_value());

    for (uint32_t i = 0; i < snow->size(); i++) {
        snow->particle(i).position = {0.0f, -5.0f, 0.0f};
        snow->particle(i).state = SnowState::Landed;
    }

    float elapsed = 0.0f;
    for (int i = 0; i < 40; i++) {
        elapsed += TICK;
        snow->step(TICK, elapsed, InteractionMode::Tree);
    }
    REQUIRE(snow->landed_count() == 0);
}

TEST_CASE("Zero particles is a valid simulation", "[snow]")
{
    auto snow = make_snow(0);
    snow.step(TICK, TICK, InteractionMode::Tree);
    snow.step(TICK, TICK, InteractionMode::Exploded);
    REQUIRE(snow.size() == 0);
    REQUIRE(snow.landed_count() == 0);
}

TEST_CASE("Invalid snow configuration is rejected", "[snow]")
{
    SnowConfig config;
    config.melt_chance = 2.0f;
    REQUIRE(!SnowSimulator::create(config).has_value());
}
