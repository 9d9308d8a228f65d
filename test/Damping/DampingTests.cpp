#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Damping.hpp>
#include <algorithm>

using namespace evergreen;
using Catch::Approx;

TEST_CASE("Blend factor follows min(1, rate * dt)", "[damping]")
{
    SECTION("small steps scale linearly")
    {
        REQUIRE(damping::blend_factor(4.0f, 0.01f) == Approx(0.04f));
    }

    SECTION("large steps saturate at one")
    {
        REQUIRE(damping::blend_factor(4.0f, 1.0f) == 1.0f);
    }

    SECTION("stalled or negative frames do not move")
    {
        REQUIRE(damping::blend_factor(4.0f, 0.0f) == 0.0f);
        REQUIRE(damping::blend_factor(4.0f, -0.5f) == 0.0f);
    }
}

TEST_CASE("Damped step never overshoots the target", "[damping]")
{
    glm::vec3 current{0.0f};
    const glm::vec3 target{10.0f, -4.0f, 2.0f};

    for (float dt : {0.001f, 0.016f, 0.1f, 0.25f, 1.0f, 5.0f}) {
        auto next = damping::step(current, target, 4.0f, dt);
        for (int axis = 0; axis < 3; axis++) {
            float lo = std::min(current[axis], target[axis]);
            float hi = std::max(current[axis], target[axis]);
            REQUIRE(next[axis] >= lo);
            REQUIRE(next[axis] <= hi);
        }
        current = next;
    }

    SECTION("a saturated step lands exactly on the target")
    {
        auto landed = damping::step(glm::vec3(0.0f), target, 4.0f, 1.0f);
        REQUIRE(landed == target);
    }
}

TEST_CASE("Repeated damping converges", "[damping]")
{
    float value = 0.0f;
    for (int i = 0; i < 600; i++) {
        value = damping::step(value, 1.0f, 4.0f, 1.0f / 60.0f);
    }
    REQUIRE(value == Approx(1.0f).margin(1e-4));
}

TEST_CASE("Convergence over one second barely depends on frame rate", "[damping]")
{
    // Residual after 1 s is (1 - rate/fps)^fps, which only approaches
    // exp(-rate) as fps grows. At rate 4 that is ~1.37% at 30 fps,
    // ~1.59% at 60 fps and ~1.71% at 120 fps.
    auto residual_after_one_second = [](int fps) {
        float value = 0.0f;
        const float dt = 1.0f / static_cast<float>(fps);
        for (int i = 0; i < fps; i++) {
            value = damping::step(value, 1.0f, 4.0f, dt);
        }
        return 1.0f - value;
    };

    const float at_30 = residual_after_one_second(30);
    const float at_60 = residual_after_one_second(60);
    const float at_120 = residual_after_one_second(120);

    REQUIRE(at_30 == Approx(0.0137f).margin(5e-4));
    REQUIRE(at_120 == Approx(0.0171f).margin(5e-4));
    REQUIRE(at_30 < at_60);
    REQUIRE(at_60 < at_120);

    // Within half a percent of the remaining distance between 30 and 120 fps
    REQUIRE(at_120 - at_30 < 0.005f);
}

TEST_CASE("Exponential smoothing clamps alpha", "[damping]")
{
    REQUIRE(damping::smooth(1.0f, 2.0f, 0.25f) == Approx(1.25f));
    REQUIRE(damping::smooth(1.0f, 2.0f, 5.0f) == Approx(2.0f));
    REQUIRE(damping::smooth(1.0f, 2.0f, -1.0f) == Approx(1.0f));
}
