#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Camera3D.hpp>
#include <cmath>

using namespace evergreen;
using Catch::Approx;

TEST_CASE("Camera starts at the home eye", "[camera]")
{
    Camera3D camera(1280, 720);
    const auto& config = camera.config();

    auto eye = camera.eye();
    REQUIRE(eye.x == Approx(config.home_eye.x).margin(1e-4));
    REQUIRE(eye.y == Approx(config.home_eye.y).margin(1e-4));
    REQUIRE(eye.z == Approx(config.home_eye.z).margin(1e-4));
    REQUIRE(camera.aspect_ratio() == Approx(1280.0f / 720.0f));
}

TEST_CASE("Orbit keeps the eye above the ground", "[camera]")
{
    Camera3D camera;

    camera.handle_mouse_movement(0.0, -10000.0);
    REQUIRE(camera.elevation() == Approx(camera.config().min_elevation));
    REQUIRE(camera.eye().y >= -1e-4f);

    camera.handle_mouse_movement(0.0, 10000.0);
    REQUIRE(camera.elevation() == Approx(camera.config().max_elevation));

    SECTION("azimuth wraps around")
    {
        camera.set_rotation(350.0f, 20.0f);
        camera.handle_mouse_movement(80.0, 0.0);
        REQUIRE(camera.azimuth() == Approx(10.0f));
    }
}

TEST_CASE("Zoom is clamped", "[camera]")
{
    Camera3D camera;
    camera.handle_mouse_scroll(1000.0);
    REQUIRE(camera.distance() == Approx(camera.config().min_distance));
    camera.handle_mouse_scroll(-1000.0);
    REQUIRE(camera.distance() == Approx(camera.config().max_distance));
}

TEST_CASE("Auto rotation turns at the commanded speed", "[camera]")
{
    Camera3D camera;
    float start = camera.azimuth();

    camera.advance_auto_rotation(1.0f, 1.0f);
    REQUIRE(camera.azimuth() == Approx(start - camera.config().degrees_per_speed));

    float before = camera.azimuth();
    camera.advance_auto_rotation(0.0f, 1.0f);
    camera.advance_auto_rotation(3.0f, 0.0f);
    REQUIRE(camera.azimuth() == before);

    SECTION("reset returns home")
    {
        camera.set_distance(30.0f);
        camera.reset();
        REQUIRE(camera.azimuth() == Approx(start));
        REQUIRE(camera.distance() == Approx(glm::length(camera.config().home_eye)));
    }
}

TEST_CASE("Camera matrices map the target to the view centre", "[camera]")
{
    Camera3D camera(800, 800);
    glm::vec4 clip = camera.view_projection_matrix() * glm::vec4(camera.target(), 1.0f);
    REQUIRE(clip.w > 0.0f);
    REQUIRE(clip.x / clip.w == Approx(0.0f).margin(1e-5));
    REQUIRE(clip.y / clip.w == Approx(0.0f).margin(1e-5));
    float depth = clip.z / clip.w;
    REQUIRE(depth > 0.0f);
    REQUIRE(depth < 1.0f);

    SECTION("resize to zero height is ignored")
    {
        camera.handle_resize(800, 0);
        REQUIRE(camera.aspect_ratio() == Approx(1.0f));
        camera.handle_resize(1600, 800);
        REQUIRE(camera.aspect_ratio() == Approx(2.0f));
    }
}
