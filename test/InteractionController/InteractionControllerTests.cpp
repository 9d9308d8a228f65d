#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/InteractionController.hpp>
#include <limits>
#include <utility>
#include <vector>

using namespace evergreen;
using Catch::Approx;

TEST_CASE("Controller starts in Tree mode at idle speed", "[controller]")
{
    InteractionController controller;
    REQUIRE(controller.current_mode() == InteractionMode::Tree);
    REQUIRE(controller.rotation_speed() == Approx(controller.config().tree_idle_speed));
}

TEST_CASE("Mode changes notify listeners once", "[controller]")
{
    InteractionController controller;
    std::vector<std::pair<InteractionMode, InteractionMode>> changes;
    controller.on_mode_changed([&](InteractionMode previous, InteractionMode current) {
        changes.emplace_back(previous, current);
    });

    controller.toggle_mode();
    REQUIRE(controller.current_mode() == InteractionMode::Exploded);

    SECTION("requesting the current mode is a no-op")
    {
        REQUIRE(!controller.request_mode(InteractionMode::Exploded));
        REQUIRE(changes.size() == 1);
    }

    SECTION("toggle returns to Tree")
    {
        controller.toggle_mode();
        REQUIRE(controller.current_mode() == InteractionMode::Tree);
        REQUIRE(changes.size() == 2);
        REQUIRE(changes[1].first == InteractionMode::Exploded);
        REQUIRE(changes[1].second == InteractionMode::Tree);
    }
}

TEST_CASE("Gesture edges drive the mode", "[controller]")
{
    InteractionController controller;

    controller.apply_gesture({.edge = HandEdge::Opened, .rotation_command = 0.0f});
    REQUIRE(controller.current_mode() == InteractionMode::Exploded);

    controller.apply_gesture({.edge = HandEdge::Opened, .rotation_command = 0.0f});
    REQUIRE(controller.current_mode() == InteractionMode::Exploded);

    controller.apply_gesture({.edge = HandEdge::Closed, .rotation_command = 0.0f});
    REQUIRE(controller.current_mode() == InteractionMode::Tree);
}

TEST_CASE("Rotation target picks manual over idle", "[controller]")
{
    InteractionController controller;
    const auto& config = controller.config();

    REQUIRE(controller.target_rotation_speed() == Approx(config.tree_idle_speed));

    controller.set_manual_rotation(0.5f);
    REQUIRE(controller.target_rotation_speed() == Approx(0.5f * config.manual_gain));

    controller.set_manual_rotation(config.manual_threshold * 0.5f);
    REQUIRE(controller.target_rotation_speed() == Approx(config.tree_idle_speed));

    controller.toggle_mode();
    REQUIRE(controller.target_rotation_speed() == Approx(config.exploded_idle_speed));

    SECTION("non-finite commands count as no command")
    {
        controller.set_manual_rotation(std::numeric_limits<float>::quiet_NaN());
        REQUIRE(controller.manual_rotation() == 0.0f);
    }
}

TEST_CASE("Rotation speed damps toward its target", "[controller]")
{
    InteractionController controller;
    controller.set_manual_rotation(-1.5f);
    const float target = controller.target_rotation_speed();

    float previous = controller.rotation_speed();
    for (int i = 0; i < 120; i++) {
        controller.update(1.0f / 60.0f);
        float speed = controller.rotation_speed();
        REQUIRE(speed <= previous);
        REQUIRE(speed >= target);
        previous = speed;
    }
    REQUIRE(controller.rotation_speed() == Approx(target).margin(1e-3));
}
