#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/HolidayScene.hpp>
#include <evergreen/InstanceStaging.hpp>
#include <evergreen/Logger.hpp>

using namespace evergreen;
using Catch::Approx;

namespace {

constexpr float TICK = 1.0f / 60.0f;

SceneConfig small_scene() {
    SceneConfig config;
    config.seed = 1234;
    config.spheres.count = 120;
    config.cubes.count = 180;
    config.snow.particle_count = 300;
    config.gifts.count = 6;
    return config;
}

std::unique_ptr<HolidayScene> make_scene(const SceneConfig& config = small_scene()) {
    auto scene = HolidayScene::create(config);
    REQUIRE(scene.has_value());
    return std::move(*scene);
}

} // namespace

TEST_CASE("Scene builds every component", "[scene]")
{
    Logger::instance().set_level(spdlog::level::warn);
    auto scene = make_scene();

    REQUIRE(scene->spheres().size() == 120);
    REQUIRE(scene->cubes().size() == 180);
    REQUIRE(scene->snow().size() == 300);
    REQUIRE(scene->gifts().size() == 6);
    REQUIRE(scene->topper().outline().size() > 0);
    REQUIRE(scene->current_mode() == InteractionMode::Tree);
}

TEST_CASE("Invalid scene configuration is rejected", "[scene]")
{
    auto config = small_scene();
    config.gesture.open_threshold = config.gesture.close_threshold;
    REQUIRE(!HolidayScene::create(config).has_value());
}

TEST_CASE("Non-positive ticks are ignored", "[scene]")
{
    auto scene = make_scene();
    scene->tick(0.0f);
    scene->tick(-1.0f);
    REQUIRE(scene->frame() == 0);
    REQUIRE(scene->elapsed() == 0.0f);

    scene->tick(TICK);
    REQUIRE(scene->frame() == 1);
    REQUIRE(scene->elapsed() == Approx(TICK));
}

TEST_CASE("Same seed reproduces the scene", "[scene]")
{
    auto a = make_scene();
    auto b = make_scene();
    for (int i = 0; i < 30; i++) {
        a->tick(TICK);
        b->tick(TICK);
    }
    auto pa = a->cubes().current_positions();
    auto pb = b->cubes().current_positions();
    for (std::size_t i = 0; i < pa.size(); i++) {
        REQUIRE(pa[i] == pb[i]);
    }
    REQUIRE(a->snow().particles()[7].position == b->snow().particles()[7].position);
}

TEST_CASE("Open hand in the channel explodes the scene", "[scene][gesture]")
{
    auto scene = make_scene();
    scene->gesture_channel().publish({.open_ratio = 2.0f, .wrist_x = 0.5f});
    scene->tick(TICK);
    REQUIRE(scene->current_mode() == InteractionMode::Exploded);
    REQUIRE(!scene->gesture_channel().has_pending());

    SECTION("closed hand brings it back")
    {
        for (int i = 0; i < 10; i++) {
            scene->gesture_channel().publish({.open_ratio = 0.9f, .wrist_x = 0.5f});
            scene->tick(TICK);
        }
        REQUIRE(scene->current_mode() == InteractionMode::Tree);
    }

    SECTION("wrist offset steers the rotation")
    {
        for (int i = 0; i < 120; i++) {
            scene->gesture_channel().publish({.open_ratio = 2.0f, .wrist_x = 0.95f});
            scene->tick(TICK);
        }
        REQUIRE(scene->rotation_speed() > scene->config().rotation.tree_idle_speed);
    }
}

TEST_CASE("Stopping gestures returns rotation to idle", "[scene][gesture]")
{
    auto scene = make_scene();
    const float idle = scene->config().rotation.tree_idle_speed;

    // Closed, off-centre hand: steers without changing mode
    for (int i = 0; i < 30; i++) {
        scene->gesture_channel().publish({.open_ratio = 1.0f, .wrist_x = 0.9f});
        scene->tick(TICK);
    }
    REQUIRE(scene->controller().manual_rotation() != 0.0f);

    // The worker's final sample is still sitting in the channel
    scene->gesture_channel().publish({.open_ratio = 1.0f, .wrist_x = 0.9f});
    scene->stop_gestures();
    REQUIRE(!scene->gesture_channel().has_pending());

    for (int i = 0; i < 600; i++) {
        scene->tick(TICK);
    }
    REQUIRE(scene->current_mode() == InteractionMode::Tree);
    REQUIRE(scene->controller().manual_rotation() == 0.0f);
    REQUIRE(scene->controller().target_rotation_speed() == Approx(idle));
    REQUIRE(scene->rotation_speed() == Approx(idle).margin(1e-3));
    REQUIRE(scene->gesture_mapper().smoothed_x() == Approx(scene->config().gesture.center));
}

TEST_CASE("Explode and reassemble leaves no landed snow", "[scene][snow]")
{
    auto config = small_scene();
    config.snow.spawn_radius = 4.0f;
    config.snow.initial_altitude = -4.0f;
    config.snow.initial_altitude_range = 0.1f;
    auto scene = make_scene(config);

    for (int i = 0; i < 150; i++) {
        scene->tick(TICK);
    }
    REQUIRE(scene->snow().landed_count() > 0);

    scene->toggle_mode();
    scene->tick(TICK);
    REQUIRE(scene->snow().landed_count() == 0);

    scene->toggle_mode();
    scene->tick(TICK);
    REQUIRE(scene->current_mode() == InteractionMode::Tree);
    REQUIRE(scene->snow().landed_count() == 0);
}

TEST_CASE("Scene publishes into instance staging", "[scene][staging]")
{
    auto scene = make_scene();
    InstanceStaging staging;
    auto spheres = staging.allocate("spheres", scene->spheres().size());
    auto cubes = staging.allocate("cubes", scene->cubes().size());
    auto snow = staging.allocate("snow", scene->snow().size());
    auto boxes = staging.allocate("gift boxes", scene->gifts().size());
    auto trim = staging.allocate("gift trim", scene->gifts().size() * GiftCluster::TRIM_PER_GIFT);
    auto topper = staging.allocate("topper", 1);

    SceneSinks sinks{
        .spheres = &spheres,
        .cubes = &cubes,
        .snow = &snow,
        .gift_boxes = &boxes,
        .gift_trim = &trim,
        .topper = &topper,
    };
    scene->publish_colors(sinks);
    scene->tick(TICK);
    scene->publish(sinks);

    auto records = staging.records();
    REQUIRE(records.size() == 120 + 180 + 300 + 6 + 18 + 1);

    const auto& star = records[topper.first()];
    REQUIRE(glm::vec3(star.model[3]) == scene->topper().transform().position);
    REQUIRE(glm::vec3(star.color) == scene->config().topper.color);

    const auto& flake = records[snow.first()];
    REQUIRE(glm::vec3(flake.color) == glm::vec3(1.0f));
    REQUIRE(glm::vec3(flake.model[3]) == scene->snow().particles()[0].position);

    SECTION("null sinks are skipped")
    {
        scene->publish({});
        scene->publish_colors({});
    }
}

TEST_CASE("Scene exposes tuning groups", "[scene][ui]")
{
    auto scene = make_scene();
    auto groups = scene->get_ui_callback_groups();
    REQUIRE(groups.size() == 6);
    for (const auto& group : groups) {
        REQUIRE(!group.title.empty());
        REQUIRE(!group.callbacks.empty());
    }

    SECTION("the Exploded toggle switches the mode")
    {
        const auto& interaction = groups.front().callbacks;
        for (const auto& callback : interaction) {
            if (const auto* toggle = callback.as_toggle()) {
                REQUIRE(!toggle->getter());
                toggle->setter(true);
            }
        }
        REQUIRE(scene->current_mode() == InteractionMode::Exploded);
    }
}
