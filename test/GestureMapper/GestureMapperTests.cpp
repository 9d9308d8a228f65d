#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/GestureMapper.hpp>
#include <array>

using namespace evergreen;
using Catch::Approx;

namespace {

struct EdgeCount {
    int opened = 0;
    int closed = 0;
};

EdgeCount feed(GestureMapper& mapper, std::initializer_list<float> ratios) {
    EdgeCount count;
    for (float ratio : ratios) {
        auto output = mapper.process({.open_ratio = ratio, .wrist_x = 0.5f});
        if (output.edge == HandEdge::Opened) count.opened++;
        if (output.edge == HandEdge::Closed) count.closed++;
    }
    return count;
}

} // namespace

TEST_CASE("Rotation command applies dead zone and gain", "[gesture][mapper]")
{
    const float center = 0.5f;
    const float dead_zone = 0.05f;
    const float sensitivity = 6.0f;

    REQUIRE(GestureMapper::rotation_command(0.8f, center, dead_zone, sensitivity) == Approx(1.5f));
    REQUIRE(GestureMapper::rotation_command(0.2f, center, dead_zone, sensitivity) == Approx(-1.5f));
    REQUIRE(GestureMapper::rotation_command(0.5f, center, dead_zone, sensitivity) == 0.0f);
    REQUIRE(GestureMapper::rotation_command(0.54f, center, dead_zone, sensitivity) == 0.0f);
    REQUIRE(GestureMapper::rotation_command(0.46f, center, dead_zone, sensitivity) == 0.0f);
}

TEST_CASE("Rising open ratio produces exactly one Opened edge", "[gesture][mapper]")
{
    GestureMapper mapper;
    EdgeCount total;
    for (int i = 0; i <= 60; i++) {
        float ratio = 1.0f + static_cast<float>(i) / 60.0f;
        auto count = feed(mapper, {ratio});
        total.opened += count.opened;
        total.closed += count.closed;
    }
    auto hold = feed(mapper, {2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f});

    REQUIRE(total.opened + hold.opened == 1);
    REQUIRE(total.closed + hold.closed == 0);
    REQUIRE(mapper.hand_open());
}

TEST_CASE("Ratio hovering between the thresholds never toggles", "[gesture][mapper]")
{
    SECTION("from closed")
    {
        GestureMapper mapper;
        auto count = feed(mapper, {1.26f, 1.34f, 1.27f, 1.33f, 1.30f, 1.34f, 1.26f, 1.34f, 1.34f, 1.34f,
                                   1.34f, 1.34f, 1.34f, 1.34f, 1.34f, 1.34f, 1.34f, 1.34f, 1.34f, 1.34f});
        REQUIRE(count.opened == 0);
        REQUIRE(count.closed == 0);
        REQUIRE(!mapper.hand_open());
    }

    SECTION("from open")
    {
        GestureMapper mapper;
        auto open = feed(mapper, {2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f});
        REQUIRE(open.opened == 1);

        auto count = feed(mapper, {1.26f, 1.34f, 1.26f, 1.34f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f,
                                   1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f, 1.26f});
        REQUIRE(count.opened == 0);
        REQUIRE(count.closed == 0);
        REQUIRE(mapper.hand_open());
    }
}

TEST_CASE("Closing the hand emits Closed once", "[gesture][mapper]")
{
    GestureMapper mapper;
    feed(mapper, {2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f, 2.0f});
    REQUIRE(mapper.hand_open());

    auto count = feed(mapper, {0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f, 0.9f});
    REQUIRE(count.closed == 1);
    REQUIRE(count.opened == 0);
    REQUIRE(!mapper.hand_open());
}

TEST_CASE("Wrist position is smoothed before mapping", "[gesture][mapper]")
{
    GestureMapper mapper;

    auto first = mapper.process({.open_ratio = 1.0f, .wrist_x = 1.0f});
    // 0.5 + (1.0 - 0.5) * 0.2 = 0.6, 0.05 past the dead zone
    REQUIRE(mapper.smoothed_x() == Approx(0.6f));
    REQUIRE(first.rotation_command == Approx(0.3f));

    for (int i = 0; i < 100; i++) {
        mapper.process({.open_ratio = 1.0f, .wrist_x = 1.0f});
    }
    REQUIRE(mapper.last_command() == Approx(2.7f).margin(1e-3));

    SECTION("reset restores the initial state")
    {
        mapper.reset();
        REQUIRE(mapper.smoothed_x() == Approx(0.5f));
        REQUIRE(mapper.smoothed_ratio() == Approx(mapper.config().initial_ratio));
        REQUIRE(mapper.last_command() == 0.0f);
        REQUIRE(!mapper.hand_open());
    }
}

TEST_CASE("Hand landmarks reduce to a gesture sample", "[gesture][landmarks]")
{
    std::array<glm::vec2, HAND_LANDMARK_COUNT> hand{};
    const glm::vec2 wrist{0.3f, 0.9f};
    hand.fill(wrist);
    for (std::size_t knuckle : {5u, 9u, 13u, 17u}) {
        hand[knuckle] = wrist + glm::vec2(0.0f, -0.1f);
    }
    for (std::size_t tip : {8u, 12u, 16u, 20u}) {
        hand[tip] = wrist + glm::vec2(0.0f, -0.15f);
    }

    auto sample = measure_hand(hand);
    REQUIRE(sample.has_value());
    REQUIRE(sample->open_ratio == Approx(1.5f));
    REQUIRE(sample->wrist_x == Approx(0.7f));

    SECTION("too few landmarks")
    {
        REQUIRE(!measure_hand(std::span(hand).first(20)).has_value());
    }

    SECTION("collapsed hand")
    {
        hand.fill(wrist);
        REQUIRE(!measure_hand(hand).has_value());
    }
}
