#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/GestureSource.hpp>
#include <chrono>
#include <thread>

using namespace evergreen;
using namespace std::chrono_literals;
using Catch::Approx;

TEST_CASE("Synthetic source start and stop are safe to repeat", "[gesture][source]")
{
    GestureChannel channel;
    SyntheticGestureSource source({.interval = 5ms});
    REQUIRE(!source.running());

    SECTION("stop before start is a no-op")
    {
        source.stop();
        REQUIRE(!source.running());
    }

    SECTION("double start is refused")
    {
        REQUIRE(source.start(channel).has_value());
        REQUIRE(source.running());
        REQUIRE(!source.start(channel).has_value());
        source.stop();
    }

    SECTION("stop twice")
    {
        REQUIRE(source.start(channel).has_value());
        source.stop();
        source.stop();
        REQUIRE(!source.running());
    }

    SECTION("restart after stop")
    {
        REQUIRE(source.start(channel).has_value());
        source.stop();
        REQUIRE(source.start(channel).has_value());
        REQUIRE(source.running());
    }
}

TEST_CASE("Synthetic source publishes into the channel", "[gesture][source]")
{
    GestureChannel channel;
    SyntheticGestureSource source({.interval = 2ms});
    REQUIRE(source.start(channel).has_value());

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (channel.published_count() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    source.stop();

    REQUIRE(channel.published_count() >= 3);
    auto sample = channel.take();
    REQUIRE(sample.has_value());
    REQUIRE(sample->open_ratio == Approx(1.0f).margin(1e-3));

    SECTION("nothing arrives after stop")
    {
        auto count = channel.published_count();
        std::this_thread::sleep_for(20ms);
        REQUIRE(channel.published_count() == count);
    }
}

TEST_CASE("Scripted landmarks measure as the scripted hand", "[gesture][source]")
{
    SyntheticGestureConfig config;
    SyntheticGestureSource source(config);

    SECTION("closed hand at the centre")
    {
        auto sample = measure_hand(source.landmarks_at(0.0f));
        REQUIRE(sample.has_value());
        REQUIRE(sample->open_ratio == Approx(config.closed_ratio).margin(1e-4));
        REQUIRE(sample->wrist_x == Approx(0.5f).margin(1e-5));
    }

    SECTION("open hand in the second toggle period")
    {
        float seconds = config.toggle_period * 1.5f;
        auto sample = measure_hand(source.landmarks_at(seconds));
        REQUIRE(sample.has_value());
        REQUIRE(sample->open_ratio == Approx(config.open_ratio).margin(1e-4));
    }

    SECTION("wrist sweeps to the right after a quarter period")
    {
        auto sample = measure_hand(source.landmarks_at(config.sweep_period * 0.25f));
        REQUIRE(sample.has_value());
        REQUIRE(sample->wrist_x == Approx(0.5f + config.sweep_amplitude).margin(1e-4));
    }
}

TEST_CASE("Invalid synthetic configuration refuses to start", "[gesture][source]")
{
    GestureChannel channel;
    SyntheticGestureSource source({.interval = 0ms});
    REQUIRE(!source.start(channel).has_value());
    REQUIRE(!source.running());
}
