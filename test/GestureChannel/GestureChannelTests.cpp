#include <catch2/catch_test_macros.hpp>

#include <evergreen/GestureChannel.hpp>
#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace evergreen;

TEST_CASE("Channel starts empty", "[gesture][channel]")
{
    GestureChannel channel;
    REQUIRE(!channel.has_pending());
    REQUIRE(!channel.take().has_value());
    REQUIRE(channel.published_count() == 0);
}

TEST_CASE("Channel keeps only the latest sample", "[gesture][channel]")
{
    GestureChannel channel;
    channel.publish({.open_ratio = 1.1f, .wrist_x = 0.1f});
    channel.publish({.open_ratio = 1.2f, .wrist_x = 0.2f});
    channel.publish({.open_ratio = 1.3f, .wrist_x = 0.3f});

    REQUIRE(channel.has_pending());
    REQUIRE(channel.published_count() == 3);

    auto sample = channel.take();
    REQUIRE(sample.has_value());
    REQUIRE(sample->open_ratio == 1.3f);
    REQUIRE(sample->wrist_x == 0.3f);

    SECTION("a sample is taken exactly once")
    {
        REQUIRE(!channel.take().has_value());
        REQUIRE(!channel.has_pending());
    }
}

TEST_CASE("Clearing the channel drops the pending sample", "[gesture][channel]")
{
    GestureChannel channel;
    channel.publish({.open_ratio = 1.0f, .wrist_x = 0.9f});
    channel.clear();
    REQUIRE(!channel.has_pending());
    REQUIRE(!channel.take().has_value());
    REQUIRE(channel.published_count() == 1);

    SECTION("later samples still arrive")
    {
        channel.publish({.open_ratio = 1.2f, .wrist_x = 0.4f});
        REQUIRE(channel.take().has_value());
    }
}

TEST_CASE("Channel drops non-finite samples", "[gesture][channel]")
{
    GestureChannel channel;
    channel.publish({.open_ratio = std::numeric_limits<float>::quiet_NaN(), .wrist_x = 0.5f});
    channel.publish({.open_ratio = 1.0f, .wrist_x = std::numeric_limits<float>::infinity()});
    REQUIRE(!channel.has_pending());
    REQUIRE(channel.published_count() == 0);
}

TEST_CASE("Channel never tears a sample across threads", "[gesture][channel]")
{
    GestureChannel channel;
    std::atomic<bool> done{false};

    std::thread writer([&] {
        for (int i = 1; i <= 200000; i++) {
            float value = static_cast<float>(i);
            channel.publish({.open_ratio = value, .wrist_x = -value});
        }
        done.store(true);
    });

    uint64_t taken = 0;
    float last = 0.0f;
    bool consistent = true;
    bool ordered = true;
    while (!done.load() || channel.has_pending()) {
        if (auto sample = channel.take()) {
            taken++;
            consistent = consistent && sample->wrist_x == -sample->open_ratio;
            ordered = ordered && sample->open_ratio > last;
            last = sample->open_ratio;
        }
    }
    writer.join();

    REQUIRE(consistent);
    REQUIRE(ordered);
    REQUIRE(taken >= 1);
    REQUIRE(last == 200000.0f);
}
