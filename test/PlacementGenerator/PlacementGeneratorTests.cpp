#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Color.hpp>
#include <evergreen/PlacementGenerator.hpp>
#include <cmath>

using namespace evergreen;
using Catch::Approx;

TEST_CASE("Empty population yields empty buffers", "[placement]")
{
    PlacementGenerator generator;
    std::mt19937 rng(7);
    std::vector<glm::vec3> no_palette;

    auto placement = generator.generate(0, no_palette, rng);
    REQUIRE(placement.has_value());
    REQUIRE(placement->tree_targets.empty());
    REQUIRE(placement->exploded_targets.empty());
    REQUIRE(placement->colors.empty());
}

TEST_CASE("Empty palette is rejected for a non-empty population", "[placement]")
{
    PlacementGenerator generator;
    std::mt19937 rng(7);
    std::vector<glm::vec3> no_palette;

    REQUIRE(!generator.generate(10, no_palette, rng).has_value());
}

TEST_CASE("Tree targets follow the cone spiral", "[placement]")
{
    PlacementConfig config;
    config.tree.jitter = 0.0f;
    PlacementGenerator generator(config);
    std::mt19937 rng(1);

    constexpr uint32_t count = 500;
    auto targets = generator.tree_targets(count, rng);
    REQUIRE(targets.size() == count);

    SECTION("heights span [-h/2, h/2) in index order")
    {
        REQUIRE(targets.front().y == Approx(-config.tree.height * 0.5f));
        for (uint32_t i = 1; i < count; i++) {
            REQUIRE(targets[i].y > targets[i - 1].y);
            REQUIRE(targets[i].y < config.tree.height * 0.5f);
        }
    }

    SECTION("radius shrinks toward the top")
    {
        for (uint32_t i : {0u, 100u, 250u, 499u}) {
            float radius = std::hypot(targets[i].x, targets[i].z);
            REQUIRE(radius == Approx(generator.tree_radius(i, count)).margin(1e-4));
        }
        REQUIRE(generator.tree_radius(0, count) ==
                Approx(config.tree.base_radius + config.tree.tip_radius));
        REQUIRE(generator.tree_radius(count - 1, count) < 0.3f);
    }
}

TEST_CASE("Exploded targets lie in the shell", "[placement]")
{
    PlacementGenerator generator;
    std::mt19937 rng(3);
    const auto& shell = generator.config().explosion;

    auto targets = generator.exploded_targets(1000, rng);
    REQUIRE(targets.size() == 1000);
    for (const auto& target : targets) {
        float radius = glm::length(target);
        REQUIRE(radius >= shell.base_radius - 1e-3f);
        REQUIRE(radius <= shell.base_radius + shell.radius_extent + 1e-3f);
    }
}

TEST_CASE("Colors come from the palette or its lightened variant", "[placement]")
{
    auto palette = parse_palette(palettes::cube_ornaments());
    REQUIRE(palette.has_value());

    PlacementGenerator generator;
    std::mt19937 rng(11);
    auto colors = generator.assign_colors(400, *palette, rng);
    REQUIRE(colors.has_value());
    REQUIRE(colors->size() == 400);

    const float offset = generator.config().color.lightness_offset;
    uint32_t lightened = 0;
    for (const auto& color : *colors) {
        bool found = false;
        for (const auto& entry : *palette) {
            if (glm::all(glm::lessThan(glm::abs(color - entry), glm::vec3(1e-5f)))) {
                found = true;
            } else if (glm::all(glm::lessThan(glm::abs(color - offset_hsl(entry, 0.0f, 0.0f, offset)), glm::vec3(1e-5f)))) {
                found = true;
                lightened++;
            }
        }
        REQUIRE(found);
    }
    // 20% chance over 400 draws
    REQUIRE(lightened > 20);
    REQUIRE(lightened < 160);
}
