#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <evergreen/Color.hpp>

using namespace evergreen;
using Catch::Approx;

TEST_CASE("Hex colors parse into unit RGB", "[color]")
{
    SECTION("six digits")
    {
        auto gold = parse_hex_color("#FFD700");
        REQUIRE(gold.has_value());
        REQUIRE(gold->r == Approx(1.0f));
        REQUIRE(gold->g == Approx(215.0f / 255.0f));
        REQUIRE(gold->b == Approx(0.0f));
    }

    SECTION("three digits expand each nibble")
    {
        auto red = parse_hex_color("#f30");
        REQUIRE(red.has_value());
        REQUIRE(red->r == Approx(1.0f));
        REQUIRE(red->g == Approx(0.2f));
        REQUIRE(red->b == Approx(0.0f));
    }

    SECTION("leading hash is optional")
    {
        REQUIRE(parse_hex_color("013220").has_value());
    }

    SECTION("bad input reports an error")
    {
        REQUIRE(!parse_hex_color("#12345").has_value());
        REQUIRE(!parse_hex_color("#GGGGGG").has_value());
        REQUIRE(!parse_hex_color("").has_value());
    }
}

TEST_CASE("Shipped palettes are valid", "[color]")
{
    for (auto palette : {palettes::sphere_ornaments(), palettes::cube_ornaments(),
                         palettes::gift_reds(), palettes::gift_greens()}) {
        auto parsed = parse_palette(palette);
        REQUIRE(parsed.has_value());
        REQUIRE(parsed->size() == palette.size());
    }
}

TEST_CASE("HSL conversion", "[color]")
{
    SECTION("pure red")
    {
        auto hsl = rgb_to_hsl({1.0f, 0.0f, 0.0f});
        REQUIRE(hsl.x == Approx(0.0f));
        REQUIRE(hsl.y == Approx(1.0f));
        REQUIRE(hsl.z == Approx(0.5f));
    }

    SECTION("grey has no saturation")
    {
        auto hsl = rgb_to_hsl(glm::vec3(0.4f));
        REQUIRE(hsl.y == 0.0f);
        REQUIRE(hsl.z == Approx(0.4f));
    }

    SECTION("forest green survives a round trip")
    {
        glm::vec3 green{34.0f / 255.0f, 139.0f / 255.0f, 34.0f / 255.0f};
        auto back = hsl_to_rgb(rgb_to_hsl(green));
        REQUIRE(back.r == Approx(green.r).margin(1e-5));
        REQUIRE(back.g == Approx(green.g).margin(1e-5));
        REQUIRE(back.b == Approx(green.b).margin(1e-5));
    }
}

TEST_CASE("Lightness offset brightens and clamps", "[color]")
{
    glm::vec3 dark_red{139.0f / 255.0f, 0.0f, 0.0f};
    auto lighter = offset_hsl(dark_red, 0.0f, 0.0f, 0.2f);
    REQUIRE(rgb_to_hsl(lighter).z == Approx(rgb_to_hsl(dark_red).z + 0.2f).margin(1e-5));

    auto white = offset_hsl(dark_red, 0.0f, 0.0f, 5.0f);
    REQUIRE(white.r == Approx(1.0f));
    REQUIRE(white.g == Approx(1.0f));
    REQUIRE(white.b == Approx(1.0f));
}
