#include <evergreen/Color.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <format>

namespace evergreen {

namespace {

constexpr std::array<std::string_view, 5> SPHERE_COLORS = {"#FFD700", "#FFD700", "#D4AF37", "#C41E3A", "#8B0000"};
constexpr std::array<std::string_view, 5> CUBE_COLORS = {"#FFD700", "#D4AF37", "#006400", "#228B22", "#013220"};
constexpr std::array<std::string_view, 3> GIFT_REDS = {"#D40000", "#B22222", "#8B0000"};
constexpr std::array<std::string_view, 3> GIFT_GREENS = {"#006400", "#228B22", "#004d00"};

float hue_to_channel(float p, float q, float t) {
    if (t < 0.0f) t += 1.0f;
    if (t > 1.0f) t -= 1.0f;
    if (t < 1.0f / 6.0f) return p + (q - p) * 6.0f * t;
    if (t < 1.0f / 2.0f) return q;
    if (t < 2.0f / 3.0f) return p + (q - p) * 6.0f * (2.0f / 3.0f - t);
    return p;
}

} // anonymous namespace

std::expected<glm::vec3, std::string> parse_hex_color(std::string_view hex) {
    if (hex.starts_with('#')) {
        hex.remove_prefix(1);
    }
    if (hex.size() != 6 && hex.size() != 3) {
        return std::unexpected(std::format("Color '{}' must have 3 or 6 hex digits", hex));
    }

    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + hex.size(), value, 16);
    if (ec != std::errc{} || ptr != hex.data() + hex.size()) {
        return std::unexpected(std::format("Color '{}' is not valid hex", hex));
    }

    if (hex.size() == 3) {
        // #RGB expands each digit: 0xF -> 0xFF
        uint32_t r = (value >> 8) & 0xF;
        uint32_t g = (value >> 4) & 0xF;
        uint32_t b = value & 0xF;
        value = (r * 17u) << 16 | (g * 17u) << 8 | (b * 17u);
    }

    return glm::vec3(
        static_cast<float>((value >> 16) & 0xFF) / 255.0f,
        static_cast<float>((value >> 8) & 0xFF) / 255.0f,
        static_cast<float>(value & 0xFF) / 255.0f
    );
}

std::expected<std::vector<glm::vec3>, std::string> parse_palette(std::span<const std::string_view> hex_colors) {
    std::vector<glm::vec3> palette;
    palette.reserve(hex_colors.size());
    for (auto hex : hex_colors) {
        auto color = parse_hex_color(hex);
        if (!color) {
            return std::unexpected(color.error());
        }
        palette.push_back(*color);
    }
    return palette;
}

glm::vec3 rgb_to_hsl(const glm::vec3& rgb) {
    float max = std::max({rgb.r, rgb.g, rgb.b});
    float min = std::min({rgb.r, rgb.g, rgb.b});
    float lightness = (max + min) * 0.5f;

    if (max == min) {
        return {0.0f, 0.0f, lightness};
    }

    float delta = max - min;
    float saturation = lightness <= 0.5f ? delta / (max + min) : delta / (2.0f - max - min);

    float hue;
    if (max == rgb.r) {
        hue = (rgb.g - rgb.b) / delta + (rgb.g < rgb.b ? 6.0f : 0.0f);
    } else if (max == rgb.g) {
        hue = (rgb.b - rgb.r) / delta + 2.0f;
    } else {
        hue = (rgb.r - rgb.g) / delta + 4.0f;
    }

    return {hue / 6.0f, saturation, lightness};
}

glm::vec3 hsl_to_rgb(const glm::vec3& hsl) {
    float hue = hsl.x - std::floor(hsl.x);
    float saturation = std::clamp(hsl.y, 0.0f, 1.0f);
    float lightness = std::clamp(hsl.z, 0.0f, 1.0f);

    if (saturation == 0.0f) {
        return glm::vec3(lightness);
    }

    float q = lightness <= 0.5f ? lightness * (1.0f + saturation) : lightness + saturation - lightness * saturation;
    float p = 2.0f * lightness - q;

    return {
        hue_to_channel(p, q, hue + 1.0f / 3.0f),
        hue_to_channel(p, q, hue),
        hue_to_channel(p, q, hue - 1.0f / 3.0f)
    };
}

glm::vec3 offset_hsl(const glm::vec3& rgb, float hue, float saturation, float lightness) {
    auto hsl = rgb_to_hsl(rgb);
    hsl.x += hue;
    hsl.y += saturation;
    hsl.z += lightness;
    return hsl_to_rgb(hsl);
}

namespace palettes {

std::span<const std::string_view> sphere_ornaments() { return SPHERE_COLORS; }
std::span<const std::string_view> cube_ornaments() { return CUBE_COLORS; }
std::span<const std::string_view> gift_reds() { return GIFT_REDS; }
std::span<const std::string_view> gift_greens() { return GIFT_GREENS; }

} // namespace palettes

} // namespace evergreen
