#pragma once

#include <glm/glm.hpp>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace evergreen {

/**
 * @brief Parse "#RRGGBB" or "#RGB" into RGB in [0, 1]
 */
[[nodiscard]] std::expected<glm::vec3, std::string> parse_hex_color(std::string_view hex);

/**
 * @brief Parse a list of hex colors, failing on the first bad entry
 */
[[nodiscard]] std::expected<std::vector<glm::vec3>, std::string> parse_palette(std::span<const std::string_view> hex_colors);

/// RGB in [0,1] to HSL (hue in [0,1)).
[[nodiscard]] glm::vec3 rgb_to_hsl(const glm::vec3& rgb);

/// HSL (hue in [0,1)) to RGB in [0,1].
[[nodiscard]] glm::vec3 hsl_to_rgb(const glm::vec3& hsl);

/**
 * @brief Shift a color in HSL space
 *
 * Hue wraps around, saturation and lightness are clamped to [0, 1].
 */
[[nodiscard]] glm::vec3 offset_hsl(const glm::vec3& rgb, float hue, float saturation, float lightness);

namespace palettes {

/// Ornament sphere palette: gold and red.
[[nodiscard]] std::span<const std::string_view> sphere_ornaments();

/// Ornament cube palette: gold and green.
[[nodiscard]] std::span<const std::string_view> cube_ornaments();

/// Gift box reds.
[[nodiscard]] std::span<const std::string_view> gift_reds();

/// Gift box greens.
[[nodiscard]] std::span<const std::string_view> gift_greens();

} // namespace palettes

} // namespace evergreen
