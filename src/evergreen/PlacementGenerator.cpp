#include <evergreen/PlacementGenerator.hpp>
#include <evergreen/Color.hpp>
#include <evergreen/Logger.hpp>
#include <evergreen/Random.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace evergreen {

PlacementGenerator::PlacementGenerator(const PlacementConfig& config)
    : m_config(config)
{}

float PlacementGenerator::tree_height(uint32_t index, uint32_t count) const {
    if (count == 0) {
        return 0.0f;
    }
    const auto& tree = m_config.tree;
    return (static_cast<float>(index) / static_cast<float>(count)) * tree.height - tree.height * 0.5f;
}

float PlacementGenerator::tree_radius(uint32_t index, uint32_t count) const {
    const auto& tree = m_config.tree;
    // level runs 0 at the bottom to 1 at the top
    float level = (tree_height(index, count) + tree.height * 0.5f) / tree.height;
    return tree.base_radius * (1.0f - level) + tree.tip_radius;
}

std::vector<glm::vec3> PlacementGenerator::tree_targets(uint32_t count, std::mt19937& rng) const {
    std::vector<glm::vec3> targets;
    targets.reserve(count);

    const auto& tree = m_config.tree;
    for (uint32_t i = 0; i < count; i++) {
        float radius = tree_radius(i, count);
        float theta = static_cast<float>(i) * tree.angle_step;

        targets.emplace_back(
            radius * std::cos(theta) + centered(rng, tree.jitter),
            tree_height(i, count),
            radius * std::sin(theta) + centered(rng, tree.jitter)
        );
    }

    return targets;
}

std::vector<glm::vec3> PlacementGenerator::exploded_targets(uint32_t count, std::mt19937& rng) const {
    std::vector<glm::vec3> targets;
    targets.reserve(count);

    const auto& shell = m_config.explosion;
    const float n = static_cast<float>(count);
    for (uint32_t i = 0; i < count; i++) {
        float phi = std::acos(-1.0f + (2.0f * static_cast<float>(i)) / n);
        float azimuth = std::sqrt(n * glm::pi<float>()) * phi;
        float radius = shell.base_radius + uniform01(rng) * shell.radius_extent;

        targets.emplace_back(
            radius * std::cos(azimuth) * std::sin(phi),
            radius * std::sin(azimuth) * std::sin(phi),
            radius * std::cos(phi)
        );
    }

    return targets;
}

std::expected<std::vector<glm::vec3>, std::string> PlacementGenerator::assign_colors(
    uint32_t count,
    std::span<const glm::vec3> palette,
    std::mt19937& rng
) const {
    if (count > 0 && palette.empty()) {
        return std::unexpected("Cannot assign colors from an empty palette");
    }

    std::vector<glm::vec3> colors;
    colors.reserve(count);

    const auto& variation = m_config.color;
    std::uniform_int_distribution<size_t> pick(0, palette.empty() ? 0 : palette.size() - 1);
    for (uint32_t i = 0; i < count; i++) {
        glm::vec3 color = palette[pick(rng)];
        if (uniform01(rng) < variation.lightness_chance) {
            color = offset_hsl(color, 0.0f, 0.0f, variation.lightness_offset);
        }
        colors.push_back(color);
    }

    return colors;
}

std::expected<PlacementSet, std::string> PlacementGenerator::generate(
    uint32_t count,
    std::span<const glm::vec3> palette,
    std::mt19937& rng
) const {
    if (!m_config.is_valid()) {
        return std::unexpected("Invalid placement configuration");
    }

    auto colors = assign_colors(count, palette, rng);
    if (!colors) {
        return std::unexpected(colors.error());
    }

    PlacementSet placement{
        .tree_targets = tree_targets(count, rng),
        .exploded_targets = exploded_targets(count, rng),
        .colors = std::move(*colors)
    };

    Logger::instance().debug("Generated placement for {} instances", count);
    return placement;
}

} // namespace evergreen
