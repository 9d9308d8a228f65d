#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string_view>

namespace evergreen {

/**
 * @brief Discrete scene state shared by every animated component
 *
 * Components branch on this value each frame. The logical switch is
 * instantaneous, the visual transition comes from the components chasing
 * whichever target set belongs to the current mode.
 */
enum class InteractionMode : uint8_t {
    Tree = 0,
    Exploded = 1
};

[[nodiscard]] constexpr InteractionMode toggled(InteractionMode mode) {
    return mode == InteractionMode::Tree ? InteractionMode::Exploded : InteractionMode::Tree;
}

[[nodiscard]] constexpr std::string_view to_string(InteractionMode mode) {
    switch (mode) {
        case InteractionMode::Tree: return "Tree";
        case InteractionMode::Exploded: return "Exploded";
    }
    return "Unknown";
}

/**
 * @brief Per-instance transform handed to the render collaborator
 *
 * Rotation is XYZ Euler angles in radians, applied as Rx * Ry * Rz.
 */
struct InstanceTransform {
    glm::vec3 position{0.0f};
    glm::vec3 rotation{0.0f};
    glm::vec3 scale{1.0f};
};

} // namespace evergreen
