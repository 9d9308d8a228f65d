#pragma once

#include "SceneTypes.hpp"
#include <glm/glm.hpp>
#include <cstdint>

namespace evergreen {

/**
 * @brief Write-side interface of the render collaborator
 *
 * One sink per instance population. Animated components call set_transform()
 * once per instance per tick and set_color() once after construction.
 * The sink never calls back into the simulation.
 *
 * Contract:
 * - index is always < capacity(); anything else is a programming error
 * - Implementations must not allocate in set_transform()
 */
class InstanceSink {
public:
    virtual ~InstanceSink() = default;

    /**
     * @brief Number of instance slots available
     */
    [[nodiscard]] virtual uint32_t capacity() const = 0;

    /**
     * @brief Store the transform of instance @p index for this frame
     */
    virtual void set_transform(uint32_t index, const InstanceTransform& transform) = 0;

    /**
     * @brief Store the base color (sRGB, 0-1) of instance @p index
     */
    virtual void set_color(uint32_t index, const glm::vec3& color) = 0;
};

} // namespace evergreen
