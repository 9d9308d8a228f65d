#pragma once

#include <glm/glm.hpp>
#include <cstdint>

namespace evergreen {

/**
 * @brief Abstract camera interface
 *
 * The renderer only needs a view-projection matrix and an eye position.
 */
class Camera {
public:
    virtual ~Camera() = default;

    /**
     * @brief World to clip space
     */
    [[nodiscard]] virtual glm::mat4 view_projection_matrix() = 0;

    virtual void handle_resize(uint32_t width, uint32_t height) = 0;

    [[nodiscard]] virtual glm::vec3 position() = 0;
};

} // namespace evergreen
