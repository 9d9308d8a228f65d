#pragma once

#include "SceneTypes.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace evergreen {

/// Rotation of XYZ Euler angles, composed as Rx * Ry * Rz.
[[nodiscard]] inline glm::mat4 rotation_matrix(const glm::vec3& euler) {
    glm::mat4 m = glm::rotate(glm::mat4(1.0f), euler.x, glm::vec3(1.0f, 0.0f, 0.0f));
    m = glm::rotate(m, euler.y, glm::vec3(0.0f, 1.0f, 0.0f));
    return glm::rotate(m, euler.z, glm::vec3(0.0f, 0.0f, 1.0f));
}

/// T * R * S of an instance transform.
[[nodiscard]] inline glm::mat4 model_matrix(const InstanceTransform& transform) {
    glm::mat4 m = glm::translate(glm::mat4(1.0f), transform.position);
    m = m * rotation_matrix(transform.rotation);
    return glm::scale(m, transform.scale);
}

} // namespace evergreen
