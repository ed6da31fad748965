#pragma once

#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

namespace minir::renderer::scene {

// Position / Euler rotation (degrees) / scale. Rotation is applied X, then Y,
// then Z, after scaling and before translation.
struct Transform {
  glm::vec3 m_position{0.0f};
  glm::vec3 m_rotation{0.0f};
  glm::vec3 m_scale{1.0f};

  [[nodiscard]] glm::mat4 mat4() const {
    glm::mat4 mat = glm::translate(glm::mat4(1.0f), m_position);
    mat = glm::rotate(mat, glm::radians(m_rotation.z), glm::vec3(0.0f, 0.0f, 1.0f));
    mat = glm::rotate(mat, glm::radians(m_rotation.y), glm::vec3(0.0f, 1.0f, 0.0f));
    mat = glm::rotate(mat, glm::radians(m_rotation.x), glm::vec3(1.0f, 0.0f, 0.0f));
    mat = glm::scale(mat, m_scale);
    return mat;
  }

  bool operator==(const Transform &) const = default;
};

}
