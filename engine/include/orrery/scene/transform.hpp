#pragma once

#include <glm/gtc/matrix_transform.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/gtx/quaternion.hpp>

namespace orrery::scene {

struct Transform {
  glm::vec3 m_translation{0.0f};
  glm::quat m_rotation{1.0f, 0.0f, 0.0f, 0.0f};
  glm::vec3 m_scale{1.0f};

  // Scale, then rotate, then translate.
  [[nodiscard]] glm::mat4 mat4() const {

    glm::mat4 mat = glm::translate(glm::mat4(1.0f), m_translation);
    mat = mat * glm::toMat4(m_rotation);
    mat = glm::scale(mat, m_scale);
    return mat;
  }

  // Decomposes an affine matrix with glm::decompose. Non-uniform scale is
  // accepted, shear and projective terms are discarded. A singular basis yields
  // an identity rotation.
  [[nodiscard]] static Transform fromMatrix(const glm::mat4& m);

  Transform& setRotation(const glm::quat& rotation) {
    m_rotation = glm::normalize(rotation);
    return *this;
  }

  Transform& rotate(float radians, const glm::vec3& axis) {
    m_rotation = glm::normalize(glm::rotate(m_rotation, radians, axis));
    return *this;
  }
};

}
