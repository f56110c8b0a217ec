#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>
#include "orrery/scene/Camera.hpp"

namespace orrery::scene {

// One frame of fly-camera input, already mapped from whatever device produced it.
struct CameraInput {
  glm::vec3 move{0.0f};      // x: right, y: up, z: forward; each in [-1, 1]
  glm::vec2 lookDelta{0.0f}; // pointer delta in pixels
  bool boost = false;
  bool lookEnabled = false;
};

class CameraController {
public:
  CameraController(const glm::vec3& position = {0.0f, 0.0f, -5.0f},
                   float yaw = 90.0f,
                   float pitch = 0.0f)
    : m_position(position)
    , m_yaw(yaw)
    , m_pitch(glm::clamp(pitch, -kMaxPitch, kMaxPitch))
  {
    updateVectors();
  }

  void update(const CameraInput& input, float deltaTime) {
    const float speed = (input.boost ? m_moveSpeed * m_boostFactor : m_moveSpeed) * deltaTime;

    m_position += m_right * (input.move.x * speed);
    m_position += m_worldUp * (input.move.y * speed);
    m_position += m_front * (input.move.z * speed);

    if (input.lookEnabled) {
      m_yaw -= input.lookDelta.x * m_mouseSensitivity;
      m_pitch -= input.lookDelta.y * m_mouseSensitivity; // Inverted Y
      m_pitch = glm::clamp(m_pitch, -kMaxPitch, kMaxPitch);
      updateVectors();
    }
  }

  // Orbit mode owns the pose; returns false and leaves the camera alone there.
  bool applyToCamera(Camera& camera) const {
    if (camera.isOrbit()) {
      return false;
    }
    camera.setUp(m_worldUp);
    camera.setPosition(m_position);
    camera.lookAt(m_position + m_front);
    return true;
  }

  // Picks up the camera's current pose so the next apply doesn't jump.
  void syncFromCamera(const Camera& camera) {
    m_position = camera.position();
    const glm::vec3 f = camera.forward();
    m_yaw = glm::degrees(std::atan2(f.z, f.x));
    m_pitch = glm::clamp(glm::degrees(std::asin(glm::clamp(f.y, -1.0f, 1.0f))), -kMaxPitch, kMaxPitch);
    updateVectors();
  }

  void setPosition(const glm::vec3& pos) { m_position = pos; }
  void setMoveSpeed(float speed) { m_moveSpeed = speed; }
  void setBoostFactor(float factor) { m_boostFactor = factor; }
  void setMouseSensitivity(float sensitivity) { m_mouseSensitivity = sensitivity; }

  [[nodiscard]] const glm::vec3& position() const { return m_position; }
  [[nodiscard]] const glm::vec3& front() const { return m_front; }
  [[nodiscard]] const glm::vec3& right() const { return m_right; }
  [[nodiscard]] float yaw() const { return m_yaw; }
  [[nodiscard]] float pitch() const { return m_pitch; }
  [[nodiscard]] float moveSpeed() const { return m_moveSpeed; }
  [[nodiscard]] float mouseSensitivity() const { return m_mouseSensitivity; }

  static constexpr float kMaxPitch = 89.0f;

private:
  void updateVectors() {
    glm::vec3 front;
    front.x = glm::cos(glm::radians(m_yaw)) * glm::cos(glm::radians(m_pitch));
    front.y = glm::sin(glm::radians(m_pitch));
    front.z = glm::sin(glm::radians(m_yaw)) * glm::cos(glm::radians(m_pitch));
    m_front = glm::normalize(front);

    // Left-handed: right = up x front
    m_right = glm::normalize(glm::cross(m_worldUp, m_front));
    m_up = glm::normalize(glm::cross(m_front, m_right));
  }

  glm::vec3 m_position{0.0f, 0.0f, -5.0f};
  glm::vec3 m_front{0.0f, 0.0f, 1.0f};
  glm::vec3 m_up{0.0f, 1.0f, 0.0f};
  glm::vec3 m_right{1.0f, 0.0f, 0.0f};
  glm::vec3 m_worldUp{Camera::kWorldUp};

  // Euler angles, degrees
  float m_yaw{90.0f};
  float m_pitch{0.0f};

  float m_moveSpeed{2.5f};
  float m_boostFactor{2.0f};
  float m_mouseSensitivity{0.1f};
};

} // namespace orrery::scene
