#pragma once

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/constants.hpp>
#include <optional>
#include <variant>
#include <cstdint>

#include "orrery/geometry/Frustum.hpp"

namespace orrery::scene {

    struct Perspective {
        float fov = glm::radians(45.0f); // vertical, radians
        float aspectRatio = 16.0f / 9.0f;
        float near = 0.1f;
        float far = 10000.0f;
    };

    struct Orthographic {
        float width = 10.0f;
        float height = 10.0f;
        float near = 0.1f;
        float far = 1000.0f;
    };

    using Projection = std::variant<Perspective, Orthographic>;

    enum class CameraMode : uint8_t {
        Free,
        Orbit
    };

    struct OrbitLimits {
        float minDistance = 1.0f;
        float maxDistance = 20.0f;
        float minPitch = -0.2f * glm::pi<float>();
        float maxPitch = 0.45f * glm::pi<float>();
    };

    // Spherical coordinates around target; yaw about +Y, pitch towards +Y.
    struct OrbitState {
        glm::vec3 target{0.0f};
        float distance = 3.0f;
        float yaw = 0.0f;
        float pitch = 0.0f;
    };

    // Left-handed camera with a [0, 1] depth range. Orientation is stored as a
    // quaternion whose third basis column is the forward direction.
    class Camera {
    public:
        static inline const glm::vec3 kWorldUp{0.0f, 1.0f, 0.0f};

        Camera() = default;
        explicit Camera(Projection projection);
        // Starts in orbit mode and places the camera from the orbit parameters.
        Camera(Projection projection, OrbitState orbit, OrbitLimits limits = {});

        glm::mat4 projectionMatrix() const;
        glm::mat4 viewMatrix() const;
        glm::mat4 viewProjection() const { return projectionMatrix() * viewMatrix(); }

        geometry::Frustum frustum(bool normalizePlanes = true) const;

        void lookAt(const glm::vec3& target);

        glm::vec3 forward() const;
        glm::vec3 right() const;

        void setPosition(const glm::vec3& position) { m_position = position; }
        void setRotation(const glm::quat& rotation);
        void setUp(const glm::vec3& up) { m_up = up; }
        void setProjection(const Projection& projection) { m_projection = projection; }
        void setAspectRatio(float aspect);

        const glm::vec3& position() const { return m_position; }
        const glm::quat& rotation() const { return m_rotation; }
        const glm::vec3& up() const { return m_up; }
        const Projection& projection() const { return m_projection; }

        CameraMode mode() const { return m_mode; }
        bool isOrbit() const { return m_mode == CameraMode::Orbit; }
        const OrbitState& orbit() const { return m_orbit; }
        const OrbitLimits& orbitLimits() const { return m_limits; }

        void switchToOrbitMode(std::optional<glm::vec3> target = std::nullopt,
                               std::optional<float> distance = std::nullopt);
        // Freezes the camera at its last pose.
        void switchToFreeMode();

        // Orbit-only, ignored in free mode.
        void rotateOrbit(float deltaYaw, float deltaPitch);
        void zoomOrbit(float delta);
        void setOrbitTarget(const glm::vec3& target);
        void setOrbitLimits(const OrbitLimits& limits);

        // Used by switchToOrbitMode when no override is given.
        void setOrbitDefaults(const OrbitState& defaults) { m_orbitDefaults = defaults; }

    private:
        void updateOrbitPosition();

        glm::vec3 m_position{0.0f};
        glm::vec3 m_up{kWorldUp};
        glm::quat m_rotation{1.0f, 0.0f, 0.0f, 0.0f};
        Projection m_projection{Perspective{}};

        CameraMode m_mode = CameraMode::Free;
        OrbitState m_orbit{};
        OrbitState m_orbitDefaults{};
        OrbitLimits m_limits{};
    };

} // namespace orrery::scene
