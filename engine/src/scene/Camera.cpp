#include "orrery/scene/Camera.hpp"
#include "orrery/core/logger.hpp"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/norm.hpp>
#include <algorithm>
#include <cmath>

namespace orrery::scene
{
    namespace
    {
        constexpr float kDegenerateEpsilon = 1e-12f;

        template <typename... Ts>
        struct Overloaded : Ts...
        {
            using Ts::operator()...;
        };
        template <typename... Ts>
        Overloaded(Ts...) -> Overloaded<Ts...>;

        bool isInverted(const OrbitLimits& limits)
        {
            return limits.minDistance > limits.maxDistance || limits.minPitch > limits.maxPitch;
        }

        void warnInverted(const OrbitLimits& limits)
        {
            core::Logger::warn("Ignoring inverted orbit limits [{}, {}] / [{}, {}]",
                               limits.minDistance, limits.maxDistance, limits.minPitch, limits.maxPitch);
        }
    } // namespace

    Camera::Camera(Projection projection)
        : m_projection(projection)
    {
    }

    Camera::Camera(Projection projection, OrbitState orbit, OrbitLimits limits)
        : m_projection(projection)
        , m_mode(CameraMode::Orbit)
        , m_orbit(orbit)
        , m_orbitDefaults(orbit)
        , m_limits(limits)
    {
        if (isInverted(m_limits))
        {
            warnInverted(m_limits);
            m_limits = OrbitLimits{};
        }
        m_orbit.distance = std::clamp(m_orbit.distance, m_limits.minDistance, m_limits.maxDistance);
        m_orbit.pitch = std::clamp(m_orbit.pitch, m_limits.minPitch, m_limits.maxPitch);
        updateOrbitPosition();
    }

    glm::mat4 Camera::projectionMatrix() const
    {
        return std::visit(Overloaded{
            [](const Perspective& p) {
                return glm::perspectiveLH_ZO(p.fov, p.aspectRatio, p.near, p.far);
            },
            [](const Orthographic& o) {
                const float hw = o.width * 0.5f;
                const float hh = o.height * 0.5f;
                return glm::orthoLH_ZO(-hw, hw, -hh, hh, o.near, o.far);
            },
        }, m_projection);
    }

    glm::vec3 Camera::forward() const
    {
        return glm::mat3_cast(m_rotation)[2];
    }

    glm::vec3 Camera::right() const
    {
        return glm::mat3_cast(m_rotation)[0];
    }

    glm::mat4 Camera::viewMatrix() const
    {
        return glm::lookAtLH(m_position, m_position + forward(), m_up);
    }

    geometry::Frustum Camera::frustum(bool normalizePlanes) const
    {
        return geometry::Frustum::extractPlanes(viewProjection(), normalizePlanes);
    }

    void Camera::lookAt(const glm::vec3& target)
    {
        const glm::vec3 toTarget = target - m_position;
        if (glm::length2(toTarget) < kDegenerateEpsilon)
        {
            core::Logger::debug("Camera::lookAt target coincides with the camera position, keeping orientation");
            return;
        }
        const glm::vec3 fwd = glm::normalize(toTarget);
        const glm::vec3 side = glm::cross(m_up, fwd);
        if (glm::length2(side) < kDegenerateEpsilon)
        {
            core::Logger::debug("Camera::lookAt direction is parallel to up, keeping orientation");
            return;
        }
        const glm::vec3 rightAxis = glm::normalize(side);
        const glm::vec3 upAxis = glm::cross(fwd, rightAxis);

        const glm::mat3 basis{rightAxis, upAxis, fwd};
        m_rotation = glm::normalize(glm::quat_cast(basis));
    }

    void Camera::setRotation(const glm::quat& rotation)
    {
        m_rotation = glm::normalize(rotation);
    }

    void Camera::setAspectRatio(float aspect)
    {
        if (!(aspect > 0.0f) || !std::isfinite(aspect))
        {
            return;
        }
        if (auto* persp = std::get_if<Perspective>(&m_projection))
        {
            persp->aspectRatio = aspect;
        }
    }

    void Camera::switchToOrbitMode(std::optional<glm::vec3> target, std::optional<float> distance)
    {
        m_mode = CameraMode::Orbit;
        m_orbit.yaw = 0.0f;
        m_orbit.pitch = std::clamp(0.0f, m_limits.minPitch, m_limits.maxPitch);
        m_orbit.target = target.value_or(m_orbitDefaults.target);
        m_orbit.distance = std::clamp(distance.value_or(m_orbitDefaults.distance),
                                      m_limits.minDistance, m_limits.maxDistance);
        core::Logger::debug("Camera switched to orbit mode (distance {})", m_orbit.distance);
        updateOrbitPosition();
    }

    void Camera::switchToFreeMode()
    {
        m_mode = CameraMode::Free;
        core::Logger::debug("Camera switched to free mode");
    }

    void Camera::rotateOrbit(float deltaYaw, float deltaPitch)
    {
        if (m_mode != CameraMode::Orbit) return;
        m_orbit.yaw += deltaYaw;
        m_orbit.pitch = std::clamp(m_orbit.pitch + deltaPitch, m_limits.minPitch, m_limits.maxPitch);
        updateOrbitPosition();
    }

    void Camera::zoomOrbit(float delta)
    {
        if (m_mode != CameraMode::Orbit) return;
        m_orbit.distance = std::clamp(m_orbit.distance + delta, m_limits.minDistance, m_limits.maxDistance);
        updateOrbitPosition();
    }

    void Camera::setOrbitTarget(const glm::vec3& target)
    {
        if (m_mode != CameraMode::Orbit) return;
        m_orbit.target = target;
        updateOrbitPosition();
    }

    void Camera::setOrbitLimits(const OrbitLimits& limits)
    {
        if (m_mode != CameraMode::Orbit) return;
        if (isInverted(limits))
        {
            warnInverted(limits);
            return;
        }
        m_limits = limits;
        m_orbit.distance = std::clamp(m_orbit.distance, m_limits.minDistance, m_limits.maxDistance);
        m_orbit.pitch = std::clamp(m_orbit.pitch, m_limits.minPitch, m_limits.maxPitch);
        updateOrbitPosition();
    }

    void Camera::updateOrbitPosition()
    {
        const float cosPitch = std::cos(m_orbit.pitch);
        const glm::vec3 offset{
            cosPitch * std::cos(m_orbit.yaw),
            std::sin(m_orbit.pitch),
            cosPitch * std::sin(m_orbit.yaw),
        };
        m_position = m_orbit.target + offset * m_orbit.distance;
        lookAt(m_orbit.target);
    }
} // namespace orrery::scene
