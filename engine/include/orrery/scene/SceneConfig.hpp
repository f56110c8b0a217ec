#pragma once

#include "orrery/core/cvar.hpp"
#include "orrery/scene/Camera.hpp"

namespace orrery::scene {

    // Console variables backing the scene defaults. All are persisted by saveToIni.
    namespace cvars {
        extern core::CVar<float> cam_fov_degrees;
        extern core::CVar<float> cam_near;
        extern core::CVar<float> cam_far;
        extern core::CVar<float> cam_aspect;
        extern core::CVar<float> orbit_distance;
        extern core::CVar<float> orbit_min_distance;
        extern core::CVar<float> orbit_max_distance;
        extern core::CVar<float> orbit_min_pitch;
        extern core::CVar<float> orbit_max_pitch;
        extern core::CVar<float> cam_move_speed;
        extern core::CVar<float> cam_look_sensitivity;
    }

    struct SceneConfig {
        float fovDegrees = 45.0f;
        float aspectRatio = 16.0f / 9.0f;
        float nearPlane = 0.1f;
        float farPlane = 10000.0f;
        float orbitDistance = 3.0f;
        OrbitLimits orbitLimits{};
        float moveSpeed = 2.5f;
        float lookSensitivity = 0.1f;

        // Snapshot of the current CVar values.
        static SceneConfig fromCVars();

        Perspective perspective() const;
        OrbitState orbitDefaults() const;
    };
}
