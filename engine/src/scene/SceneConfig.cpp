#include "orrery/scene/SceneConfig.hpp"
#include <glm/gtc/constants.hpp>

namespace orrery::scene {

    namespace cvars {
        using core::CVarFlags;

        AUTO_CVAR_FLOAT(cam_fov_degrees, "Vertical field of view in degrees", 45.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(cam_near, "Near clip distance", 0.1f, CVarFlags::save);
        AUTO_CVAR_FLOAT(cam_far, "Far clip distance", 10000.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(cam_aspect, "Initial aspect ratio until the first resize", 16.0f / 9.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(orbit_distance, "Orbit distance used when switching to orbit mode", 3.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(orbit_min_distance, "Closest orbit distance", 1.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(orbit_max_distance, "Furthest orbit distance", 20.0f, CVarFlags::save);
        AUTO_CVAR_FLOAT(orbit_min_pitch, "Lowest orbit pitch in radians", -0.2f * glm::pi<float>(), CVarFlags::save);
        AUTO_CVAR_FLOAT(orbit_max_pitch, "Highest orbit pitch in radians", 0.45f * glm::pi<float>(), CVarFlags::save);
        AUTO_CVAR_FLOAT(cam_move_speed, "Free camera speed in units per second", 2.5f, CVarFlags::save);
        AUTO_CVAR_FLOAT(cam_look_sensitivity, "Free camera degrees per pixel of pointer motion", 0.1f, CVarFlags::save);
    }

    SceneConfig SceneConfig::fromCVars() {
        SceneConfig cfg;
        cfg.fovDegrees = cvars::cam_fov_degrees.get();
        cfg.aspectRatio = cvars::cam_aspect.get();
        cfg.nearPlane = cvars::cam_near.get();
        cfg.farPlane = cvars::cam_far.get();
        cfg.orbitDistance = cvars::orbit_distance.get();
        cfg.orbitLimits.minDistance = cvars::orbit_min_distance.get();
        cfg.orbitLimits.maxDistance = cvars::orbit_max_distance.get();
        cfg.orbitLimits.minPitch = cvars::orbit_min_pitch.get();
        cfg.orbitLimits.maxPitch = cvars::orbit_max_pitch.get();
        cfg.moveSpeed = cvars::cam_move_speed.get();
        cfg.lookSensitivity = cvars::cam_look_sensitivity.get();
        return cfg;
    }

    Perspective SceneConfig::perspective() const {
        return Perspective{glm::radians(fovDegrees), aspectRatio, nearPlane, farPlane};
    }

    OrbitState SceneConfig::orbitDefaults() const {
        OrbitState state;
        state.distance = orbitDistance;
        return state;
    }
}
