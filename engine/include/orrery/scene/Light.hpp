#pragma once
#include <glm/glm.hpp>
#include <cstdint>
#include "orrery/core/Handle.h"

namespace orrery::scene {

    enum class LightType : uint8_t
    {
        Point = 0,
        Directional = 1,
        Spot = 2
    };

    struct Light {
        LightType type = LightType::Point;
        glm::vec4 color{1.0f};
        float intensity{1.0f};
        float spotAngle{0.785398f}; // Radians, Spot only
    };

    // Light resolved against its node's world matrix, ready for a light uniform.
    struct LightRecord {
        LightHandle light{};
        NodeHandle node{};
        LightType type = LightType::Point;
        glm::vec4 color{1.0f};
        float intensity{1.0f};
        float spotAngle{0.0f};
        glm::vec3 position{0.0f};
        glm::vec3 direction{0.0f, 0.0f, 1.0f};
    };
}
