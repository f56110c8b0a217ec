#pragma once

/**
 * @file engine.hpp
 * @brief Main Orrery header - include this for the scene graph, camera and culling
 */

#define ORRERY_VERSION_MAJOR 0
#define ORRERY_VERSION_MINOR 1
#define ORRERY_VERSION_PATCH 0

#include "orrery/core/logger.hpp"
#include "orrery/core/cvar.hpp"
#include "orrery/geometry/Frustum.hpp"
#include "orrery/scene/Scene.hpp"
#include "orrery/scene/SceneBuilder.hpp"

namespace orrery
{
    using Log = core::Logger;
    using Scene = scene::Scene;
    using SceneBuilder = scene::SceneBuilder;
    using Camera = scene::Camera;
}
