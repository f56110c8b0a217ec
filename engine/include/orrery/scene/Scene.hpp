#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>
#include <glm/mat4x4.hpp>

#include "orrery/core/Handle.h"
#include "orrery/core/Pool.hpp"
#include "orrery/core/result.hpp"
#include "orrery/geometry/Bounds.hpp"
#include "orrery/geometry/Frustum.hpp"
#include "orrery/scene/Camera.hpp"
#include "orrery/scene/CameraController.hpp"
#include "orrery/scene/Light.hpp"
#include "orrery/scene/NodeArena.hpp"
#include "orrery/scene/SceneConfig.hpp"

namespace orrery::scene {

    enum class AnimationError : uint8_t {
        InvalidNode,
        NotASkeletalMesh,
        NoActiveAnimation
    };

    std::string_view toString(AnimationError error);

    struct Drawable {
        NodeHandle node{};
        NodeKind kind = NodeKind::None;
        MeshHandle mesh{};                 // StaticMesh only
        SkeletalMeshHandle skeletalMesh{}; // SkeletalMesh only
        Pose pose{};                       // SkeletalMesh only
        glm::mat4 world{1.0f};
    };

    // Everything the renderer needs for one frame.
    struct RenderView {
        glm::mat4 view{1.0f};
        glm::mat4 projection{1.0f};
        geometry::Frustum frustum{};
        std::vector<Drawable> drawables;
        std::vector<LightRecord> lights;
        uint32_t culledCount = 0;
    };

    // Local-space bounds of a mesh node, nullopt when unknown (never culled).
    using BoundsFn = std::function<std::optional<geometry::BoundingBox>(NodeHandle, const Node&)>;
    using TraverseFn = std::function<void(NodeHandle, const Node&, const glm::mat4&)>;

    class Scene {
    public:
        using LightPool = core::Pool<Light, core::LightTag>;

        Scene();
        explicit Scene(const SceneConfig& config);

        NodeHandle root() const { return m_root; }

        NodeArena& nodes() { return m_nodes; }
        const NodeArena& nodes() const { return m_nodes; }

        Camera& camera() { return m_camera; }
        const Camera& camera() const { return m_camera; }

        CameraController& cameraController() { return m_cameraController; }
        const CameraController& cameraController() const { return m_cameraController; }

        LightPool& lights() { return m_lights; }
        const LightPool& lights() const { return m_lights; }

        const SceneConfig& config() const { return m_config; }

        // Parented to root unless a live parent is given.
        NodeHandle createNode(std::optional<NodeHandle> parent = std::nullopt);
        bool addToRoot(NodeHandle handle);
        bool setParent(NodeHandle parent, NodeHandle child);
        // The root cannot be destroyed. Lights referenced by destroyed nodes stay in the pool.
        bool destroyNode(NodeHandle handle, DestroyPolicy policy = DestroyPolicy::Cascade);

        glm::mat4 viewMatrix() const { return m_camera.viewMatrix(); }
        glm::mat4 projectionMatrix() const { return m_camera.projectionMatrix(); }
        glm::mat4 viewProjection() const { return m_camera.viewProjection(); }
        geometry::Frustum frustum(bool normalizePlanes = true) const { return m_camera.frustum(normalizePlanes); }

        void setCameraMode(CameraMode mode);
        void rotateOrbitCamera(float deltaYaw, float deltaPitch) { m_camera.rotateOrbit(deltaYaw, deltaPitch); }
        void zoomOrbitCamera(float delta) { m_camera.zoomOrbit(delta); }
        void setOrbitTarget(const glm::vec3& target) { m_camera.setOrbitTarget(target); }
        void onResize(uint32_t width, uint32_t height);

        // Drives the fly camera (free mode only) and advances animations.
        void update(float dt, const CameraInput& input);

        // Parent chain product, O(depth). nullopt for stale handles.
        std::optional<glm::mat4> worldMatrix(NodeHandle handle) const;

        // Depth-first from the root; world matrices are accumulated on the way down.
        // Nodes not connected to the root are skipped.
        void traverse(const TraverseFn& fn) const;

        RenderView gatherRenderView(const BoundsFn& bounds = {}) const;

        LightHandle createLight(const Light& light);
        Light* getLight(LightHandle handle) { return m_lights.get(handle); }
        const Light* getLight(LightHandle handle) const { return m_lights.get(handle); }
        bool destroyLight(LightHandle handle) { return m_lights.erase(handle); }

        core::Result<void, AnimationError> playAnimation(NodeHandle node, uint32_t clip, float duration,
                                                         AnimationPlayMode mode = AnimationPlayMode::Once);
        core::Result<void, AnimationError> pauseAnimation(NodeHandle node);
        core::Result<void, AnimationError> resumeAnimation(NodeHandle node);
        core::Result<void, AnimationError> stopAnimation(NodeHandle node);
        core::Result<void, AnimationError> setAnimationMode(NodeHandle node, AnimationPlayMode mode);

        // Advances every playing animation instance.
        void tick(float dt);

    private:
        core::Result<std::reference_wrapper<AnimationInstance>, AnimationError> activeAnimation(NodeHandle node);

        SceneConfig m_config;
        NodeArena m_nodes;
        NodeHandle m_root{};
        Camera m_camera;
        CameraController m_cameraController;
        LightPool m_lights;
        uint32_t m_lastWidth = 0;
        uint32_t m_lastHeight = 0;
    };

}
