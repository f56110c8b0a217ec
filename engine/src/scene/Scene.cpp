#include "orrery/scene/Scene.hpp"
#include "orrery/core/common.hpp"

#include <algorithm>
#include <utility>

using namespace orrery::util;

namespace orrery::scene
{
    std::string_view toString(AnimationError error)
    {
        switch (error)
        {
        case AnimationError::InvalidNode: return "invalid node";
        case AnimationError::NotASkeletalMesh: return "node is not a skeletal mesh";
        case AnimationError::NoActiveAnimation: return "no active animation";
        }
        return "unknown";
    }

    Scene::Scene()
        : Scene(SceneConfig::fromCVars())
    {
    }

    Scene::Scene(const SceneConfig& config)
        : m_config(config)
        , m_camera(config.perspective(), config.orbitDefaults(), config.orbitLimits)
    {
        // Built in orbit mode to get a pose facing the target, then released to free mode.
        m_camera.switchToFreeMode();
        m_cameraController.setMoveSpeed(config.moveSpeed);
        m_cameraController.setMouseSensitivity(config.lookSensitivity);
        m_cameraController.syncFromCamera(m_camera);

        m_root = m_nodes.create();
        m_nodes.get(m_root)->name = "root";
    }

    NodeHandle Scene::createNode(std::optional<NodeHandle> parent)
    {
        const NodeHandle handle = m_nodes.create();
        const NodeHandle target = parent.value_or(m_root);
        if (!m_nodes.parent(target, handle))
        {
            core::Logger::warn("Parent {}:{} is not alive, node {}:{} goes under root",
                               target.index, target.generation, handle.index, handle.generation);
            m_nodes.parent(m_root, handle);
        }
        return handle;
    }

    bool Scene::addToRoot(NodeHandle handle)
    {
        return m_nodes.parent(m_root, handle);
    }

    bool Scene::setParent(NodeHandle parent, NodeHandle child)
    {
        if (child == m_root)
        {
            core::Logger::warn("The scene root cannot be reparented");
            return false;
        }
        return m_nodes.parent(parent, child);
    }

    bool Scene::destroyNode(NodeHandle handle, DestroyPolicy policy)
    {
        if (handle == m_root)
        {
            core::Logger::warn("Refusing to destroy the scene root");
            return false;
        }
        if (!m_nodes.contains(handle))
        {
            return false;
        }
        const size_t before = m_nodes.size();
        m_nodes.destroy(handle, policy);
        core::Logger::debug("Destroyed node {}:{} ({} node(s) freed)",
                            handle.index, handle.generation, before - m_nodes.size());
        return true;
    }

    void Scene::setCameraMode(CameraMode mode)
    {
        if (mode == m_camera.mode())
        {
            return;
        }
        if (mode == CameraMode::Orbit)
        {
            m_camera.switchToOrbitMode();
        }
        else
        {
            m_camera.switchToFreeMode();
            m_cameraController.syncFromCamera(m_camera);
        }
    }

    void Scene::onResize(uint32_t width, uint32_t height)
    {
        if (width == 0 || height == 0)
        {
            return;
        }
        if (width == m_lastWidth && height == m_lastHeight)
        {
            return;
        }

        m_lastWidth = width;
        m_lastHeight = height;
        m_camera.setAspectRatio(toFloat(width) / toFloat(height));
    }

    void Scene::update(float dt, const CameraInput& input)
    {
        if (!m_camera.isOrbit())
        {
            m_cameraController.update(input, dt);
            m_cameraController.applyToCamera(m_camera);
        }
        tick(dt);
    }

    std::optional<glm::mat4> Scene::worldMatrix(NodeHandle handle) const
    {
        const Node* node = m_nodes.get(handle);
        if (node == nullptr)
        {
            return std::nullopt;
        }

        glm::mat4 world = node->transform.mat4();
        NodeHandle current = handle;
        size_t steps = 0;
        while (node->hasParent(current) && steps++ < m_nodes.size())
        {
            const Node* parent = m_nodes.get(node->parent);
            if (parent == nullptr)
            {
                break;
            }
            current = node->parent;
            node = parent;
            world = node->transform.mat4() * world;
        }
        return world;
    }

    void Scene::traverse(const TraverseFn& fn) const
    {
        ORRERY_PROFILE_FUNCTION();

        std::vector<std::pair<NodeHandle, glm::mat4>> stack;
        stack.emplace_back(m_root, glm::mat4(1.0f));

        while (!stack.empty())
        {
            const auto [handle, parentWorld] = stack.back();
            stack.pop_back();

            const Node* node = m_nodes.get(handle);
            if (node == nullptr)
            {
                continue;
            }

            const glm::mat4 world = parentWorld * node->transform.mat4();
            fn(handle, *node, world);

            // Reverse push so children are visited in insertion order.
            for (auto it = node->children.rbegin(); it != node->children.rend(); ++it)
            {
                const Node* child = m_nodes.get(*it);
                if (child != nullptr && child->parent == handle)
                {
                    stack.emplace_back(*it, world);
                }
            }
        }
    }

    RenderView Scene::gatherRenderView(const BoundsFn& bounds) const
    {
        ORRERY_PROFILE_FUNCTION();

        RenderView view;
        view.view = viewMatrix();
        view.projection = projectionMatrix();
        view.frustum = geometry::Frustum::extractPlanes(view.projection * view.view, true);

        const auto culled = [&](NodeHandle handle, const Node& node, const glm::mat4& world) {
            if (!bounds)
            {
                return false;
            }
            const std::optional<geometry::BoundingBox> local = bounds(handle, node);
            if (!local || !local->isValid())
            {
                return false;
            }
            return !view.frustum.intersectsBox(geometry::transformBox(*local, world));
        };

        traverse([&](NodeHandle handle, const Node& node, const glm::mat4& world) {
            switch (node.kind())
            {
            case NodeKind::Light:
            {
                const LightHandle lightHandle = node.as<LightNode>()->light;
                const Light* light = m_lights.get(lightHandle);
                if (light == nullptr)
                {
                    break;
                }
                LightRecord record;
                record.light = lightHandle;
                record.node = handle;
                record.type = light->type;
                record.color = light->color;
                record.intensity = light->intensity;
                record.spotAngle = light->type == LightType::Spot ? light->spotAngle : 0.0f;
                record.position = glm::vec3(world * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
                const glm::vec3 dir = glm::vec3(world * glm::vec4(0.0f, 0.0f, 1.0f, 0.0f));
                if (glm::dot(dir, dir) > 0.0f)
                {
                    record.direction = glm::normalize(dir);
                }
                view.lights.push_back(record);
                break;
            }
            case NodeKind::StaticMesh:
            case NodeKind::SkeletalMesh:
            {
                if (culled(handle, node, world))
                {
                    ++view.culledCount;
                    break;
                }
                Drawable drawable;
                drawable.node = handle;
                drawable.kind = node.kind();
                drawable.world = world;
                if (const auto* mesh = node.as<StaticMeshNode>())
                {
                    drawable.mesh = mesh->mesh;
                }
                else if (const auto* skinned = node.as<SkeletalMeshNode>())
                {
                    drawable.skeletalMesh = skinned->mesh;
                    drawable.pose = skinned->pose;
                }
                view.drawables.push_back(drawable);
                break;
            }
            case NodeKind::None:
                break;
            }
        });

        return view;
    }

    LightHandle Scene::createLight(const Light& light)
    {
        return m_lights.emplace(light);
    }

    core::Result<std::reference_wrapper<AnimationInstance>, AnimationError> Scene::activeAnimation(NodeHandle node)
    {
        Node* n = m_nodes.get(node);
        if (n == nullptr)
        {
            return core::Unexpected<AnimationError>(AnimationError::InvalidNode);
        }
        auto* skinned = n->as<SkeletalMeshNode>();
        if (skinned == nullptr)
        {
            return core::Unexpected<AnimationError>(AnimationError::NotASkeletalMesh);
        }
        if (!skinned->animation)
        {
            return core::Unexpected<AnimationError>(AnimationError::NoActiveAnimation);
        }
        return std::ref(*skinned->animation);
    }

    core::Result<void, AnimationError> Scene::playAnimation(NodeHandle node, uint32_t clip, float duration,
                                                            AnimationPlayMode mode)
    {
        Node* n = m_nodes.get(node);
        if (n == nullptr)
        {
            return core::Unexpected<AnimationError>(AnimationError::InvalidNode);
        }
        auto* skinned = n->as<SkeletalMeshNode>();
        if (skinned == nullptr)
        {
            return core::Unexpected<AnimationError>(AnimationError::NotASkeletalMesh);
        }

        AnimationInstance instance;
        instance.clip = clip;
        instance.mode = mode;
        instance.duration = std::max(duration, 0.0f);
        skinned->animation = instance;
        core::Logger::debug("Playing clip {} on node {}:{} ({})", clip, node.index, node.generation, toString(mode));
        return {};
    }

    core::Result<void, AnimationError> Scene::pauseAnimation(NodeHandle node)
    {
        return activeAnimation(node).transform([](AnimationInstance& anim) { anim.pause(); });
    }

    core::Result<void, AnimationError> Scene::resumeAnimation(NodeHandle node)
    {
        return activeAnimation(node).transform([](AnimationInstance& anim) { anim.resume(); });
    }

    core::Result<void, AnimationError> Scene::stopAnimation(NodeHandle node)
    {
        return activeAnimation(node).transform([](AnimationInstance& anim) { anim.stop(); });
    }

    core::Result<void, AnimationError> Scene::setAnimationMode(NodeHandle node, AnimationPlayMode mode)
    {
        return activeAnimation(node).transform([mode](AnimationInstance& anim) { anim.setMode(mode); });
    }

    void Scene::tick(float dt)
    {
        ORRERY_PROFILE_FUNCTION();
        m_nodes.for_each([dt](Node& node, NodeHandle) {
            if (auto* skinned = node.as<SkeletalMeshNode>(); skinned != nullptr && skinned->animation)
            {
                skinned->animation->update(dt);
            }
        });
    }
}
