#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/quaternion.hpp>

#include "orrery/scene/Scene.hpp"

namespace orrery::scene {

    // Collects a node description and creates it on build(), so an abandoned
    // builder leaves nothing behind in the scene.
    class NodeBuilder {
    public:
        explicit NodeBuilder(Scene& scene) : m_scene(scene) {}

        NodeBuilder& withName(std::string name);
        NodeBuilder& withTransform(const Transform& transform);
        NodeBuilder& withPosition(const glm::vec3& position);
        NodeBuilder& withRotation(const glm::quat& rotation);
        NodeBuilder& withScale(const glm::vec3& scale);

        // Existing light from the scene's pool.
        NodeBuilder& withLight(LightHandle light);
        // New lights are added to the pool on build().
        NodeBuilder& withPointLight(const glm::vec4& color, float intensity = 1.0f);
        NodeBuilder& withDirectionalLight(const glm::vec4& color, float intensity = 1.0f);
        NodeBuilder& withSpotLight(const glm::vec4& color, float angle = glm::pi<float>() / 4.0f,
                                   float intensity = 1.0f);

        NodeBuilder& withMesh(MeshHandle mesh);
        NodeBuilder& withSkeletalMesh(SkeletalMeshHandle mesh, Pose pose = {});
        NodeBuilder& withAnimation(uint32_t clip, float duration,
                                   AnimationPlayMode mode = AnimationPlayMode::Once);

        // Defaults to the scene root.
        NodeBuilder& withParent(NodeHandle parent);
        NodeBuilder& withChildren(std::span<const NodeHandle> children);

        NodeHandle build();

    private:
        struct PendingAnimation {
            uint32_t clip = 0;
            float duration = 0.0f;
            AnimationPlayMode mode = AnimationPlayMode::Once;
        };

        Scene& m_scene;
        std::string m_name;
        Transform m_transform;
        NodeData m_data;
        std::optional<Light> m_newLight;
        std::optional<NodeHandle> m_parent;
        std::vector<NodeHandle> m_children;
        std::optional<PendingAnimation> m_animation;
    };

    struct LightDesc {
        LightType type = LightType::Point;
        glm::vec4 color{1.0f};
        float intensity = 1.0f;
        float spotAngle = glm::pi<float>() / 4.0f;
        std::optional<glm::vec3> position;
        std::optional<glm::vec3> scale;
        std::optional<glm::quat> rotation;
    };

    class SceneBuilder {
    public:
        explicit SceneBuilder(Scene& scene) : m_scene(scene) {}

        NodeBuilder spawn() { return NodeBuilder(m_scene); }
        NodeHandle addLight(const LightDesc& desc);

    private:
        Scene& m_scene;
    };

    // Fluent animation control for one node. Failures are logged, the last one is kept.
    class Animator {
    public:
        Animator(Scene& scene, NodeHandle node) : m_scene(scene), m_node(node) {}

        Animator& play(uint32_t clip, float duration);
        Animator& playLooped(uint32_t clip, float duration);
        Animator& pause();
        Animator& unpause();
        Animator& stop();
        Animator& setLooping(bool looping);

        [[nodiscard]] std::optional<AnimationError> lastError() const { return m_lastError; }

    private:
        Animator& record(const core::Result<void, AnimationError>& result, const char* action);

        Scene& m_scene;
        NodeHandle m_node;
        std::optional<AnimationError> m_lastError;
    };

}
