#include "orrery/scene/SceneBuilder.hpp"
#include "orrery/core/logger.hpp"

#include <utility>

namespace orrery::scene
{
    NodeBuilder& NodeBuilder::withName(std::string name)
    {
        m_name = std::move(name);
        return *this;
    }

    NodeBuilder& NodeBuilder::withTransform(const Transform& transform)
    {
        m_transform = transform;
        m_transform.setRotation(transform.m_rotation);
        return *this;
    }

    NodeBuilder& NodeBuilder::withPosition(const glm::vec3& position)
    {
        m_transform.m_translation = position;
        return *this;
    }

    NodeBuilder& NodeBuilder::withRotation(const glm::quat& rotation)
    {
        m_transform.setRotation(rotation);
        return *this;
    }

    NodeBuilder& NodeBuilder::withScale(const glm::vec3& scale)
    {
        m_transform.m_scale = scale;
        return *this;
    }

    NodeBuilder& NodeBuilder::withLight(LightHandle light)
    {
        m_newLight.reset();
        m_data = LightNode{light};
        return *this;
    }

    NodeBuilder& NodeBuilder::withPointLight(const glm::vec4& color, float intensity)
    {
        m_newLight = Light{LightType::Point, color, intensity};
        m_data = LightNode{};
        return *this;
    }

    NodeBuilder& NodeBuilder::withDirectionalLight(const glm::vec4& color, float intensity)
    {
        m_newLight = Light{LightType::Directional, color, intensity};
        m_data = LightNode{};
        return *this;
    }

    NodeBuilder& NodeBuilder::withSpotLight(const glm::vec4& color, float angle, float intensity)
    {
        m_newLight = Light{LightType::Spot, color, intensity, angle};
        m_data = LightNode{};
        return *this;
    }

    NodeBuilder& NodeBuilder::withMesh(MeshHandle mesh)
    {
        m_newLight.reset();
        m_data = StaticMeshNode{mesh};
        return *this;
    }

    NodeBuilder& NodeBuilder::withSkeletalMesh(SkeletalMeshHandle mesh, Pose pose)
    {
        m_newLight.reset();
        m_data = SkeletalMeshNode{mesh, pose, std::nullopt};
        return *this;
    }

    NodeBuilder& NodeBuilder::withAnimation(uint32_t clip, float duration, AnimationPlayMode mode)
    {
        m_animation = PendingAnimation{clip, duration, mode};
        return *this;
    }

    NodeBuilder& NodeBuilder::withParent(NodeHandle parent)
    {
        m_parent = parent;
        return *this;
    }

    NodeBuilder& NodeBuilder::withChildren(std::span<const NodeHandle> children)
    {
        m_children.insert(m_children.end(), children.begin(), children.end());
        return *this;
    }

    NodeHandle NodeBuilder::build()
    {
        if (m_newLight)
        {
            m_data = LightNode{m_scene.createLight(*m_newLight)};
        }

        const NodeHandle handle = m_scene.createNode(m_parent);
        Node* node = m_scene.nodes().get(handle);
        node->name = m_name;
        node->transform = m_transform;
        node->data = m_data;

        for (NodeHandle child : m_children)
        {
            if (!m_scene.setParent(handle, child))
            {
                core::Logger::warn("Node '{}': could not adopt child {}:{}", m_name, child.index, child.generation);
            }
        }

        if (m_animation)
        {
            auto played = m_scene.playAnimation(handle, m_animation->clip, m_animation->duration, m_animation->mode);
            if (!played)
            {
                core::Logger::warn("Node '{}': animation {} not started: {}", m_name, m_animation->clip,
                                   toString(played.error()));
            }
        }
        return handle;
    }

    NodeHandle SceneBuilder::addLight(const LightDesc& desc)
    {
        NodeBuilder builder = spawn();
        switch (desc.type)
        {
        case LightType::Point:
            builder.withPointLight(desc.color, desc.intensity);
            break;
        case LightType::Directional:
            builder.withDirectionalLight(desc.color, desc.intensity);
            break;
        case LightType::Spot:
            builder.withSpotLight(desc.color, desc.spotAngle, desc.intensity);
            break;
        }
        if (desc.position) builder.withPosition(*desc.position);
        if (desc.rotation) builder.withRotation(*desc.rotation);
        if (desc.scale) builder.withScale(*desc.scale);
        return builder.build();
    }

    Animator& Animator::record(const core::Result<void, AnimationError>& result, const char* action)
    {
        if (result)
        {
            m_lastError.reset();
        }
        else
        {
            m_lastError = result.error();
            core::Logger::warn("Animator {} on node {}:{} failed: {}", action, m_node.index, m_node.generation,
                               toString(result.error()));
        }
        return *this;
    }

    Animator& Animator::play(uint32_t clip, float duration)
    {
        return record(m_scene.playAnimation(m_node, clip, duration, AnimationPlayMode::Once), "play");
    }

    Animator& Animator::playLooped(uint32_t clip, float duration)
    {
        return record(m_scene.playAnimation(m_node, clip, duration, AnimationPlayMode::Loop), "playLooped");
    }

    Animator& Animator::pause()
    {
        return record(m_scene.pauseAnimation(m_node), "pause");
    }

    Animator& Animator::unpause()
    {
        return record(m_scene.resumeAnimation(m_node), "unpause");
    }

    Animator& Animator::stop()
    {
        return record(m_scene.stopAnimation(m_node), "stop");
    }

    Animator& Animator::setLooping(bool looping)
    {
        return record(m_scene.setAnimationMode(m_node, looping ? AnimationPlayMode::Loop : AnimationPlayMode::Once),
                      "setLooping");
    }
}
