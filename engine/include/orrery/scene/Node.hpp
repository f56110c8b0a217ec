#pragma once
#include "orrery/scene/transform.hpp"
#include "orrery/scene/Animation.hpp"
#include "orrery/core/Handle.h"
#include <vector>
#include <optional>
#include <string>
#include <variant>

namespace orrery::scene {

// Bone palette owned by the animation system; the scene only carries it around.
struct Pose {
    PoseHandle buffer{};
    uint32_t boneCount = 0;
};

struct LightNode {
    LightHandle light{};
};

struct StaticMeshNode {
    MeshHandle mesh{};
};

struct SkeletalMeshNode {
    SkeletalMeshHandle mesh{};
    Pose pose{};
    std::optional<AnimationInstance> animation;
};

// monostate is a plain grouping node.
using NodeData = std::variant<std::monostate, LightNode, StaticMeshNode, SkeletalMeshNode>;

enum class NodeKind : uint8_t {
    None = 0,
    Light = 1,
    StaticMesh = 2,
    SkeletalMesh = 3
};

struct Node {
    NodeHandle parent{};
    std::vector<NodeHandle> children;
    Transform transform;
    NodeData data;
    std::string name;

    NodeKind kind() const { return static_cast<NodeKind>(data.index()); }
    bool hasParent(NodeHandle self) const { return parent.isValid() && parent != self; }

    template <typename T>
    T* as() { return std::get_if<T>(&data); }

    template <typename T>
    const T* as() const { return std::get_if<T>(&data); }
};

} // namespace orrery::scene
