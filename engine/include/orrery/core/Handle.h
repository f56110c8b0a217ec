#pragma once

#include <cstdint>
#include <compare>
#include <cstddef>
#include <functional>

namespace orrery::core {

// Slot 0 of every pool is reserved, so a handle pointing at it never resolves.
template <typename Tag>
struct Handle {
    static constexpr uint32_t kNullIndex = 0;

    uint32_t index = kNullIndex;
    uint32_t generation = 0;

    constexpr Handle() = default;
    constexpr Handle(uint32_t idx, uint32_t gen) : index(idx), generation(gen) {}

    constexpr bool isValid() const { return index != kNullIndex; }
    constexpr void invalidate() { index = kNullIndex; generation = 0; }

    auto operator<=>(const Handle&) const = default;
    explicit operator bool() const { return isValid(); }
};

struct HandleHash {
    template <typename Tag>
    std::size_t operator()(const Handle<Tag>& h) const noexcept {
        return std::hash<uint64_t>{}((static_cast<uint64_t>(h.generation) << 32) | h.index);
    }
};

struct NodeTag {};
struct LightTag {};
struct MeshTag {};
struct SkeletalMeshTag {};
struct PoseTag {};

} // namespace orrery::core

using NodeHandle = orrery::core::Handle<orrery::core::NodeTag>;
using LightHandle = orrery::core::Handle<orrery::core::LightTag>;
using MeshHandle = orrery::core::Handle<orrery::core::MeshTag>;
using SkeletalMeshHandle = orrery::core::Handle<orrery::core::SkeletalMeshTag>;
using PoseHandle = orrery::core::Handle<orrery::core::PoseTag>;

inline constexpr NodeHandle INVALID_NODE_HANDLE{};
inline constexpr LightHandle INVALID_LIGHT_HANDLE{};
inline constexpr MeshHandle INVALID_MESH_HANDLE{};
