#pragma once
#include "orrery/core/Pool.hpp"
#include "orrery/scene/Node.hpp"
#include <functional>
#include <optional>

namespace orrery::scene {

    enum class DestroyPolicy : uint8_t {
        Cascade, // destroy the whole subtree
        Orphan   // detach children, they survive as parentless nodes
    };

    // Owns every Node and is the only place parent/child edges are edited.
    // A node with no parent stores its own handle in Node::parent.
    class NodeArena {
    public:
        using NodePool = core::Pool<Node, core::NodeTag>;

        NodeHandle create();

        Node* get(NodeHandle handle) { return m_nodes.get(handle); }
        const Node* get(NodeHandle handle) const { return m_nodes.get(handle); }

        std::optional<std::reference_wrapper<Node>> getRef(NodeHandle handle) { return m_nodes.getRef(handle); }
        std::optional<std::reference_wrapper<const Node>> getRef(NodeHandle handle) const { return m_nodes.getRef(handle); }

        bool contains(NodeHandle handle) const { return m_nodes.validate(handle); }

        // Detach from the current parent. No-op for parentless or stale nodes.
        void unparent(NodeHandle handle);

        // Attach child under parent. Returns false and leaves the tree untouched for
        // self-parenting or when child is an ancestor of parent. The child's old link
        // is dropped before the handles are resolved, so a stale parent leaves the
        // child detached.
        bool parent(NodeHandle parent, NodeHandle child);

        // True if ancestor is on node's parent chain (a node is not its own ancestor).
        bool isAncestor(NodeHandle ancestor, NodeHandle node) const;

        // Depth of the node below its top-most ancestor, nullopt for stale handles.
        std::optional<uint32_t> depth(NodeHandle handle) const;

        void destroy(NodeHandle handle, DestroyPolicy policy = DestroyPolicy::Cascade);

        size_t size() const { return m_nodes.size(); }

        template <typename Func>
        void for_each(Func&& func) { m_nodes.for_each(std::forward<Func>(func)); }

        template <typename Func>
        void for_each(Func&& func) const { m_nodes.for_each(std::forward<Func>(func)); }

    private:
        void destroySubtree(NodeHandle handle);

        NodePool m_nodes;
    };
}
