#include "orrery/scene/NodeArena.hpp"
#include "orrery/core/logger.hpp"
#include <algorithm>
#include <vector>

namespace orrery::scene {

    NodeHandle NodeArena::create() {
        NodeHandle handle = m_nodes.emplace();
        Node* node = m_nodes.get(handle);
        ORRERY_ASSERT(node != nullptr, "Freshly created node does not resolve");
        node->parent = handle;
        return handle;
    }

    void NodeArena::unparent(NodeHandle handle) {
        Node* child = m_nodes.get(handle);
        if (child == nullptr) return;

        const NodeHandle parentHandle = child->parent;
        if (!parentHandle.isValid() || parentHandle == handle) return;

        Node* parentNode = m_nodes.get(parentHandle);
        if (parentNode != nullptr) {
            auto& siblings = parentNode->children;
            auto it = std::find(siblings.begin(), siblings.end(), handle);
            if (it != siblings.end()) {
                *it = siblings.back();
                siblings.pop_back();
            }
        }
        child->parent = handle;
    }

    bool NodeArena::parent(NodeHandle parent, NodeHandle child) {
        if (parent == child) return false;

        if (isAncestor(child, parent)) {
            core::Logger::warn("Refusing to parent node {}:{} under its descendant {}:{}",
                               child.index, child.generation, parent.index, parent.generation);
            return false;
        }

        unparent(child);

        Node* parentNode = m_nodes.get(parent);
        Node* childNode = m_nodes.get(child);
        if (parentNode == nullptr || childNode == nullptr) return false;

        childNode->parent = parent;
        parentNode->children.push_back(child);
        return true;
    }

    bool NodeArena::isAncestor(NodeHandle ancestor, NodeHandle node) const {
        if (!m_nodes.validate(ancestor)) return false;

        // Bounded by the node count so a corrupted chain can't spin forever.
        size_t steps = 0;
        NodeHandle current = node;
        while (steps++ <= m_nodes.size()) {
            const Node* n = m_nodes.get(current);
            if (n == nullptr || !n->hasParent(current)) return false;
            if (n->parent == ancestor) return true;
            current = n->parent;
        }
        return false;
    }

    std::optional<uint32_t> NodeArena::depth(NodeHandle handle) const {
        const Node* n = m_nodes.get(handle);
        if (n == nullptr) return std::nullopt;

        uint32_t level = 0;
        NodeHandle current = handle;
        while (n != nullptr && n->hasParent(current) && level <= m_nodes.size()) {
            current = n->parent;
            n = m_nodes.get(current);
            ++level;
        }
        return level;
    }

    void NodeArena::destroy(NodeHandle handle, DestroyPolicy policy) {
        Node* node = m_nodes.get(handle);
        if (node == nullptr) return;

        unparent(handle);

        if (policy == DestroyPolicy::Orphan) {
            // Copy: unparent edits the list we would be iterating.
            const std::vector<NodeHandle> children = node->children;
            for (NodeHandle child : children) {
                unparent(child);
            }
            m_nodes.erase(handle);
            return;
        }

        destroySubtree(handle);
    }

    void NodeArena::destroySubtree(NodeHandle handle) {
        std::vector<NodeHandle> stack{handle};
        while (!stack.empty()) {
            NodeHandle current = stack.back();
            stack.pop_back();

            Node* node = m_nodes.get(current);
            if (node == nullptr) continue;

            for (NodeHandle child : node->children) {
                const Node* childNode = m_nodes.get(child);
                // Only follow edges that are consistent in both directions.
                if (childNode != nullptr && childNode->parent == current) {
                    stack.push_back(child);
                }
            }
            m_nodes.erase(current);
        }
    }
}
