// include/tickspec/engine/SceneTree.hpp
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <entt/entt.hpp>

#include "tickspec/engine/Components.hpp"

namespace tickspec::engine {

// Parent/child object model on top of an EnTT registry.
//
// The tree always has a root node that cannot be freed. Freeing a node
// destroys its whole subtree and detaches it from its parent. Passing a
// handle that is not a live node throws std::invalid_argument.
class SceneTree {
public:
    SceneTree();

    SceneTree(const SceneTree&)            = delete;
    SceneTree& operator=(const SceneTree&) = delete;

    entt::entity Root() const noexcept { return m_root; }

    // Creates a node named `name` as the last child of `parent`.
    entt::entity CreateNode(std::string name, entt::entity parent);

    void Free(entt::entity node);

    // Frees every child of `parent` (and their subtrees). Returns the number
    // of direct children removed.
    std::size_t RemoveChildren(entt::entity parent);

    [[nodiscard]] bool IsAlive(entt::entity node) const;

    const std::vector<entt::entity>& Children(entt::entity node) const;
    std::size_t ChildCount(entt::entity node) const;
    entt::entity Parent(entt::entity node) const;
    const std::string& Name(entt::entity node) const;

    // First direct child with the given name, or entt::null.
    entt::entity FindChild(entt::entity parent, std::string_view name) const;

    // Live nodes, root included.
    std::size_t NodeCount() const;

    entt::registry&       Registry() noexcept { return m_registry; }
    const entt::registry& Registry() const noexcept { return m_registry; }

private:
    const Node& Require(entt::entity node, const char* op) const;
    Node&       Require(entt::entity node, const char* op);
    void        DestroySubtree(entt::entity node);

    entt::registry m_registry;
    entt::entity   m_root = entt::null;
};

} // namespace tickspec::engine
