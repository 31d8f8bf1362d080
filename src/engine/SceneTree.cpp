// src/engine/SceneTree.cpp
#include "tickspec/engine/SceneTree.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tickspec::engine {

SceneTree::SceneTree()
{
    m_root = m_registry.create();
    m_registry.emplace<Node>(m_root, Node{"root", entt::null, {}});
}

const Node& SceneTree::Require(entt::entity node, const char* op) const
{
    if (!IsAlive(node))
        throw std::invalid_argument(std::string("SceneTree::") + op + ": not a live node");
    return m_registry.get<Node>(node);
}

Node& SceneTree::Require(entt::entity node, const char* op)
{
    if (!IsAlive(node))
        throw std::invalid_argument(std::string("SceneTree::") + op + ": not a live node");
    return m_registry.get<Node>(node);
}

bool SceneTree::IsAlive(entt::entity node) const
{
    return node != entt::null && m_registry.valid(node) && m_registry.all_of<Node>(node);
}

entt::entity SceneTree::CreateNode(std::string name, entt::entity parent)
{
    Require(parent, "CreateNode");

    const entt::entity e = m_registry.create();
    m_registry.emplace<Node>(e, Node{std::move(name), parent, {}});

    // Re-fetch: emplace may have reallocated the Node storage.
    m_registry.get<Node>(parent).children.push_back(e);
    return e;
}

void SceneTree::DestroySubtree(entt::entity node)
{
    // Copy: destroying children compacts the Node storage under our feet.
    const std::vector<entt::entity> children = m_registry.get<Node>(node).children;
    for (const entt::entity child : children)
        DestroySubtree(child);

    m_registry.destroy(node);
}

void SceneTree::Free(entt::entity node)
{
    const Node& n = Require(node, "Free");
    if (node == m_root)
        throw std::invalid_argument("SceneTree::Free: the root node cannot be freed");

    auto& siblings = m_registry.get<Node>(n.parent).children;
    siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());

    DestroySubtree(node);
}

std::size_t SceneTree::RemoveChildren(entt::entity parent)
{
    const std::vector<entt::entity> children = Require(parent, "RemoveChildren").children;
    for (const entt::entity child : children)
        DestroySubtree(child);

    m_registry.get<Node>(parent).children.clear();
    return children.size();
}

const std::vector<entt::entity>& SceneTree::Children(entt::entity node) const
{
    return Require(node, "Children").children;
}

std::size_t SceneTree::ChildCount(entt::entity node) const
{
    return Require(node, "ChildCount").children.size();
}

entt::entity SceneTree::Parent(entt::entity node) const
{
    return Require(node, "Parent").parent;
}

const std::string& SceneTree::Name(entt::entity node) const
{
    return Require(node, "Name").name;
}

entt::entity SceneTree::FindChild(entt::entity parent, std::string_view name) const
{
    for (const entt::entity child : Require(parent, "FindChild").children)
    {
        if (m_registry.get<Node>(child).name == name)
            return child;
    }
    return entt::null;
}

std::size_t SceneTree::NodeCount() const
{
    return m_registry.view<const Node>().size();
}

} // namespace tickspec::engine
