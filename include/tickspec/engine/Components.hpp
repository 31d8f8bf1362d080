// include/tickspec/engine/Components.hpp
#pragma once
#include <functional>
#include <string>
#include <vector>

#include <entt/entt.hpp>

namespace tickspec::engine {

// Name plus parent/child links. Every scene node carries one.
struct Node {
    std::string               name;
    entt::entity              parent = entt::null;
    std::vector<entt::entity> children; // insertion order
};

// Per-node frame callback (gameplay logic, test harness, etc.)
struct Tickable {
    // signature: void(entt::registry&, entt::entity, double dt_seconds)
    std::function<void(entt::registry&, entt::entity, double)> tick;
    bool active = true;
};

} // namespace tickspec::engine
