// include/tickspec/engine/Systems.hpp
#pragma once
#include <cstddef>
#include <entt/entt.hpp>

namespace tickspec::engine {

// Runs every active Tickable once. Nodes destroyed by an earlier tick in the
// same pass are skipped. Returns number of entities processed.
std::size_t UpdateTickables(entt::registry& r, double dt_seconds);

} // namespace tickspec::engine
