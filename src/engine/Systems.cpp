// src/engine/Systems.cpp
#include "tickspec/engine/Systems.hpp"
#include "tickspec/engine/Components.hpp"

#include <vector>

namespace tickspec::engine {

std::size_t UpdateTickables(entt::registry& r, double dt_seconds) {
    // Snapshot first: ticks create and destroy nodes (the test harness clears
    // its children between specs), which must not disturb the live view.
    auto view = r.view<Tickable>();
    std::vector<entt::entity> items(view.begin(), view.end());

    std::size_t count = 0;
    for (const entt::entity e : items) {
        if (!r.valid(e)) {
            continue;
        }
        const auto* t = r.try_get<Tickable>(e);
        if (t == nullptr || !t->active || !t->tick) {
            continue;
        }
        // Copy: the callback may destroy its own entity.
        const auto tick = t->tick;
        tick(r, e, dt_seconds);
        ++count;
    }
    return count;
}

} // namespace tickspec::engine
