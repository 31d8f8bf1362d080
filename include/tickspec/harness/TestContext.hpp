// include/tickspec/harness/TestContext.hpp
#pragma once
#include <cstddef>
#include <string>
#include <utility>

#include <entt/entt.hpp>

#include "tickspec/engine/SceneTree.hpp"
#include "tickspec/harness/SchedulerState.hpp"

namespace tickspec::harness {

// What a spec body sees: the root node it may populate (cleared between
// specs) and the replay controls of the scheduler.
//
// A spec that has to wait asks to be replayed and returns; it is invoked
// again from the top once the delay has passed, with Iteration() one
// higher:
//
//   TICKSPEC_SPEC("door opens after the timer") {
//       switch (ctx.Iteration()) {
//       case 0:
//           StartDoorTimer(ctx);
//           TICKSPEC_WAIT(ctx, 1.0);
//       default:
//           TICKSPEC_REQUIRE(DoorIsOpen(ctx));
//       }
//   }
class TestContext {
public:
    TestContext(engine::SceneTree& scene, entt::entity root, SchedulerState& state) noexcept
        : m_scene(scene), m_root(root), m_state(state) {}

    entt::entity       Root() const noexcept { return m_root; }
    engine::SceneTree& Scene() const noexcept { return m_scene; }
    entt::registry&    Registry() const noexcept { return m_scene.Registry(); }

    // Creates a node under Root().
    entt::entity Spawn(std::string name) const { return m_scene.CreateNode(std::move(name), m_root); }

    // Number of times the running spec has been replayed (0 on first call).
    std::size_t Iteration() const noexcept { return m_state.currentTestIteration; }

    // Re-run this spec after `delaySeconds` of frame time instead of moving
    // on. The caller must return right away; prefer TICKSPEC_WAIT.
    void RequestReplay(double delaySeconds) noexcept {
        m_state.wantsReplay        = true;
        m_state.delayBeforeNextRun = delaySeconds > 0.0 ? delaySeconds : 0.0;
    }

private:
    engine::SceneTree& m_scene;
    entt::entity       m_root;
    SchedulerState&    m_state;
};

} // namespace tickspec::harness

#define TICKSPEC_WAIT(ctx, seconds)                                            \
    do {                                                                       \
        (ctx).RequestReplay(static_cast<double>(seconds));                     \
        return;                                                                \
    } while (false)

#define TICKSPEC_TICK(ctx) ((ctx).Iteration())
