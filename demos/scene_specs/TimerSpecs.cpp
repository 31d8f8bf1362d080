// demos/scene_specs/TimerSpecs.cpp
// Waits measured against a stopwatch node that accumulates frame time.

#include "tickspec/engine/Components.hpp"
#include "tickspec/harness/Spec.hpp"

namespace {

struct Stopwatch {
    double elapsed = 0.0;
    int    frames  = 0;
};

void StartStopwatch(tickspec::harness::TestContext& ctx)
{
    const entt::entity e = ctx.Spawn("Stopwatch");
    ctx.Registry().emplace<Stopwatch>(e);
    ctx.Registry().emplace<tickspec::engine::Tickable>(e, tickspec::engine::Tickable{
        [](entt::registry& r, entt::entity self, double dt) {
            auto& sw = r.get<Stopwatch>(self);
            sw.elapsed += dt;
            ++sw.frames;
        },
        true});
}

const Stopwatch& ReadStopwatch(tickspec::harness::TestContext& ctx)
{
    const entt::entity e = ctx.Scene().FindChild(ctx.Root(), "Stopwatch");
    TICKSPEC_REQUIRE(e != entt::null);
    return ctx.Registry().get<Stopwatch>(e);
}

} // namespace

TICKSPEC_SPEC("wait resumes the spec after the requested delay")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
        StartStopwatch(ctx);
        TICKSPEC_WAIT(ctx, 1.0);
    default:
        // One frame of slack either way for the tick order within a frame.
        TICKSPEC_ASSERT_APPROX_EQ(ReadStopwatch(ctx).elapsed, 1.0, 0.05);
    }
}

TICKSPEC_SPEC("zero-delay wait resumes on the next frame")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
        StartStopwatch(ctx);
        TICKSPEC_WAIT(ctx, 0.0);
    default:
        TICKSPEC_REQUIRE(ReadStopwatch(ctx).frames <= 1);
    }
}

TICKSPEC_SPEC("consecutive waits accumulate")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
        StartStopwatch(ctx);
        TICKSPEC_WAIT(ctx, 0.25);
    case 1:
        TICKSPEC_WAIT(ctx, 0.25);
    case 2:
        TICKSPEC_WAIT(ctx, 0.5);
    default:
        TICKSPEC_REQUIRE(ctx.Iteration() == 3);
        TICKSPEC_ASSERT_APPROX_EQ(ReadStopwatch(ctx).elapsed, 1.0, 0.1);
    }
}
