// demos/scene_specs/SceneSpecs.cpp
// Scene population and cleanup between specs. Registration order within
// this file is execution order, so the cleanup check runs after the spawns.

#include "tickspec/harness/Spec.hpp"

#include <cstddef>

TICKSPEC_SPEC("spawned nodes hang off the spec root")
{
    ctx.Spawn("Colonist");
    ctx.Spawn("Colonist");
    ctx.Spawn("Stockpile");

    TICKSPEC_REQUIRE(ctx.Scene().ChildCount(ctx.Root()) == 3);
    TICKSPEC_REQUIRE(ctx.Scene().FindChild(ctx.Root(), "Stockpile") != entt::null);
}

TICKSPEC_SPEC("previous spec's nodes are gone")
{
    TICKSPEC_REQUIRE(ctx.Scene().ChildCount(ctx.Root()) == 0);
    TICKSPEC_REQUIRE(ctx.Scene().FindChild(ctx.Root(), "Colonist") == entt::null);
}

TICKSPEC_SPEC("nodes survive a replay of the same spec")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
    {
        const entt::entity marker = ctx.Spawn("Marker");
        ctx.Scene().CreateNode("Child", marker);
        TICKSPEC_WAIT(ctx, 0.0);
    }
    default:
    {
        const entt::entity marker = ctx.Scene().FindChild(ctx.Root(), "Marker");
        TICKSPEC_REQUIRE(marker != entt::null);
        TICKSPEC_REQUIRE(ctx.Scene().ChildCount(marker) == 1);
    }
    }
}

TICKSPEC_SPEC("freeing a node removes its subtree")
{
    const entt::entity parent = ctx.Spawn("Room");
    ctx.Scene().CreateNode("Bed", parent);
    ctx.Scene().CreateNode("Lamp", parent);

    const std::size_t before = ctx.Scene().NodeCount();
    ctx.Scene().Free(parent);

    TICKSPEC_REQUIRE(!ctx.Scene().IsAlive(parent));
    TICKSPEC_REQUIRE(ctx.Scene().NodeCount() == before - 3);
}
