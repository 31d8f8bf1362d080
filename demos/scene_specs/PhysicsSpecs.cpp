// demos/scene_specs/PhysicsSpecs.cpp
// A ball dropped onto the floor, integrated by its own Tickable every frame.

#include "tickspec/engine/Components.hpp"
#include "tickspec/harness/Spec.hpp"

#include <cmath>

namespace {

constexpr double kGravity     = -9.81;
constexpr double kRestitution = 0.5;
constexpr double kRestSpeed   = 0.5; // bounces slower than this stop dead

struct Body {
    double y  = 0.0;
    double vy = 0.0;
};

void IntegrateBody(entt::registry& r, entt::entity e, double dt)
{
    auto* body = r.try_get<Body>(e);
    if (!body)
        return;

    // Semi-implicit Euler, floor at y = 0.
    body->vy += kGravity * dt;
    body->y  += body->vy * dt;
    if (body->y < 0.0)
    {
        body->y  = 0.0;
        body->vy = -body->vy * kRestitution;
        if (std::fabs(body->vy) < kRestSpeed)
            body->vy = 0.0;
    }
}

entt::entity SpawnBall(tickspec::harness::TestContext& ctx, double height)
{
    const entt::entity ball = ctx.Spawn("Ball");
    ctx.Registry().emplace<Body>(ball, Body{height, 0.0});
    ctx.Registry().emplace<tickspec::engine::Tickable>(ball, tickspec::engine::Tickable{&IntegrateBody, true});
    return ball;
}

const Body& BallBody(tickspec::harness::TestContext& ctx)
{
    const entt::entity ball = ctx.Scene().FindChild(ctx.Root(), "Ball");
    if (ball == entt::null)
        TICKSPEC_FAIL("ball node is missing");
    return ctx.Registry().get<Body>(ball);
}

} // namespace

TICKSPEC_SPEC("dropped ball falls and settles on the floor")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
        SpawnBall(ctx, 2.0);
        TICKSPEC_WAIT(ctx, 0.25);
    case 1:
        TICKSPEC_REQUIRE(BallBody(ctx).y < 2.0);
        TICKSPEC_REQUIRE(BallBody(ctx).vy < 0.0);
        TICKSPEC_WAIT(ctx, 5.0);
    default:
        TICKSPEC_ASSERT_APPROX_EQ(BallBody(ctx).y, 0.0, 1e-6);
        TICKSPEC_ASSERT_APPROX_EQ(BallBody(ctx).vy, 0.0, 1e-6);
    }
}

TICKSPEC_SPEC("paused body does not move")
{
    switch (TICKSPEC_TICK(ctx))
    {
    case 0:
    {
        const entt::entity ball = SpawnBall(ctx, 1.0);
        ctx.Registry().get<tickspec::engine::Tickable>(ball).active = false;
        TICKSPEC_WAIT(ctx, 0.5);
    }
    default:
        TICKSPEC_ASSERT_APPROX_EQ(BallBody(ctx).y, 1.0, 1e-9);
    }
}
