// tests/test_scene_tree.cpp
//
// Coverage for src/engine/SceneTree.cpp and src/engine/Systems.cpp.

#include <doctest/doctest.h>

#include "tickspec/engine/Components.hpp"
#include "tickspec/engine/SceneTree.hpp"
#include "tickspec/engine/Systems.hpp"

#include <stdexcept>
#include <vector>

using tickspec::engine::SceneTree;
using tickspec::engine::Tickable;

TEST_CASE("SceneTree starts with a single root node")
{
    SceneTree scene;

    CHECK(scene.IsAlive(scene.Root()));
    CHECK(scene.Name(scene.Root()) == "root");
    CHECK(scene.Parent(scene.Root()) == entt::null);
    CHECK(scene.ChildCount(scene.Root()) == 0);
    CHECK(scene.NodeCount() == 1);
}

TEST_CASE("SceneTree keeps children in creation order")
{
    SceneTree scene;
    const auto a = scene.CreateNode("a", scene.Root());
    const auto b = scene.CreateNode("b", scene.Root());
    const auto c = scene.CreateNode("c", a);

    REQUIRE(scene.ChildCount(scene.Root()) == 2);
    CHECK(scene.Children(scene.Root())[0] == a);
    CHECK(scene.Children(scene.Root())[1] == b);
    CHECK(scene.Parent(c) == a);
    CHECK(scene.FindChild(scene.Root(), "b") == b);
    CHECK(scene.FindChild(scene.Root(), "c") == entt::null); // direct children only
    CHECK(scene.NodeCount() == 4);
}

TEST_CASE("SceneTree::Free destroys the subtree and detaches it")
{
    SceneTree scene;
    const auto room = scene.CreateNode("room", scene.Root());
    const auto bed  = scene.CreateNode("bed", room);
    const auto lamp = scene.CreateNode("lamp", bed);
    const auto hall = scene.CreateNode("hall", scene.Root());

    scene.Free(room);

    CHECK_FALSE(scene.IsAlive(room));
    CHECK_FALSE(scene.IsAlive(bed));
    CHECK_FALSE(scene.IsAlive(lamp));
    CHECK(scene.IsAlive(hall));
    REQUIRE(scene.ChildCount(scene.Root()) == 1);
    CHECK(scene.Children(scene.Root())[0] == hall);
    CHECK(scene.NodeCount() == 2);
}

TEST_CASE("SceneTree::RemoveChildren empties a node but keeps it")
{
    SceneTree scene;
    const auto holder = scene.CreateNode("holder", scene.Root());
    const auto x = scene.CreateNode("x", holder);
    scene.CreateNode("x.child", x);
    scene.CreateNode("y", holder);

    CHECK(scene.RemoveChildren(holder) == 2);
    CHECK(scene.IsAlive(holder));
    CHECK(scene.ChildCount(holder) == 0);
    CHECK(scene.NodeCount() == 2);

    // Nothing left to remove.
    CHECK(scene.RemoveChildren(holder) == 0);
}

TEST_CASE("SceneTree rejects dead handles and freeing the root")
{
    SceneTree scene;
    const auto n = scene.CreateNode("n", scene.Root());
    scene.Free(n);

    CHECK_THROWS_AS(scene.Free(n), std::invalid_argument);
    CHECK_THROWS_AS(scene.CreateNode("orphan", n), std::invalid_argument);
    CHECK_THROWS_AS(scene.Children(n), std::invalid_argument);
    CHECK_THROWS_AS(scene.RemoveChildren(entt::null), std::invalid_argument);
    CHECK_THROWS_AS(scene.Free(scene.Root()), std::invalid_argument);
    CHECK_FALSE(scene.IsAlive(entt::null));
}

TEST_CASE("UpdateTickables runs active tickables once per call")
{
    SceneTree scene;
    auto& reg = scene.Registry();

    int    calls = 0;
    double seen  = 0.0;
    const auto on = scene.CreateNode("on", scene.Root());
    reg.emplace<Tickable>(on, Tickable{[&](entt::registry&, entt::entity, double dt) { ++calls; seen += dt; }, true});

    const auto off = scene.CreateNode("off", scene.Root());
    reg.emplace<Tickable>(off, Tickable{[&](entt::registry&, entt::entity, double) { calls += 100; }, false});

    CHECK(tickspec::engine::UpdateTickables(reg, 0.5) == 1);
    CHECK(tickspec::engine::UpdateTickables(reg, 0.25) == 1);
    CHECK(calls == 2);
    CHECK(seen == doctest::Approx(0.75));
}

TEST_CASE("UpdateTickables skips nodes destroyed earlier in the same pass")
{
    SceneTree scene;
    auto& reg = scene.Registry();

    const auto a = scene.CreateNode("a", scene.Root());
    const auto b = scene.CreateNode("b", scene.Root());

    std::vector<entt::entity> ran;
    // Whichever runs first frees the other one.
    reg.emplace<Tickable>(a, Tickable{[&](entt::registry&, entt::entity self, double) {
        ran.push_back(self);
        if (scene.IsAlive(b)) scene.Free(b);
    }, true});
    reg.emplace<Tickable>(b, Tickable{[&](entt::registry&, entt::entity self, double) {
        ran.push_back(self);
        if (scene.IsAlive(a)) scene.Free(a);
    }, true});

    CHECK(tickspec::engine::UpdateTickables(reg, 0.1) == 1);
    CHECK(ran.size() == 1);
    CHECK(scene.NodeCount() == 2);
}

TEST_CASE("UpdateTickables does not tick nodes created during the pass")
{
    SceneTree scene;
    auto& reg = scene.Registry();

    int spawnedCalls = 0;
    const auto spawner = scene.CreateNode("spawner", scene.Root());
    reg.emplace<Tickable>(spawner, Tickable{[&](entt::registry& r, entt::entity self, double) {
        if (scene.ChildCount(self) > 0)
            return;
        const auto child = scene.CreateNode("spawned", self);
        r.emplace<Tickable>(child, Tickable{[&](entt::registry&, entt::entity, double) { ++spawnedCalls; }, true});
    }, true});

    tickspec::engine::UpdateTickables(reg, 0.1);
    CHECK(spawnedCalls == 0);

    tickspec::engine::UpdateTickables(reg, 0.1);
    CHECK(spawnedCalls == 1);
}
