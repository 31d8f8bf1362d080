// tests/test_test_runner.cpp
//
// Scheduler coverage for src/harness/TestRunner.cpp.
//
// Goals:
//   - One invocation per satisfied frame window, in registration order
//   - Replays keep the spec (iteration counts up, delay is honoured)
//   - Failures are counted, never replayed, and cleaned up after
//   - Focus runs exactly one spec and then quits
//   - The tally and exit code are exact

#include <doctest/doctest.h>

#include "tickspec/core/Console.hpp"
#include "tickspec/engine/Host.hpp"
#include "tickspec/engine/SceneTree.hpp"
#include "tickspec/harness/Spec.hpp"
#include "tickspec/harness/TestRunner.hpp"

#include <cstddef>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using tickspec::harness::TestContext;

namespace {

struct RunnerFixture
{
    tickspec::engine::SceneTree     scene;
    entt::entity                    root = scene.CreateNode("TestRunner", scene.Root());
    tickspec::harness::TestRegistry registry;
    std::ostringstream              out;
    tickspec::core::Console         console{out, false};
    std::vector<int>                quitCodes;
    std::unique_ptr<tickspec::harness::TestRunner> runner;

    tickspec::harness::TestRunner& Start()
    {
        runner = std::make_unique<tickspec::harness::TestRunner>(
            registry, scene, root, console,
            [this](int code) { quitCodes.push_back(code); });
        runner->OnStart();
        return *runner;
    }

    // Feeds frames until the runner finishes. Returns the number of frames.
    std::size_t RunToEnd(double dt, std::size_t maxFrames = 10000)
    {
        std::size_t frames = 0;
        while (!runner->Finished() && frames < maxFrames)
        {
            runner->OnFrame(dt);
            ++frames;
        }
        return frames;
    }

    bool EndsWith(const std::string& suffix) const
    {
        const std::string s = out.str();
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
};

void Pass(TestContext&) {}

void FailNow(TestContext&)
{
    TICKSPEC_FAIL("deliberate failure");
}

} // namespace

TEST_CASE("TestRunner runs every spec once and prints an exact tally")
{
    RunnerFixture f;
    for (int i = 0; i < 5; ++i)
        f.registry.Register("pass", Pass);

    f.Start();
    const std::size_t frames = f.RunToEnd(1.0 / 60.0);

    CHECK(frames == 6); // one frame per spec, one more to notice the end
    CHECK(f.out.str() == ".....\n\n5 examples, 0 failures\n");
    REQUIRE(f.quitCodes.size() == 1);
    CHECK(f.quitCodes[0] == 0);
    CHECK(f.runner->Summary().passes == 5);
    CHECK(f.runner->Summary().failures == 0);
}

TEST_CASE("TestRunner with an empty registry reports zero examples")
{
    RunnerFixture f;
    f.Start();
    f.RunToEnd(0.1);

    CHECK(f.out.str() == "\n\n0 examples, 0 failures\n");
    REQUIRE(f.quitCodes.size() == 1);
    CHECK(f.quitCodes[0] == 0);
    CHECK(f.runner->Invocations() == 0);
}

TEST_CASE("TestRunner counts failures and exits with 1")
{
    RunnerFixture f;
    f.registry.Register("a", Pass);
    f.registry.Register("b", FailNow);
    f.registry.Register("c", Pass);
    f.registry.Register("d", [](TestContext&) { throw std::runtime_error("boom"); });
    f.registry.Register("e", Pass);

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(f.EndsWith("\n\n5 examples, 2 failures\n"));
    CHECK(f.runner->Summary().passes == 3);
    CHECK(f.runner->Summary().failures == 2);
    REQUIRE(f.quitCodes.size() == 1);
    CHECK(f.quitCodes[0] == 1);

    // Failure reports go through the console hook installed by OnStart.
    CHECK(f.out.str().find("spec #2 \"b\" failed") != std::string::npos);
    CHECK(f.out.str().find("deliberate failure") != std::string::npos);
    CHECK(f.out.str().find("boom") != std::string::npos);
}

TEST_CASE("TestRunner replays a spec until it stops asking")
{
    RunnerFixture f;
    constexpr std::size_t kReplays = 4;

    std::vector<std::size_t> seen;
    f.registry.Register("replaying", [&](TestContext& ctx) {
        seen.push_back(ctx.Iteration());
        if (ctx.Iteration() < kReplays)
            TICKSPEC_WAIT(ctx, 0.0);
    });
    f.registry.Register("after", [&](TestContext& ctx) {
        seen.push_back(100 + ctx.Iteration());
    });

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(seen == std::vector<std::size_t>{0, 1, 2, 3, 4, 100});
    CHECK(f.runner->Invocations() == kReplays + 2);
    CHECK(f.runner->Summary().passes == 2); // a replayed spec still counts once
    CHECK(f.out.str() == "..\n\n2 examples, 0 failures\n");
}

TEST_CASE("TestRunner waits until accumulated frame time exceeds the delay")
{
    RunnerFixture f;

    std::size_t frame = 0;
    std::vector<std::size_t> invokedOnFrame;
    f.registry.Register("waits half a second", [&](TestContext& ctx) {
        invokedOnFrame.push_back(frame);
        if (ctx.Iteration() == 0)
            TICKSPEC_WAIT(ctx, 0.5);
    });

    f.Start();
    while (!f.runner->Finished() && frame < 100)
    {
        ++frame;
        f.runner->OnFrame(0.25);
    }

    // Requested on frame 1; 0.25 and 0.5 are not past the delay, 0.75 is.
    REQUIRE(invokedOnFrame.size() == 2);
    CHECK(invokedOnFrame[0] == 1);
    CHECK(invokedOnFrame[1] == 4);
}

TEST_CASE("TestRunner never replays a failed spec")
{
    RunnerFixture f;

    int failingCalls = 0;
    std::size_t nextIteration = 99;
    f.registry.Register("asks for replay, then fails", [&](TestContext& ctx) {
        ++failingCalls;
        ctx.RequestReplay(0.0);
        TICKSPEC_FAIL("failed after requesting a replay");
    });
    f.registry.Register("next", [&](TestContext& ctx) { nextIteration = ctx.Iteration(); });

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(failingCalls == 1);
    CHECK(nextIteration == 0);
    CHECK(f.runner->Summary().failures == 1);
    CHECK(f.runner->Summary().passes == 1);
}

TEST_CASE("TestRunner clears the spec root and replay state between specs")
{
    RunnerFixture f;

    std::size_t childrenSeen = 99;
    double      delaySeen    = -1.0;
    f.registry.Register("populates", [](TestContext& ctx) {
        ctx.Spawn("a");
        const auto b = ctx.Spawn("b");
        ctx.Scene().CreateNode("b.child", b);
        if (ctx.Iteration() == 0)
            TICKSPEC_WAIT(ctx, 0.1);
        TICKSPEC_FAIL("fails on its replay, leaving nodes behind");
    });
    f.registry.Register("checks", [&](TestContext& ctx) {
        childrenSeen = ctx.Scene().ChildCount(ctx.Root());
        delaySeen    = f.runner->State().delayBeforeNextRun;
    });

    f.Start();
    f.RunToEnd(0.05);

    CHECK(childrenSeen == 0);
    CHECK(delaySeen == 0.0);
    CHECK(f.scene.IsAlive(f.root));
    CHECK(f.scene.NodeCount() == 2); // scene root + runner node
    CHECK(f.runner->State().currentTestIteration == 0);
    CHECK_FALSE(f.runner->State().wantsReplay);
}

TEST_CASE("TestRunner runs a focused spec once and then quits")
{
    RunnerFixture f;

    int registeredCalls = 0;
    int focusedCalls    = 0;
    f.registry.Register("skipped", [&](TestContext&) { ++registeredCalls; });
    f.registry.Register("skipped too", [&](TestContext&) { ++registeredCalls; });
    f.registry.Focus("focused", [&](TestContext& ctx) {
        ++focusedCalls;
        if (ctx.Iteration() < 2)
            TICKSPEC_WAIT(ctx, 0.0);
    });

    f.Start();
    const std::size_t frames = f.RunToEnd(1.0 / 60.0);

    CHECK(frames == 3);
    CHECK(focusedCalls == 3);
    CHECK(registeredCalls == 0);
    CHECK_FALSE(f.registry.HasFocus());
    CHECK(f.out.str() == ".\n\n1 examples, 0 failures\n");
    REQUIRE(f.quitCodes.size() == 1);
    CHECK(f.quitCodes[0] == 0);
}

TEST_CASE("TestRunner reports a failing focused spec with exit code 1")
{
    RunnerFixture f;
    f.registry.Register("skipped", Pass);
    f.registry.Focus("focused failure", FailNow);

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(f.out.str().find("focused spec \"focused failure\" failed") != std::string::npos);
    CHECK(f.EndsWith("\n\n1 examples, 1 failures\n"));
    REQUIRE(f.quitCodes.size() == 1);
    CHECK(f.quitCodes[0] == 1);
}

TEST_CASE("TestRunner runs duplicate registrations independently")
{
    RunnerFixture f;

    std::vector<std::size_t> iterations;
    const tickspec::harness::TestRoutine twice = [&](TestContext& ctx) {
        iterations.push_back(ctx.Iteration());
        if (ctx.Iteration() == 0)
            TICKSPEC_WAIT(ctx, 0.0);
    };
    f.registry.Register("dup", twice);
    f.registry.Register("dup", twice);

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(iterations == std::vector<std::size_t>{0, 1, 0, 1});
    CHECK(f.runner->Summary().passes == 2);
}

TEST_CASE("TestRunner picks up specs registered while the run is in progress")
{
    RunnerFixture f;

    bool lateRan = false;
    f.registry.Register("registers another", [&](TestContext&) {
        f.registry.Register("late", [&](TestContext&) { lateRan = true; });
    });

    f.Start();
    f.RunToEnd(1.0 / 60.0);

    CHECK(lateRan);
    CHECK(f.out.str() == "..\n\n2 examples, 0 failures\n");
}

TEST_CASE("TestRunner ignores frames after it has finished")
{
    RunnerFixture f;
    f.registry.Register("only", Pass);

    f.Start();
    f.RunToEnd(1.0 / 60.0);
    const std::string before = f.out.str();

    for (int i = 0; i < 10; ++i)
        f.runner->OnFrame(1.0);

    CHECK(f.runner->Invocations() == 1);
    CHECK(f.quitCodes.size() == 1);
    CHECK(f.out.str() == before);
}

TEST_CASE("MountTestRunner drives specs from the host frame loop")
{
    tickspec::engine::HostConfig cfg;
    cfg.frame_dt = 0.1;
    tickspec::engine::Host host(cfg);

    std::ostringstream out;
    tickspec::core::Console console(out, false);

    tickspec::harness::TestRegistry registry;
    entt::entity rootSeen = entt::null;
    registry.Register("sees the runner node", [&](TestContext& ctx) {
        rootSeen = ctx.Root();
        if (ctx.Iteration() == 0)
            TICKSPEC_WAIT(ctx, 0.3);
    });
    registry.Register("fails", FailNow);

    const auto runner = tickspec::harness::MountTestRunner(host, registry, console);
    const int code = host.Run();

    CHECK(code == 1);
    CHECK(runner->Finished());
    REQUIRE(rootSeen != entt::null);
    CHECK(host.Scene().Name(rootSeen) == "TestRunner");
    CHECK(host.Scene().Parent(rootSeen) == host.Scene().Root());
    CHECK(out.str().find("2 examples, 1 failures") != std::string::npos);
}
