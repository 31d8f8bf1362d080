// include/tickspec/harness/TestRunner.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "tickspec/core/Console.hpp"
#include "tickspec/engine/Host.hpp"
#include "tickspec/engine/SceneTree.hpp"
#include "tickspec/harness/FailureIsolation.hpp"
#include "tickspec/harness/RunSummary.hpp"
#include "tickspec/harness/SchedulerState.hpp"
#include "tickspec/harness/StackTrace.hpp"
#include "tickspec/harness/TestRegistry.hpp"

namespace tickspec::harness {

// Receives the process exit code once the run is over.
using QuitCallback = std::function<void(int exit_code)>;

struct RunnerOptions {
    bool                     filterTraces   = true;
    std::size_t              maxTraceFrames = 64;
    std::vector<std::string> extraTraceFilters; // regexes, dropped from traces
};

// Runs the specs of a registry one per satisfied frame window.
//
// The host calls OnStart once when the runner is attached and OnFrame every
// frame after that. Specs see `root` as their context node; its children
// are removed whenever the runner moves on to the next spec. When the
// registry is exhausted (or the focused spec has finished) the summary is
// printed and `quit` is called with 0 on success and 1 on any failure.
class TestRunner {
public:
    TestRunner(TestRegistry& registry, engine::SceneTree& scene, entt::entity root,
               core::Console& console, QuitCallback quit, const RunnerOptions& options = {});
    ~TestRunner();

    TestRunner(const TestRunner&)            = delete;
    TestRunner& operator=(const TestRunner&) = delete;

    // Installs the console failure hook. The previous hook comes back when
    // the runner is destroyed.
    void OnStart();

    // Frame driver: advances once the accumulated time exceeds the delay
    // requested by the running spec.
    void OnFrame(double elapsedSeconds);

    // Scheduler step: invoke the current spec once and settle its outcome.
    void Advance();

    const SchedulerState& State() const noexcept { return m_state; }
    const RunSummary&     Summary() const noexcept { return m_summary; }
    bool                  Finished() const noexcept { return m_finished; }
    std::size_t           Invocations() const noexcept { return m_invocations; }

private:
    void Cleanup();
    void Quit();

    TestRegistry&      m_registry;
    engine::SceneTree& m_scene;
    entt::entity       m_root;
    core::Console&     m_console;
    QuitCallback       m_quit;

    TraceFilter m_filter;
    bool        m_filterTraces;
    std::size_t m_maxTraceFrames;

    SchedulerState m_state{};
    RunSummary     m_summary{};
    double         m_timeCounter = 0.0;
    std::size_t    m_invocations = 0;
    bool           m_finished    = false;

    bool        m_hookInstalled = false;
    FailureHook m_previousHook;
};

// Attaches a "TestRunner" node to `host`, wires its frame callback and quit
// request, and starts it. The returned runner must outlive host.Run().
std::unique_ptr<TestRunner> MountTestRunner(engine::Host& host, TestRegistry& registry,
                                            core::Console& console, const RunnerOptions& options = {});

} // namespace tickspec::harness
