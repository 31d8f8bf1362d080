// src/harness/TestRunner.cpp
#include "tickspec/harness/TestRunner.hpp"
#include "tickspec/harness/TestContext.hpp"

#include <utility>

#include <spdlog/spdlog.h>

namespace tickspec::harness {

TestRunner::TestRunner(TestRegistry& registry, engine::SceneTree& scene, entt::entity root,
                       core::Console& console, QuitCallback quit, const RunnerOptions& options)
    : m_registry(registry)
    , m_scene(scene)
    , m_root(root)
    , m_console(console)
    , m_quit(std::move(quit))
    , m_filter(DefaultTraceFilter())
    , m_filterTraces(options.filterTraces)
    , m_maxTraceFrames(options.maxTraceFrames)
{
    for (const auto& pattern : options.extraTraceFilters)
        AddDropPattern(m_filter, pattern);
}

TestRunner::~TestRunner()
{
    if (m_hookInstalled)
        SetFailureHook(std::move(m_previousHook));
}

void TestRunner::OnStart()
{
    if (m_hookInstalled)
        return;

    m_previousHook  = SetFailureHook(MakeConsoleFailureHook(m_console));
    m_hookInstalled = true;

    spdlog::info("Test runner started: {} specs registered{}", m_registry.Size(),
                 m_registry.HasFocus() ? " (focused spec set)" : "");
}

void TestRunner::OnFrame(double elapsedSeconds)
{
    if (m_finished)
        return;

    m_timeCounter += elapsedSeconds;
    if (m_timeCounter > m_state.delayBeforeNextRun)
    {
        m_timeCounter = 0.0;
        Advance();
    }
}

void TestRunner::Advance()
{
    if (m_finished)
        return;

    const bool focused = m_registry.HasFocus();
    const TestEntry* current = focused ? m_registry.Focused() : m_registry.Lookup(m_state.currentTestIndex);
    if (current == nullptr)
    {
        Quit();
        return;
    }

    // Copy: the spec may register more specs, which can move the entries.
    const TestEntry entry = *current;

    if (m_state.currentTestIteration == 0)
        spdlog::debug("Spec #{} \"{}\" started", m_state.currentTestIndex + 1, entry.name);

    IsolationSettings settings;
    settings.testIndex      = m_state.currentTestIndex;
    settings.focused        = focused;
    settings.filter         = m_filterTraces ? &m_filter : nullptr;
    settings.maxTraceFrames = m_maxTraceFrames;

    TestContext ctx(m_scene, m_root, m_state);
    ++m_invocations;
    const InvokeOutcome outcome = InvokeIsolated(entry, ctx, settings);

    if (outcome == InvokeOutcome::Returned)
    {
        if (m_state.wantsReplay)
        {
            m_state.wantsReplay = false;
            ++m_state.currentTestIteration;
            spdlog::trace("Spec \"{}\" replays in {:.3f}s (iteration {})", entry.name,
                          m_state.delayBeforeNextRun, m_state.currentTestIteration);
            return;
        }

        ++m_summary.passes;
        m_console.Print(core::Tone::Green, ".");
    }
    else
    {
        // A failed spec is never replayed, even if it asked to be.
        ++m_summary.failures;
        m_console.Print(core::Tone::Red, "F");
    }

    ++m_state.currentTestIndex;
    Cleanup();

    if (focused)
        Quit();
}

// Remove the previous spec's nodes and reset its replay state.
void TestRunner::Cleanup()
{
    m_state.ResetForNextTest();
    m_registry.ClearFocus();

    if (m_scene.IsAlive(m_root))
        m_scene.RemoveChildren(m_root);
}

void TestRunner::Quit()
{
    m_finished = true;

    const std::string summary = FormatSummary(m_summary);
    if (m_summary.failures > 0)
        m_console.PrintLine(core::Tone::Red, "\n\n" + summary);
    else
        m_console.PrintLine(core::Tone::Green, "\n\n" + summary);

    spdlog::info("Test run finished: {}", summary);

    if (m_quit)
        m_quit(m_summary.Succeeded() ? 0 : 1);
}

std::unique_ptr<TestRunner> MountTestRunner(engine::Host& host, TestRegistry& registry,
                                            core::Console& console, const RunnerOptions& options)
{
    const entt::entity node = host.Attach("TestRunner", engine::Tickable{});

    auto runner = std::make_unique<TestRunner>(
        registry, host.Scene(), node, console,
        [&host](int exit_code) { host.RequestQuit(exit_code); },
        options);

    TestRunner* raw = runner.get();
    host.Scene().Registry().get<engine::Tickable>(node).tick =
        [raw](entt::registry&, entt::entity, double dt) { raw->OnFrame(dt); };

    raw->OnStart();
    return runner;
}

} // namespace tickspec::harness
