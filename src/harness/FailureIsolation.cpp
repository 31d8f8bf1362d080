// src/harness/FailureIsolation.cpp
#include "tickspec/harness/FailureIsolation.hpp"
#include "tickspec/harness/Assertions.hpp"
#include "tickspec/harness/TestContext.hpp"

#include <cstdio>
#include <exception>
#include <sstream>
#include <typeinfo>
#include <utility>

#include <spdlog/spdlog.h>

namespace tickspec::harness {

namespace {

FailureHook& InstalledHook()
{
    static FailureHook hook;
    return hook;
}

std::string Describe(const FailureReport& report)
{
    std::ostringstream oss;
    if (report.focused)
        oss << "focused spec";
    else
        oss << "spec #" << report.testIndex + 1;
    oss << " \"" << report.testName << "\" failed";
    if (report.iteration > 0)
        oss << " on replay " << report.iteration;
    return oss.str();
}

void DefaultHook(const FailureReport& report)
{
    std::fprintf(stderr, "%s\n%s\n", Describe(report).c_str(), report.message.c_str());
    for (std::size_t i = 0; i < report.trace.size(); ++i)
        std::fprintf(stderr, "%4zu: %s\n", i, report.trace[i].c_str());
}

FailureReport MakeReport(const TestEntry& entry, const TestContext& ctx, const IsolationSettings& settings,
                         std::string message, const StackFrames& rawTrace)
{
    FailureReport report;
    report.testName  = entry.name;
    report.testIndex = settings.testIndex;
    report.focused   = settings.focused;
    report.iteration = ctx.Iteration();
    report.message   = std::move(message);
    report.trace     = settings.filter ? FilterStackTrace(rawTrace, *settings.filter) : rawTrace;
    if (report.trace.size() > settings.maxTraceFrames)
        report.trace.resize(settings.maxTraceFrames);
    return report;
}

} // namespace

FailureHook SetFailureHook(FailureHook hook)
{
    return std::exchange(InstalledHook(), std::move(hook));
}

void ReportFailure(const FailureReport& report)
{
    const FailureHook& hook = InstalledHook();
    if (hook)
        hook(report);
    else
        DefaultHook(report);
}

FailureHook MakeConsoleFailureHook(core::Console& console)
{
    return [&console](const FailureReport& report) {
        console.PrintLine(core::Tone::Red, "\n" + Describe(report) + ":\n" + report.message);

        if (report.trace.empty()) {
            console.PrintLine(core::Tone::Blue, "  (no stack frames outside the harness were captured)");
            return;
        }

        std::ostringstream oss;
        for (std::size_t i = 0; i < report.trace.size(); ++i) {
            if (i > 0)
                oss << '\n';
            oss.width(4);
            oss << i;
            oss << ": " << report.trace[i];
        }
        console.PrintLine(core::Tone::Blue, oss.str());
    };
}

InvokeOutcome InvokeIsolated(const TestEntry& entry, TestContext& ctx, const IsolationSettings& settings)
{
    FailureReport report;

    try {
        entry.routine(ctx);
        return InvokeOutcome::Returned;
    } catch (const TestFailure& failure) {
        std::ostringstream oss;
        if (failure.File() != nullptr)
            oss << "failed at " << failure.File() << ':' << failure.Line() << ":\n";
        oss << failure.what();
        report = MakeReport(entry, ctx, settings, oss.str(), failure.Trace());
    } catch (const std::exception& e) {
        // Thrown outside the harness primitives: the throw site is gone, so
        // this trace is best effort and usually filters down to nothing.
        const std::string message =
            "uncaught exception " + Demangle(typeid(e).name()) + ": " + e.what();
        report = MakeReport(entry, ctx, settings, message, CaptureStackTrace(settings.maxTraceFrames));
    } catch (...) {
        report = MakeReport(entry, ctx, settings, "uncaught exception of unknown type",
                            CaptureStackTrace(settings.maxTraceFrames));
    }

    spdlog::warn("{}: {}", Describe(report), report.message);
    ReportFailure(report);
    return InvokeOutcome::Failed;
}

} // namespace tickspec::harness
