// include/tickspec/harness/FailureIsolation.hpp
#pragma once
#include <cstddef>
#include <functional>
#include <string>

#include "tickspec/core/Console.hpp"
#include "tickspec/harness/StackTrace.hpp"
#include "tickspec/harness/TestRegistry.hpp"

namespace tickspec::harness {

class TestContext;

struct FailureReport {
    std::string testName;
    std::size_t testIndex = 0;     // registry slot; meaningless when focused
    bool        focused   = false;
    std::size_t iteration = 0;     // replay count when the spec failed
    std::string message;           // includes file:line when known
    StackFrames trace;             // already filtered and truncated
};

using FailureHook = std::function<void(const FailureReport&)>;

// Installs the process-wide failure hook and returns the previous one. An
// empty hook restores the default, which writes the report to stderr.
FailureHook SetFailureHook(FailureHook hook);

// Hand `report` to the installed hook.
void ReportFailure(const FailureReport& report);

// Red message, blue trace.
FailureHook MakeConsoleFailureHook(core::Console& console);

enum class InvokeOutcome { Returned, Failed };

struct IsolationSettings {
    std::size_t        testIndex      = 0;
    bool               focused        = false;
    const TraceFilter* filter         = nullptr; // nullptr: report traces unfiltered
    std::size_t        maxTraceFrames = 64;
};

// Runs `entry` and converts anything it throws into a reported failure.
// Nothing escapes.
InvokeOutcome InvokeIsolated(const TestEntry& entry, TestContext& ctx, const IsolationSettings& settings);

} // namespace tickspec::harness
