// include/tickspec/harness/StackTrace.hpp
#pragma once
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace tickspec::harness {

// One human-readable line per frame, innermost call first.
using StackFrames = std::vector<std::string>;

// Captures the calling thread's stack and symbolizes it. Symbol names need
// the executable to export its symbols (-rdynamic); frames that cannot be
// resolved keep the raw "module(+offset) [address]" text.
StackFrames CaptureStackTrace(std::size_t maxFrames = 64);

// "_ZN8tickspec7harness4StepEv" -> "tickspec::harness::Step()".
// Returns the input unchanged when it is not a mangled name.
std::string Demangle(const char* mangled);

// Rewrites one backtrace_symbols() line, "module(mangled+0x1c) [0x...]",
// as "demangled+0x1c in module [0x...]".
std::string SymbolizeFrame(std::string_view raw);

// Pattern sets applied by FilterStackTrace.
struct TraceFilter {
    // Failure-signalling internals (the capture itself, exception
    // construction, throw helpers). Frames up to and including the last
    // match are dropped.
    std::vector<std::regex> signal;

    // Harness dispatch entry points. The first match after the signal cut,
    // and every frame outside it, is dropped.
    std::vector<std::regex> dispatch;

    // Call adapters sitting directly inside the dispatch frame
    // (std::function plumbing); trimmed from the end of what remains.
    std::vector<std::regex> glue;

    // Dropped wherever they appear.
    std::vector<std::regex> drop;
};

// Patterns for tickspec's own frames.
TraceFilter DefaultTraceFilter();

// Adds `pattern` to filter.drop. Returns false (and logs) for an invalid regex.
bool AddDropPattern(TraceFilter& filter, const std::string& pattern);

// Keeps only the test author's frames. A trace that matches no pattern is
// returned unchanged.
StackFrames FilterStackTrace(const StackFrames& frames, const TraceFilter& filter);

} // namespace tickspec::harness
