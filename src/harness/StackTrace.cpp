// src/harness/StackTrace.cpp
#include "tickspec/harness/StackTrace.hpp"

#include <cstdio>
#include <cstdlib>
#include <initializer_list>
#include <memory>

#include <cxxabi.h>
#include <execinfo.h>

#include <spdlog/spdlog.h>

namespace tickspec::harness {

namespace {

bool MatchesAny(const std::string& frame, const std::vector<std::regex>& patterns)
{
    for (const auto& re : patterns) {
        if (std::regex_search(frame, re))
            return true;
    }
    return false;
}

std::vector<std::regex> Compile(std::initializer_list<const char*> patterns)
{
    std::vector<std::regex> out;
    out.reserve(patterns.size());
    for (const char* p : patterns)
        out.emplace_back(p, std::regex::ECMAScript | std::regex::optimize);
    return out;
}

} // namespace

std::string Demangle(const char* mangled)
{
    if (mangled == nullptr || mangled[0] == '\0')
        return {};

    int status = 0;
    std::unique_ptr<char, void (*)(void*)> out(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), &std::free);

    if (status == 0 && out)
        return out.get();
    return mangled;
}

std::string SymbolizeFrame(std::string_view raw)
{
    const auto open  = raw.find('(');
    const auto close = raw.find(')', open == std::string_view::npos ? 0 : open);
    if (open == std::string_view::npos || close == std::string_view::npos)
        return std::string(raw);

    const std::string_view module = raw.substr(0, open);
    const std::string_view inside = raw.substr(open + 1, close - open - 1);
    const std::string_view rest   = raw.substr(close + 1); // " [0x...]"

    const auto plus = inside.rfind('+');
    const std::string_view symbol = inside.substr(0, plus);
    if (symbol.empty())
        return std::string(raw);

    std::string out = Demangle(std::string(symbol).c_str());
    if (plus != std::string_view::npos)
        out.append(inside.substr(plus));
    out.append(" in ");
    out.append(module);
    out.append(rest);
    return out;
}

StackFrames CaptureStackTrace(std::size_t maxFrames)
{
    StackFrames frames;
    if (maxFrames == 0)
        return frames;

    std::vector<void*> addrs(maxFrames);
    const int got = ::backtrace(addrs.data(), static_cast<int>(addrs.size()));
    if (got <= 0)
        return frames;

    std::unique_ptr<char*, void (*)(void*)> symbols(::backtrace_symbols(addrs.data(), got), &std::free);

    frames.reserve(static_cast<std::size_t>(got));
    for (int i = 0; i < got; ++i)
    {
        if (symbols) {
            frames.push_back(SymbolizeFrame(symbols.get()[i]));
        } else {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "[%p]", addrs[static_cast<std::size_t>(i)]);
            frames.emplace_back(buf);
        }
    }
    return frames;
}

TraceFilter DefaultTraceFilter()
{
    TraceFilter f;
    f.signal = Compile({
        R"(tickspec::harness::CaptureStackTrace\()",
        R"(tickspec::harness::TestFailure::TestFailure\()",
        R"(tickspec::harness::Fail\()",
        R"(tickspec::harness::AssertApproxEq\()",
        R"(__cxa_throw)",
    });
    f.dispatch = Compile({
        R"(tickspec::harness::InvokeIsolated\()",
        R"(tickspec::harness::TestRunner::Advance\()",
    });
    f.glue = Compile({
        R"(std::_Function_handler<)",
        R"(std::__invoke)",
        R"(std::function<)",
    });
    return f;
}

bool AddDropPattern(TraceFilter& filter, const std::string& pattern)
{
    try {
        filter.drop.emplace_back(pattern, std::regex::ECMAScript | std::regex::optimize);
        return true;
    } catch (const std::regex_error& e) {
        spdlog::warn("Ignoring invalid trace filter '{}': {}", pattern, e.what());
        return false;
    }
}

StackFrames FilterStackTrace(const StackFrames& frames, const TraceFilter& filter)
{
    std::size_t begin = 0;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (MatchesAny(frames[i], filter.signal))
            begin = i + 1;
    }

    std::size_t end = frames.size();
    for (std::size_t i = begin; i < frames.size(); ++i) {
        if (MatchesAny(frames[i], filter.dispatch)) {
            end = i;
            // Adapters only count as glue when a dispatch frame was found.
            while (end > begin && MatchesAny(frames[end - 1], filter.glue))
                --end;
            break;
        }
    }

    StackFrames out;
    out.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        if (!MatchesAny(frames[i], filter.drop))
            out.push_back(frames[i]);
    }
    return out;
}

} // namespace tickspec::harness
