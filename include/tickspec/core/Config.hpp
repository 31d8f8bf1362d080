// include/tickspec/core/Config.hpp
#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tickspec::core {

// Harness settings, usually read from a JSON file:
//
//   {
//     "output":  { "color": true },
//     "trace":   { "filter": true, "maxFrames": 64, "extraFilters": ["regex", ...] },
//     "host":    { "frameDt": 0.016666, "realtime": false, "maxFrameDt": 0.25 },
//     "logging": { "level": "info", "file": "logs/tickspec.log" }
//   }
//
// Every key is optional. Unknown keys are ignored, out-of-range numbers are
// clamped, values of the wrong type are skipped.
struct HarnessConfig
{
    // Terminal tally.
    bool colorOutput = true;

    // Failure traces.
    bool                     filterTraces   = true;
    int                      maxTraceFrames = 64;
    std::vector<std::string> extraTraceFilters; // regexes; matching frames are dropped

    // Host frame loop.
    double frameDt    = 1.0 / 60.0;
    double maxFrameDt = 0.25;
    bool   realtime   = false;

    // spdlog.
    std::string           logLevel = "info";
    std::filesystem::path logFile  = "logs/tickspec.log";
};

// Returns true if `text` was a JSON object and was applied.
// On failure, `out` is left unchanged (callers should initialize defaults first).
[[nodiscard]] bool ParseHarnessConfig(HarnessConfig& out, std::string_view text) noexcept;

// Returns false for a missing/unreadable file or invalid JSON; `out` is then unchanged.
[[nodiscard]] bool LoadHarnessConfig(HarnessConfig& out, const std::filesystem::path& path) noexcept;

using EnvLookup = std::function<const char*(const char*)>;

// NO_COLOR or a CI environment (CI, GITHUB_ACTIONS, TF_BUILD, APPVEYOR)
// turns coloured output off. `env` defaults to std::getenv.
void ApplyEnvironmentOverrides(HarnessConfig& cfg, const EnvLookup& env = {});

} // namespace tickspec::core
