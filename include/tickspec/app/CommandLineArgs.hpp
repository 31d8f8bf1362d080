// include/tickspec/app/CommandLineArgs.hpp
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tickspec/core/Config.hpp"

namespace tickspec::app {

// Parsed command-line arguments for the tickspec_demo executable.
//
// Notes:
//   - All option names are case-insensitive.
//   - Both "--flag=value" and "--flag value" forms are supported.
struct CommandLineArgs
{
    bool showHelp = false;                 // --help / -h / -?

    std::optional<std::string> configPath; // --config <path>
    std::optional<bool>        color;      // --color / --no-color
    std::optional<bool>        realtime;   // --realtime / --fixed-step
    std::optional<bool>        traceFilter;// --trace-filter / --no-trace-filter
    std::optional<double>      frameDt;    // --frame-dt <seconds>
    std::optional<std::string> logLevel;   // --log-level <level>

    // Any unknown/unsupported args are collected here (so we can show a useful error).
    std::vector<std::string> unknown;
};

// argv[0] is the program name and is skipped.
[[nodiscard]] CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv);

// Command-line values win over the config file and the environment.
void ApplyCommandLineOverrides(const CommandLineArgs& args, core::HarnessConfig& cfg);

[[nodiscard]] std::string BuildCommandLineHelpText();

} // namespace tickspec::app
