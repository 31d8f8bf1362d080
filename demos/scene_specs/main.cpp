// demos/scene_specs/main.cpp
// Headless host that runs every spec registered with TICKSPEC_SPEC in this
// executable and exits with 0 when all of them pass.

#include "tickspec/app/CommandLineArgs.hpp"
#include "tickspec/core/Config.hpp"
#include "tickspec/core/Console.hpp"
#include "tickspec/core/Log.hpp"
#include "tickspec/engine/Host.hpp"
#include "tickspec/harness/TestRunner.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultConfigFile = "tickspec.json";

} // namespace

int main(int argc, char** argv)
{
    // ----- Command line -----
    std::vector<std::string_view> argvView;
    argvView.reserve(static_cast<std::size_t>(argc));
    for (int i = 0; i < argc; ++i)
        argvView.emplace_back(argv[i]);

    const tickspec::app::CommandLineArgs args = tickspec::app::ParseCommandLineArgsFromArgv(argvView);

    if (args.showHelp)
    {
        std::cout << tickspec::app::BuildCommandLineHelpText();
        return 0;
    }

    if (!args.unknown.empty())
    {
        std::cerr << "Unknown command line option(s):\n";
        for (const auto& u : args.unknown)
            std::cerr << "  " << u << "\n";
        std::cerr << "\n" << tickspec::app::BuildCommandLineHelpText();
        return 2;
    }

    // ----- Settings: file, then environment, then command line -----
    // Config warnings are held until the configured log file is open.
    const auto startupLog = tickspec::core::BeginStartupLogging();

    tickspec::core::HarnessConfig cfg;
    const fs::path configPath = args.configPath ? fs::path(*args.configPath) : fs::path(kDefaultConfigFile);
    const bool loaded = tickspec::core::LoadHarnessConfig(cfg, configPath);
    if (!loaded && args.configPath)
    {
        for (const auto& line : startupLog->last_formatted())
            std::cerr << line;
        std::cerr << "Cannot load config file " << configPath.string() << "\n";
        return 2;
    }

    tickspec::core::ApplyEnvironmentOverrides(cfg);
    tickspec::app::ApplyCommandLineOverrides(args, cfg);

    tickspec::core::InitLogging(cfg.logFile, cfg.logLevel);
    if (loaded)
        spdlog::info("Using config {}", configPath.string());

    // ----- Host + harness -----
    tickspec::core::Console console(std::cout, cfg.colorOutput);

    tickspec::engine::HostConfig hostCfg;
    hostCfg.frame_dt     = cfg.frameDt;
    hostCfg.max_frame_dt = cfg.maxFrameDt;
    hostCfg.realtime     = cfg.realtime;
    tickspec::engine::Host host(hostCfg);

    tickspec::harness::RunnerOptions options;
    options.filterTraces      = cfg.filterTraces;
    options.maxTraceFrames    = static_cast<std::size_t>(cfg.maxTraceFrames);
    options.extraTraceFilters = cfg.extraTraceFilters;

    const auto runner = tickspec::harness::MountTestRunner(host, tickspec::harness::GlobalRegistry(), console, options);

    const int exitCode = host.Run();

    tickspec::core::ShutdownLogging();
    return exitCode;
}
