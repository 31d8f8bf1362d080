// src/app/CommandLineArgs.cpp
#include "tickspec/app/CommandLineArgs.hpp"
#include "tickspec/core/Log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>

namespace tickspec::app {

namespace {

[[nodiscard]] std::string ToLower(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

[[nodiscard]] std::optional<double> ParseSeconds(std::string_view s)
{
    if (s.empty())
        return std::nullopt;

    double v = 0.0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(begin, end, v);
    if (ec != std::errc{} || ptr != end)
        return std::nullopt;
    if (!(v > 0.0) || v > 1.0)
        return std::nullopt; // absurd frame delta

    return v;
}

} // namespace

CommandLineArgs ParseCommandLineArgsFromArgv(const std::vector<std::string_view>& argv)
{
    CommandLineArgs out;

    auto addUnknown = [&](std::string_view raw) {
        out.unknown.emplace_back(raw);
    };

    for (std::size_t i = 1; i < argv.size(); ++i)
    {
        const std::string_view raw = argv[i];
        if (raw.empty())
            continue;

        // Option names are case-insensitive; inline values ("--opt=value") are not.
        const std::size_t eq = raw.find('=');
        const std::string name = ToLower(raw.substr(0, eq));
        const bool hasInline = eq != std::string_view::npos;
        const std::string_view inlineValue = hasInline ? raw.substr(eq + 1) : std::string_view{};

        // Help
        if (!hasInline && (name == "--help" || name == "-h" || name == "-?")) {
            out.showHelp = true;
            continue;
        }

        // Boolean overrides
        if (!hasInline) {
            if (name == "--color" || name == "--colour") { out.color = true; continue; }
            if (name == "--no-color" || name == "--no-colour") { out.color = false; continue; }
            if (name == "--realtime") { out.realtime = true; continue; }
            if (name == "--fixed-step") { out.realtime = false; continue; }
            if (name == "--trace-filter") { out.traceFilter = true; continue; }
            if (name == "--no-trace-filter") { out.traceFilter = false; continue; }
        }

        // Options with values: "--opt value" or "--opt=value".
        const bool takesValue = name == "--config" || name == "-c" ||
                                name == "--frame-dt" || name == "--log-level";
        if (!takesValue) {
            addUnknown(raw);
            continue;
        }

        std::string_view value = inlineValue;
        if (!hasInline) {
            if (i + 1 >= argv.size()) {
                addUnknown(raw);
                continue;
            }
            value = argv[i + 1];
        }

        bool ok = false;
        if (name == "--config" || name == "-c") {
            if (!value.empty()) {
                out.configPath = std::string(value);
                ok = true;
            }
        } else if (name == "--frame-dt") {
            if (const auto dt = ParseSeconds(value)) {
                out.frameDt = *dt;
                ok = true;
            }
        } else if (name == "--log-level") {
            const std::string level = ToLower(value);
            if (core::IsKnownLogLevel(level)) {
                out.logLevel = level;
                ok = true;
            }
        }

        if (!ok) {
            // Like an unknown option, a bad value is reported verbatim and the
            // following token is not consumed.
            addUnknown(raw);
            continue;
        }
        if (!hasInline)
            ++i;
    }

    return out;
}

void ApplyCommandLineOverrides(const CommandLineArgs& args, core::HarnessConfig& cfg)
{
    if (args.color)       cfg.colorOutput  = *args.color;
    if (args.realtime)    cfg.realtime     = *args.realtime;
    if (args.traceFilter) cfg.filterTraces = *args.traceFilter;
    if (args.frameDt)     cfg.frameDt      = *args.frameDt;
    if (args.logLevel)    cfg.logLevel     = *args.logLevel;
}

std::string BuildCommandLineHelpText()
{
    std::ostringstream oss;
    oss << "tickspec_demo - frame-driven spec runner\n\n";
    oss << "Options\n";
    oss << "  --config, -c <path>          Read harness settings from a JSON file\n";
    oss << "  --color / --no-color         Force coloured tally on/off\n";
    oss << "  --realtime / --fixed-step    Pace frames against the wall clock, or feed a fixed delta\n";
    oss << "  --frame-dt <seconds>         Frame delta (0 < dt <= 1, default 1/60)\n";
    oss << "  --trace-filter               Show only spec frames in failure traces (default)\n";
    oss << "  --no-trace-filter            Show full failure traces\n";
    oss << "  --log-level <level>          trace, debug, info, warning, error, critical, off\n";
    oss << "  --help, -h                   Show this help\n\n";

    oss << "Environment\n";
    oss << "  NO_COLOR, CI                 Disable coloured output\n\n";

    oss << "Examples\n";
    oss << "  tickspec_demo --no-color\n";
    oss << "  tickspec_demo --config tickspec.json --log-level debug\n";
    return oss.str();
}

} // namespace tickspec::app
