// src/core/Config.cpp
#include "tickspec/core/Config.hpp"
#include "tickspec/core/Log.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace tickspec::core {

namespace {
    constexpr int kMinTraceFrames = 1;
    constexpr int kMaxTraceFrames = 256;

    constexpr double kMinFrameDt = 0.0001;
    constexpr double kMaxFrameDt = 1.0;

    bool ReadFileToString(const std::filesystem::path& p, std::string& out) noexcept
    {
        out.clear();
        std::ifstream f(p, std::ios::binary);
        if (!f) return false;
        f.seekg(0, std::ios::end);
        const std::streamoff sz = f.tellg();
        if (sz < 0) return false;
        if (sz == 0) return true; // empty file: a parse failure, not a read failure
        f.seekg(0, std::ios::beg);
        out.resize(static_cast<std::size_t>(sz));
        f.read(out.data(), static_cast<std::streamsize>(sz));
        return static_cast<bool>(f);
    }

    bool EnvTruthy(const char* v) noexcept
    {
        // Any non-empty value except "0".
        return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
    }
}

bool ParseHarnessConfig(HarnessConfig& out, std::string_view text) noexcept
{
    // Allow // comments, and avoid exceptions.
    const nlohmann::json j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
        return false;

    HarnessConfig tmp = out;

    if (const auto it = j.find("output"); it != j.end() && it->is_object())
    {
        if (auto c = it->find("color"); c != it->end() && c->is_boolean())
            tmp.colorOutput = c->get<bool>();
    }

    if (const auto it = j.find("trace"); it != j.end() && it->is_object())
    {
        if (auto f = it->find("filter"); f != it->end() && f->is_boolean())
            tmp.filterTraces = f->get<bool>();
        if (auto m = it->find("maxFrames"); m != it->end() && m->is_number_integer())
            tmp.maxTraceFrames = static_cast<int>(std::clamp<std::int64_t>(m->get<std::int64_t>(), kMinTraceFrames, kMaxTraceFrames));
        if (auto x = it->find("extraFilters"); x != it->end() && x->is_array())
        {
            tmp.extraTraceFilters.clear();
            for (const auto& p : *x)
            {
                if (p.is_string())
                    tmp.extraTraceFilters.push_back(p.get<std::string>());
            }
        }
    }

    if (const auto it = j.find("host"); it != j.end() && it->is_object())
    {
        if (auto dt = it->find("frameDt"); dt != it->end() && dt->is_number())
            tmp.frameDt = std::clamp(dt->get<double>(), kMinFrameDt, kMaxFrameDt);
        if (auto mfd = it->find("maxFrameDt"); mfd != it->end() && mfd->is_number())
            tmp.maxFrameDt = std::clamp(mfd->get<double>(), kMinFrameDt, kMaxFrameDt);
        if (auto rt = it->find("realtime"); rt != it->end() && rt->is_boolean())
            tmp.realtime = rt->get<bool>();
    }

    if (const auto it = j.find("logging"); it != j.end() && it->is_object())
    {
        if (auto l = it->find("level"); l != it->end() && l->is_string())
        {
            const auto level = l->get<std::string>();
            if (IsKnownLogLevel(level))
                tmp.logLevel = level;
            else
                spdlog::warn("Config: unknown logging.level '{}' ignored", level);
        }
        if (auto f = it->find("file"); f != it->end() && f->is_string() && !f->get<std::string>().empty())
            tmp.logFile = f->get<std::string>();
    }

    out = std::move(tmp);
    return true;
}

bool LoadHarnessConfig(HarnessConfig& out, const std::filesystem::path& path) noexcept
{
    std::string text;
    if (!ReadFileToString(path, text))
    {
        // Missing config is normal; don't spam logs.
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            spdlog::warn("Config: failed to read {}", path.string());
        return false;
    }

    if (!ParseHarnessConfig(out, text))
    {
        spdlog::warn("Config: {} is not a valid JSON object; using defaults", path.string());
        return false;
    }

    spdlog::debug("Config: loaded {}", path.string());
    return true;
}

void ApplyEnvironmentOverrides(HarnessConfig& cfg, const EnvLookup& env)
{
    const auto get = [&env](const char* name) -> const char* {
        return env ? env(name) : std::getenv(name);
    };

    // NO_COLOR: presence alone disables colour (https://no-color.org).
    const char* noColor = get("NO_COLOR");
    const bool  ci = EnvTruthy(get("CI")) ||
                     EnvTruthy(get("GITHUB_ACTIONS")) ||
                     EnvTruthy(get("TF_BUILD")) ||
                     EnvTruthy(get("APPVEYOR"));

    if ((noColor != nullptr && noColor[0] != '\0') || ci)
        cfg.colorOutput = false;
}

} // namespace tickspec::core
