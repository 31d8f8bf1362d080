// src/core/Log.cpp
#include "tickspec/core/Log.hpp"

#include <array>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace tickspec::core {

namespace {

constexpr std::array<std::string_view, 7> kLevelNames = {
    "trace", "debug", "info", "warning", "error", "critical", "off",
};

// Common default logger configuration.
void configure_default_logger(const std::shared_ptr<spdlog::logger>& logger, spdlog::level::level_enum level) {
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

// Forwards what a startup logger buffered to the sinks of `logger`.
void replay_startup_messages(const std::shared_ptr<spdlog::logger>& previous,
                             const std::shared_ptr<spdlog::logger>& logger) {
    if (!previous || previous == logger) {
        return;
    }
    for (const auto& sink : previous->sinks()) {
        const auto ring = std::dynamic_pointer_cast<spdlog::sinks::ringbuffer_sink_mt>(sink);
        if (!ring) {
            continue;
        }
        for (const auto& msg : ring->last_raw()) {
            if (!logger->should_log(msg.level)) {
                continue;
            }
            for (const auto& target : logger->sinks()) {
                if (target->should_log(msg.level)) {
                    target->log(msg);
                }
            }
        }
    }
    logger->flush();
}

} // namespace

std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> BeginStartupLogging(std::size_t capacity) {
    auto ring = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(capacity);
    auto logger = std::make_shared<spdlog::logger>("tickspec", ring);
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    return ring;
}

bool IsKnownLogLevel(std::string_view level) noexcept {
    if (level == "warn" || level == "err") {
        return true;
    }
    for (const auto name : kLevelNames) {
        if (name == level) {
            return true;
        }
    }
    return false;
}

std::shared_ptr<spdlog::logger> InitLogging(const fs::path& logFile, std::string_view level) {
    const auto lvl = IsKnownLogLevel(level)
        ? spdlog::level::from_str(std::string(level))
        : spdlog::level::info;

    std::error_code ec;
    if (logFile.has_parent_path()) {
        fs::create_directories(logFile.parent_path(), ec);
    }

    const auto previous = spdlog::default_logger();

    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), true);
        logger = std::make_shared<spdlog::logger>("tickspec", std::move(sink));
    } catch (const spdlog::spdlog_ex& ex) {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        logger = std::make_shared<spdlog::logger>("tickspec", std::move(sink));
        configure_default_logger(logger, lvl);
        replay_startup_messages(previous, logger);
        spdlog::warn("Cannot open log file {} ({}); logging to stderr.", logFile.string(), ex.what());
        return logger;
    }

    configure_default_logger(logger, lvl);
    replay_startup_messages(previous, logger);
    if (!IsKnownLogLevel(level)) {
        spdlog::warn("Unknown log level '{}', using info.", level);
    }
    spdlog::info("Logging started");
    return logger;
}

void ShutdownLogging() {
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::shutdown();
}

} // namespace tickspec::core
