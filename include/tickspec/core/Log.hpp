// include/tickspec/core/Log.hpp
#pragma once
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

namespace tickspec::core {

// Installs a "tickspec" default logger that keeps messages in memory until
// InitLogging runs; InitLogging replays them into the new logger at its level.
// Used while the config that names the log file is still being read.
std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> BeginStartupLogging(std::size_t capacity = 128);

// Creates the "tickspec" file logger and makes it spdlog's default logger.
// Falls back to a stderr logger when the log file cannot be opened.
// `level` is an spdlog level name ("trace", "debug", "info", ...).
std::shared_ptr<spdlog::logger> InitLogging(const std::filesystem::path& logFile, std::string_view level);

// Flushes and drops all registered loggers.
void ShutdownLogging();

// True if `level` names an spdlog level.
[[nodiscard]] bool IsKnownLogLevel(std::string_view level) noexcept;

} // namespace tickspec::core
