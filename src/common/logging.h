#pragma once

/// @file logging.h
/// @brief tracekeep logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace tracekeep {

/// Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

struct LogConfig {
    std::string name = "tracekeep";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Console output goes to stderr so tools can keep stdout for their results
    bool console_to_stderr = false;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "tracekeep.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// Initialize the global logger once; later calls are ignored
void InitLogging(const LogConfig& config = {});

std::shared_ptr<spdlog::logger> GetLogger();

/// Set the level of the logger and all of its sinks
void SetLogLevel(LogLevel level);

/// Unknown names map to kInfo
LogLevel ParseLogLevel(std::string_view name);

void FlushLogs();

void ShutdownLogging();

#define TRACEKEEP_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::tracekeep::GetLogger(), __VA_ARGS__)
#define TRACEKEEP_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::tracekeep::GetLogger(), __VA_ARGS__)
#define TRACEKEEP_LOG_INFO(...) SPDLOG_LOGGER_INFO(::tracekeep::GetLogger(), __VA_ARGS__)
#define TRACEKEEP_LOG_WARN(...) SPDLOG_LOGGER_WARN(::tracekeep::GetLogger(), __VA_ARGS__)
#define TRACEKEEP_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::tracekeep::GetLogger(), __VA_ARGS__)
#define TRACEKEEP_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::tracekeep::GetLogger(), __VA_ARGS__)

}  // namespace tracekeep
