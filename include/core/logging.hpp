#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace bioimage_lab::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/**
 * @brief Settings applied to every logger created after configure()
 *
 * With file logging on, all loggers write to one rotating file
 * logDirectory / logFileName in addition to the console.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string logFileName = "bioimage_lab.log";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/// Parse a configuration string ("trace", "debug", "info", "warning",
/// "error", "critical", "off"), case-insensitive.
[[nodiscard]] std::optional<LogLevel> logLevelFromString(const std::string& text);

[[nodiscard]] std::string toString(LogLevel level);

/**
 * @brief Named spdlog loggers sharing the configured sinks
 */
class LoggerFactory {
public:
    /// Returns the registered logger when one with this name exists
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static void shutdown();

private:
    static spdlog::sink_ptr fileSink();

    static LogConfig config_;
    static bool configured_;
    static spdlog::sink_ptr fileSink_;
};

}  // namespace bioimage_lab::logging
