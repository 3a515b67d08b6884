/**
 * @file Logger.hpp
 * @brief Thread-safe logging utility with file rotation
 *
 * Provides structured logging with ISO 8601 timestamps, log levels,
 * component tags, automatic file rotation and an optional line sink.
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace util {

/**
 * @enum LogLevel
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,    ///< Detailed debugging information
    INFO,     ///< General operational information
    WARNING,  ///< Warning conditions
    ERROR     ///< Error conditions
};

/**
 * @struct LogRotationPolicy
 * @brief Configuration for log file rotation
 */
struct LogRotationPolicy {
    size_t max_file_size_bytes = 10 * 1024 * 1024;  ///< Max size before rotation (10MB default)
    int max_files = 7;                               ///< Number of rotated files to keep
};

/**
 * @struct LoggingConfig
 * @brief Where and how the engine logs
 */
struct LoggingConfig {
    std::filesystem::path directory;     ///< Empty disables the file output
    std::string app_name = "file-shredder";
    LogLevel min_level = LogLevel::INFO;
    LogRotationPolicy rotation;
    bool console_output = false;
};

/**
 * @brief Receives every formatted line that passes the level filter
 */
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

/**
 * @class Logger
 * @brief Thread-safe singleton logger with file output and rotation
 *
 * Usage:
 * @code
 * auto& log = util::Logger::instance();
 * log.initialize(config.logging);
 * LOG_INFO("FileShredder", std::format("Shredding {}", path.string()));
 * @endcode
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to the global logger
     */
    static auto instance() -> Logger&;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    /**
     * @brief Initialize the logger from configuration
     * @param config Output directory, application name, level and rotation policy
     * @return true if initialized successfully
     *
     * Log files are named: {app_name}.log
     * Rotated files: {app_name}.1.log, {app_name}.2.log, etc.
     * An empty directory keeps the logger console/sink only.
     */
    auto initialize(const LoggingConfig& config) -> bool;

    [[nodiscard]] auto is_initialized() const -> bool;

    /**
     * @brief Log a message with specified level and component
     * @param level Log level
     * @param component Component/module name (e.g., "FileShredder")
     * @param message Log message
     */
    void log(LogLevel level, std::string_view component, std::string_view message);

    void debug(std::string_view component, std::string_view message);
    void info(std::string_view component, std::string_view message);
    void warning(std::string_view component, std::string_view message);
    void error(std::string_view component, std::string_view message);

    void flush();

    void set_min_level(LogLevel level);
    [[nodiscard]] auto get_min_level() const -> LogLevel;

    /**
     * @brief Enable/disable console output (stderr)
     */
    void set_console_output(bool enable);

    /**
     * @brief Install a sink that receives each formatted line, or clear it with nullptr
     */
    void set_sink(LogSink sink);

    /**
     * @brief Get the current log file path
     * @return Path to the active log file, or empty if no file is open
     */
    [[nodiscard]] auto get_log_file_path() const -> std::filesystem::path;

    /**
     * @brief Shutdown the logger, flushing and closing files
     */
    void shutdown();

private:
    Logger() = default;
    ~Logger();

    /**
     * @brief Get ISO 8601 timestamp string
     * @return Formatted timestamp (e.g., "2026-01-22T14:32:45.123Z")
     */
    [[nodiscard]] static auto get_timestamp() -> std::string;

    [[nodiscard]] static auto level_to_string(LogLevel level) -> std::string_view;

    void check_and_rotate();
    void rotate_logs();
    auto open_log_file() -> bool;

    mutable std::mutex mutex_;
    std::ofstream file_;
    std::filesystem::path log_dir_;
    std::string app_name_ = "file-shredder";
    LogLevel min_level_ = LogLevel::INFO;
    LogRotationPolicy policy_;
    LogSink sink_;
    bool initialized_ = false;
    bool console_output_ = false;
    size_t current_file_size_ = 0;
};

// Convenience macros for component-based logging
#define LOG_DEBUG(component, msg) ::util::Logger::instance().debug(component, msg)
#define LOG_INFO(component, msg) ::util::Logger::instance().info(component, msg)
#define LOG_WARNING(component, msg) ::util::Logger::instance().warning(component, msg)
#define LOG_ERROR(component, msg) ::util::Logger::instance().error(component, msg)

}  // namespace util
