// include/trade_journal/core/logger.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include "trade_journal/core/config_base.hpp"

namespace trade_journal {

/**
 * @brief Log levels for different types of messages
 */
enum class LogLevel {
    TRACE,    // Detailed debug information
    DEBUG,    // General debug information
    INFO,     // General information
    WARNING,  // Warnings that don't affect operation
    ERR,      // Errors that affect operation but don't stop the engine
    FATAL     // Critical errors that require shutdown
};

/**
 * @brief Log destination type
 */
enum class LogDestination {
    CONSOLE,  // Standard output
    FILE,     // File output
    BOTH      // Both console and file
};

std::string level_to_string(LogLevel level);
std::string log_destination_to_string(LogDestination dest);

/**
 * @brief Parse a level name as written in configuration files
 * @return Parsed level, or INVALID_ARGUMENT for unknown names
 */
Result<LogLevel> level_from_string(const std::string& name);

/**
 * @brief Configuration for the logger
 */
struct LoggerConfig : public ConfigBase {
    LogLevel min_level{LogLevel::INFO};  // Minimum level to log
    LogDestination destination{LogDestination::CONSOLE};
    std::string log_directory{"logs"};             // Directory for log files
    std::string filename_prefix{"trade_journal"};  // Prefix for log files
    bool include_timestamp{true};                  // Include timestamp in logs
    bool include_level{true};                      // Include log level in logs
    size_t max_file_size{10 * 1024 * 1024};        // Max log file size (10MB)
    size_t max_files{5};                           // Maximum number of log files to keep

    std::string version{"1.0.0"};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Thread-safe logging singleton
 *
 * Each session writes to <prefix>_YYYYMMDD_HHMMSS_partN.log and starts a new
 * part once the current file reaches max_file_size. At most max_files files
 * are kept in the log directory.
 */
class Logger {
public:
    static Logger& instance();

    /**
     * @brief Initialize the logger with configuration
     * @param config Logger configuration
     * @return Error when the log directory or file cannot be opened
     */
    Result<void> initialize(const LoggerConfig& config);

    /**
     * @brief Reset the logger for testing
     */
    static void reset_for_tests();

    /**
     * @brief Log a message with specified level
     * @param level Log level
     * @param message Message to log
     */
    void log(LogLevel level, const std::string& message);

    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.min_level = level;
    }

    LogLevel get_min_level() const {
        return config_.min_level;
    }

    bool is_initialized() const {
        return initialized_.load(std::memory_order_acquire);
    }

    /**
     * @brief Path of the file currently written, empty for console-only logging
     */
    std::filesystem::path current_file() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return current_path_;
    }

    /**
     * @brief Tag subsequent messages from the calling thread with a component name
     */
    static void register_component(const std::string& component) {
        current_component_ = component;
    }

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // All private helpers assume mutex_ is held
    Result<void> open_part_file();
    void enforce_retention(const std::filesystem::path& log_dir) const;
    void write_to_file(const std::string& message);
    std::string format_message(LogLevel level, const std::string& message) const;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::ofstream log_file_;
    std::filesystem::path current_path_;
    std::atomic<bool> initialized_{false};
    static thread_local std::string current_component_;

    std::string session_timestamp_;  // YYYYMMDD_HHMMSS
    int part_number_{1};
};

/**
 * @brief Convenience macro for logging
 * Usage: LOG(LogLevel::INFO, "Message: " << variable)
 */
#define LOG(level, message)                                                        \
    do {                                                                           \
        if (level >= ::trade_journal::Logger::instance().get_min_level()) {        \
            std::ostringstream os;                                                 \
            os << message;                                                         \
            ::trade_journal::Logger::instance().log(level, os.str());              \
        }                                                                          \
    } while (0)

#define TRACE(message) LOG(::trade_journal::LogLevel::TRACE, message)
#define DEBUG(message) LOG(::trade_journal::LogLevel::DEBUG, message)
#define INFO(message) LOG(::trade_journal::LogLevel::INFO, message)
#define WARN(message) LOG(::trade_journal::LogLevel::WARNING, message)
#define ERROR(message) LOG(::trade_journal::LogLevel::ERR, message)
#define FATAL(message) LOG(::trade_journal::LogLevel::FATAL, message)

}  // namespace trade_journal
