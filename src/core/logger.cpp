// src/core/logger.cpp

#include "trade_journal/core/logger.hpp"
#include <algorithm>
#include <vector>
#include "trade_journal/core/time_utils.hpp"

namespace trade_journal {

thread_local std::string Logger::current_component_;

namespace {

std::string local_time_string(const char* format) {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm time_info;
    core::safe_localtime(&now_c, &time_info);

    char time_str[32];
    std::strftime(time_str, sizeof(time_str), format, &time_info);
    return std::string(time_str);
}

}  // namespace

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARNING";
        case LogLevel::ERR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        default:
            return "UNKNOWN";
    }
}

std::string log_destination_to_string(LogDestination dest) {
    switch (dest) {
        case LogDestination::CONSOLE:
            return "CONSOLE";
        case LogDestination::FILE:
            return "FILE";
        case LogDestination::BOTH:
            return "BOTH";
        default:
            return "UNKNOWN";
    }
}

Result<LogLevel> level_from_string(const std::string& name) {
    static const std::pair<const char*, LogLevel> levels[] = {
        {"TRACE", LogLevel::TRACE}, {"DEBUG", LogLevel::DEBUG},   {"INFO", LogLevel::INFO},
        {"WARNING", LogLevel::WARNING}, {"ERROR", LogLevel::ERR}, {"FATAL", LogLevel::FATAL}};
    for (const auto& [label, level] : levels) {
        if (name == label) {
            return Result<LogLevel>(level);
        }
    }
    return make_error<LogLevel>(ErrorCode::INVALID_ARGUMENT, "Unknown log level: " + name,
                                "LoggerConfig");
}

nlohmann::json LoggerConfig::to_json() const {
    nlohmann::json j;
    j["min_level"] = level_to_string(min_level);
    j["destination"] = log_destination_to_string(destination);
    j["log_directory"] = log_directory;
    j["filename_prefix"] = filename_prefix;
    j["include_timestamp"] = include_timestamp;
    j["include_level"] = include_level;
    j["max_file_size"] = max_file_size;
    j["max_files"] = max_files;
    j["version"] = version;
    return j;
}

void LoggerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("min_level")) {
        auto level = level_from_string(j.at("min_level").get<std::string>());
        if (level.is_error()) {
            throw *level.error();
        }
        min_level = level.value();
    }
    if (j.contains("destination")) {
        std::string dest_str = j.at("destination").get<std::string>();
        if (dest_str == "CONSOLE")
            destination = LogDestination::CONSOLE;
        else if (dest_str == "FILE")
            destination = LogDestination::FILE;
        else if (dest_str == "BOTH")
            destination = LogDestination::BOTH;
        else
            throw JournalError(ErrorCode::INVALID_ARGUMENT, "Unknown log destination: " + dest_str,
                               "LoggerConfig");
    }
    if (j.contains("log_directory"))
        log_directory = j.at("log_directory").get<std::string>();
    if (j.contains("filename_prefix"))
        filename_prefix = j.at("filename_prefix").get<std::string>();
    if (j.contains("include_timestamp"))
        include_timestamp = j.at("include_timestamp").get<bool>();
    if (j.contains("include_level"))
        include_level = j.at("include_level").get<bool>();
    if (j.contains("max_file_size"))
        max_file_size = j.at("max_file_size").get<size_t>();
    if (j.contains("max_files"))
        max_files = j.at("max_files").get<size_t>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

Result<void> Logger::initialize(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;

    if (log_file_.is_open()) {
        log_file_.close();
    }
    current_path_.clear();

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        session_timestamp_ = local_time_string("%Y%m%d_%H%M%S");
        part_number_ = 1;

        auto opened = open_part_file();
        if (opened.is_error()) {
            return opened;
        }
    }

    initialized_.store(true, std::memory_order_release);
    return Result<void>();
}

void Logger::reset_for_tests() {
    Logger& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.initialized_ = false;
    if (logger.log_file_.is_open()) {
        logger.log_file_.close();
    }
    logger.current_path_.clear();
    logger.session_timestamp_.clear();
    logger.part_number_ = 1;
    logger.config_ = LoggerConfig();
    current_component_.clear();
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!initialized_.load(std::memory_order_acquire)) {
        std::cerr << "WARNING: Logger not initialized. Message: " << message << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (level < config_.min_level) {
        return;
    }

    const std::string formatted = format_message(level, message);

    if (config_.destination == LogDestination::CONSOLE ||
        config_.destination == LogDestination::BOTH) {
        std::cout << formatted << std::endl;
    }

    if (config_.destination == LogDestination::FILE ||
        config_.destination == LogDestination::BOTH) {
        write_to_file(formatted);
    }
}

std::string Logger::format_message(LogLevel level, const std::string& message) const {
    std::ostringstream ss;

    if (config_.include_timestamp) {
        ss << local_time_string("%Y-%m-%d %H:%M:%S") << " ";
    }
    if (config_.include_level) {
        ss << "[" << level_to_string(level) << "] ";
    }
    if (!current_component_.empty()) {
        ss << "[" << current_component_ << "] ";
    }
    ss << message;
    return ss.str();
}

void Logger::write_to_file(const std::string& message) {
    if (!log_file_.is_open()) {
        return;
    }

    log_file_ << message << std::endl;
    if (log_file_.tellp() >= static_cast<std::streampos>(config_.max_file_size)) {
        log_file_.close();
        ++part_number_;
        auto reopened = open_part_file();
        if (reopened.is_error()) {
            std::cerr << "ERROR: " << reopened.error()->to_string() << std::endl;
        }
    }
}

Result<void> Logger::open_part_file() {
    std::filesystem::path log_dir = std::filesystem::absolute(config_.log_directory);

    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to create log directory: " + log_dir.string() + " - " +
                                    ec.message(),
                                "Logger");
    }

    enforce_retention(log_dir);

    current_path_ = log_dir / (config_.filename_prefix + "_" + session_timestamp_ + "_part" +
                               std::to_string(part_number_) + ".log");
    log_file_.open(current_path_, std::ios::app);
    if (!log_file_.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open log file: " + current_path_.string(), "Logger");
    }
    return Result<void>();
}

void Logger::enforce_retention(const std::filesystem::path& log_dir) const {
    std::vector<std::filesystem::path> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        const auto& path = entry.path();
        if (entry.is_regular_file() && path.extension() == ".log" &&
            path.filename().string().rfind(config_.filename_prefix + "_", 0) == 0) {
            log_files.push_back(path);
        }
    }

    std::sort(log_files.begin(), log_files.end(), [](const auto& a, const auto& b) {
        return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
    });

    // Leave room for the file about to be opened
    while (!log_files.empty() && log_files.size() >= config_.max_files) {
        std::error_code ec;
        std::filesystem::remove(log_files.front(), ec);
        log_files.erase(log_files.begin());
    }
}

}  // namespace trade_journal
