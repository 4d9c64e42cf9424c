/**
 * @file Logger.cpp
 * @brief Implementation of the facility-aware logger
 */

#include "Logger.hpp"
#include <iostream>
#include <filesystem>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <sstream>
#include <algorithm>

namespace hexmosaic {

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

LogLevel level_from_int(int value) {
    // 0 is accepted as "silent": only errors get through
    return static_cast<LogLevel>(std::clamp(value, 1, 6));
}

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR ";
        case LogLevel::WARNING:  return "WARN  ";
        case LogLevel::INFO:     return "";
        case LogLevel::DETAILED: return "";
        case LogLevel::DEBUG:    return "DEBUG ";
        case LogLevel::TRACE:    return "TRACE ";
    }
    return "";
}

} // namespace

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::shared_ptr<std::ofstream> Logger::global_file_stream_;
std::mutex Logger::registry_mutex_;

Logger::Logger() : current_level_(LogLevel::WARNING), component_name_(""),
                   last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : current_level_(LogLevel::WARNING), component_name_(component_name),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(LogLevel level, const std::optional<std::string>& log_file)
    : current_level_(level), component_name_(""), log_file_path_(log_file),
      last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
    if (log_file.has_value()) {
        initializeFileStream();
    }
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (static_cast<int>(level) > static_cast<int>(getEffectiveLevel())) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
    }

    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(output_mutex_);

    log_file_path_ = log_file;

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (log_file.has_value()) {
        initializeFileStream();
    }
}

void Logger::initializeFileStream() {
    if (!log_file_path_.has_value()) {
        return;
    }

    std::error_code ec;
    std::filesystem::path log_path(log_file_path_.value());
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    file_stream_ = std::make_shared<std::ofstream>(log_file_path_.value(), std::ios::app);
    if (!file_stream_->is_open()) {
        // outputMessage would recurse here
        std::cerr << "Warning: Failed to open log file: " << log_file_path_.value() << std::endl;
        file_stream_.reset();
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << level_tag(level);
    if (!component_name_.empty() && static_cast<int>(level) >= static_cast<int>(LogLevel::DEBUG)) {
        line << component_name_ << ": ";
    }
    line << message;

    std::cout << "[" << timestamp << "] " << line.str() << std::endl;

    std::shared_ptr<std::ofstream> target = file_stream_;
    if (!target) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        target = global_file_stream_;
    }
    if (target && target->is_open()) {
        *target << "[" << timestamp << "] " << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }

    std::cout.flush();

    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

// ============================================================================
// Facility registry
// ============================================================================

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }

    return default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = "default";
        std::string level_str = token;
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        try {
            LogLevel level = level_from_int(std::stoi(level_str));
            if (facility == "default") {
                default_level_ = level;
            } else {
                facility_levels_[facility] = level;
            }
        } catch (const std::exception&) {
            std::cerr << "Warning: Invalid log level '" << level_str << "' for facility '" << facility << "'" << std::endl;
        }
    }
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

void Logger::setGlobalLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (global_file_stream_) {
        global_file_stream_->close();
        global_file_stream_.reset();
    }
    if (!log_file.has_value()) {
        return;
    }

    std::error_code ec;
    std::filesystem::path log_path(log_file.value());
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }
    global_file_stream_ = std::make_shared<std::ofstream>(log_file.value(), std::ios::app);
    if (!global_file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << log_file.value() << std::endl;
        global_file_stream_.reset();
    }
}

LogLevel Logger::getEffectiveLevel() const {
    if (!component_name_.empty()) {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (current_level_ != LogLevel::WARNING) {
        return current_level_;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

} // namespace hexmosaic
