/**
 * @file Logger.cpp
 * @brief Implementation of centralized logging system
 */

#include "Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace debris {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;

namespace {

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR:    return "ERROR";
        case LogLevel::WARNING:  return "WARN ";
        case LogLevel::INFO:     return "INFO ";
        case LogLevel::DETAILED: return "DETL ";
        case LogLevel::DEBUG:    return "DEBUG";
        case LogLevel::TRACE:    return "TRACE";
        default:                 return "     ";
    }
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\n\r");
    return text.substr(first, last - first + 1);
}

std::optional<LogLevel> parse_level(const std::string& text) {
    try {
        size_t consumed = 0;
        int level = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<LogLevel>(std::clamp(level, 0, 6));
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

Logger::Logger(const std::string& component_name)
    : component_name_(component_name) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeatsLocked();
    std::cout.flush();
}

void Logger::outputMessage(LogLevel level, const std::string& message) const {
    std::lock_guard<std::mutex> lock(output_mutex_);

    // Single verbosity check using facility-aware effective level
    if (!shouldOutput(level)) {
        return;
    }

    if (has_last_message_ && message == last_message_ && level == last_level_) {
        repeat_count_++;
        return;
    }

    flushRepeatsLocked();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeatsLocked();
    std::cout.flush();

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::flushRepeatsLocked() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " +
                 std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  local_tm.tm_hour, local_tm.tm_min, local_tm.tm_sec,
                  static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << level_tag(level) << " ";
    if (!component_name_.empty()) {
        line << component_name_ << ": ";
    }
    line << message;

    // The single console write
    std::cout << line.str() << std::endl;

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << line.str() << std::endl;
    }
}

// ============================================================================
// Facility-based logging implementation
// ============================================================================

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }

    if (instance_level_.has_value()) {
        return *instance_level_;
    }

    return default_level_;
}

void Logger::setFacilityLevel(const std::string& facility, LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_[facility] = level;
}

void Logger::setDefaultLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    default_level_ = level;
}

LogLevel Logger::getDefaultLevel() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return default_level_;
}

LogLevel Logger::getFacilityLevel(const std::string& facility) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    auto it = facility_levels_.find(facility);
    if (it != facility_levels_.end()) {
        return it->second;
    }
    return default_level_;
}

void Logger::clearFacilityLevels() {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    facility_levels_.clear();
}

bool Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return true;

    bool all_accepted = true;
    std::optional<LogLevel> new_default;
    std::vector<std::pair<std::string, LogLevel>> new_facilities;
    std::stringstream ss(config);
    std::string token;

    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) continue;

        std::string facility = "default";
        std::string level_str = token;

        size_t equals_pos = token.find('=');
        if (equals_pos != std::string::npos) {
            facility = trim(token.substr(0, equals_pos));
            level_str = trim(token.substr(equals_pos + 1));
        }

        auto level = parse_level(level_str);
        if (!level.has_value() || facility.empty()) {
            std::cerr << "Warning: Invalid log level '" << level_str
                      << "' for facility '" << facility << "'" << std::endl;
            all_accepted = false;
            continue;
        }

        if (facility == "default") {
            new_default = *level;
        } else {
            new_facilities.emplace_back(facility, *level);
        }
    }

    // Nothing is applied unless every token parsed
    if (!all_accepted) {
        return false;
    }

    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (new_default) {
        default_level_ = *new_default;
    }
    for (const auto& [facility, level] : new_facilities) {
        facility_levels_[facility] = level;
    }
    return true;
}

bool Logger::setLogFile(const std::optional<std::string>& log_file) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (!log_file.has_value()) {
        return true;
    }

    try {
        std::filesystem::path log_path(*log_file);
        if (log_path.has_parent_path()) {
            std::filesystem::create_directories(log_path.parent_path());
        }

        // Append mode - "append if exists" per CLI help
        file_stream_ = std::make_shared<std::ofstream>(*log_file, std::ios::app);
        if (!file_stream_->is_open()) {
            // Don't log through a Logger here to avoid recursion
            std::cerr << "Warning: Failed to open log file: " << *log_file << std::endl;
            file_stream_.reset();
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Warning: Exception opening log file: " << e.what() << std::endl;
        file_stream_.reset();
        return false;
    }

    return true;
}

} // namespace debris
