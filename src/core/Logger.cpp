/**
 * @file Logger.cpp
 * @brief Implementation of the facility-based logger
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "Logger.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace pgexport {

std::unordered_map<std::string, LogLevel> Logger::facility_levels_;
LogLevel Logger::default_level_ = LogLevel::INFO;
std::mutex Logger::registry_mutex_;
std::shared_ptr<std::ofstream> Logger::file_stream_;

namespace {

std::string trim_copy(std::string value) {
    value.erase(0, value.find_first_not_of(" \t\n\r"));
    value.erase(value.find_last_not_of(" \t\n\r") + 1);
    return value;
}

LogLevel to_level(int level_int) {
    return static_cast<LogLevel>(std::clamp(level_int, 1, 6));
}

}  // namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DETAILED: return "DETAIL";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
    }
    return "INFO";
}

Logger::Logger()
    : last_level_(LogLevel::INFO), repeat_count_(0), has_last_message_(false) {
}

Logger::Logger(const std::string& component_name)
    : component_name_(component_name), last_level_(LogLevel::INFO),
      repeat_count_(0), has_last_message_(false) {
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeats();
    std::cerr.flush();
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

    flushRepeats();
    doOutput(level, message);

    last_message_ = message;
    last_level_ = level;
    repeat_count_ = 0;
    has_last_message_ = true;
}

void Logger::flushRepeats() const {
    if (has_last_message_ && repeat_count_ > 0) {
        doOutput(last_level_, "The previous message occurred " + std::to_string(repeat_count_ + 1) + " times.");
        repeat_count_ = 0;
    }
}

void Logger::doOutput(LogLevel level, const std::string& message) const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);
    char timestamp[32];
    std::snprintf(timestamp, sizeof(timestamp), "%02d:%02d:%02d.%03d",
                  tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec, static_cast<int>(ms.count()));

    std::ostringstream line;
    line << "[" << timestamp << "] " << log_level_name(level) << " ";
    if (!component_name_.empty() && static_cast<int>(getEffectiveLevel()) >= static_cast<int>(LogLevel::DEBUG)) {
        line << component_name_ << ": ";
    }
    line << message;

    std::cerr << line.str() << std::endl;

    std::shared_ptr<std::ofstream> file;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        file = file_stream_;
    }
    if (file && file->is_open()) {
        *file << line.str() << std::endl;
    }
}

void Logger::flush() const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    flushRepeats();
    std::cerr.flush();

    std::lock_guard<std::mutex> registry_lock(registry_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

LogLevel Logger::getEffectiveLevel() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (!component_name_.empty()) {
        auto it = facility_levels_.find(component_name_);
        if (it != facility_levels_.end()) {
            return it->second;
        }
    }
    return default_level_;
}

// ============================================================================
// Process-wide configuration
// ============================================================================

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
    return it != facility_levels_.end() ? it->second : default_level_;
}

void Logger::parseLogConfig(const std::string& config) {
    if (config.empty()) return;

    std::lock_guard<std::mutex> lock(registry_mutex_);

    std::stringstream ss(config);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim_copy(token);
        if (token.empty()) continue;

        size_t equals_pos = token.find('=');
        std::string facility = equals_pos == std::string::npos ? "default" : trim_copy(token.substr(0, equals_pos));
        std::string level_str = equals_pos == std::string::npos ? token : trim_copy(token.substr(equals_pos + 1));

        try {
            LogLevel level = to_level(std::stoi(level_str));
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

bool Logger::setLogFile(const std::optional<std::string>& path) {
    std::lock_guard<std::mutex> lock(registry_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
    if (!path.has_value()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::path log_path(path.value());
    if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    auto stream = std::make_shared<std::ofstream>(path.value(), std::ios::app);
    if (!stream->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << path.value() << std::endl;
        return false;
    }
    file_stream_ = std::move(stream);
    return true;
}

}  // namespace pgexport
