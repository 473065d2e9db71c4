/*******************************************************************************
    Project: Volcano Controller Manager

    File: logger.cpp

    Description:
        Logger implementation. Level filtering happens before the lock is
        taken so suppressed DEBUG lines cost one comparison.
*******************************************************************************/

#include "common/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace volcano {

bool parse_log_level(const std::string& text, LogLevel& level) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARNING;
    } else if (lower == "error") {
        level = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

Logger::Logger(LogLevel level, std::ostream& out)
    : sink_(std::make_shared<Sink>(&out, level)) {
}

Logger::Logger(std::shared_ptr<Sink> sink, std::string component)
    : sink_(std::move(sink)),
      component_(std::move(component)) {
}

std::shared_ptr<Logger> Logger::with_component(const std::string& component) const {
    // Private constructor, so no make_shared.
    return std::shared_ptr<Logger>(new Logger(sink_, component));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    sink_->level = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(sink_->mutex);
    return sink_->level;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < this->level()) return;

    std::stringstream line;
    line << "[" << get_timestamp() << "] "
         << "[" << level_to_string(level) << "] ";
    if (!component_.empty()) {
        line << "[" << component_ << "] ";
    }
    line << message;

    std::lock_guard<std::mutex> lock(sink_->mutex);
    *sink_->out << line.str() << std::endl;
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm;
    localtime_r(&time, &local_tm);

    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

} // namespace volcano
