/*******************************************************************************
    Project: Volcano Controller Manager

    File: logger.h

    Description:
        Thread-safe, level-filtered logger with millisecond timestamps.

        A Logger is an ordinary object handed to every component through its
        constructor as a std::shared_ptr<Logger>. Components that want their
        lines tagged call with_component() to obtain a sibling logger that
        writes to the same sink under the same mutex.

        Output format:
            [2025-11-27 10:15:30.123] [INFO] [job-controller] message

*******************************************************************************/

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <memory>
#include <mutex>

namespace volcano {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

// Parses "debug", "info", "warning"/"warn", "error" (case-insensitive).
// Returns false and leaves `level` untouched on anything else.
bool parse_log_level(const std::string& text, LogLevel& level);

class Logger {
private:
    // Shared between a logger and every logger derived from it.
    struct Sink {
        std::ostream* out;
        std::mutex mutex;
        LogLevel level;

        Sink(std::ostream* o, LogLevel l) : out(o), level(l) {}
    };

    std::shared_ptr<Sink> sink_;
    std::string component_;

    Logger(std::shared_ptr<Sink> sink, std::string component);

    static std::string get_timestamp();
    static std::string level_to_string(LogLevel level);

public:
    explicit Logger(LogLevel level = LogLevel::INFO, std::ostream& out = std::cout);

    std::shared_ptr<Logger> with_component(const std::string& component) const;

    void set_level(LogLevel level);
    LogLevel level() const;
    const std::string& component() const { return component_; }

    void log(LogLevel level, const std::string& message);

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }
};

} // namespace volcano

#endif // LOGGER_H
