#pragma once
#ifndef LOGGER_H
#define LOGGER_H

#include <optional>
#include <ostream>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

/**
 * Process-wide line logger.
 * Each line looks like "[2024-05-01 12:00:00] INFO  message" and goes to
 * std::cerr unless another sink is installed. Lines below the minimum level
 * are dropped.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    /**
     * Redirect output, e.g. to a std::ostringstream in tests.
     * @param sink Stream to write to, nullptr restores std::cerr
     */
    void set_sink(std::ostream* sink) { sink_ = sink; }

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    std::ostream* sink_ = nullptr;
};

const char* to_string(LogLevel level);

/**
 * Parse "debug", "info", "warn"/"warning" or "error" (any case).
 */
std::optional<LogLevel> parse_log_level(const std::string& text);

inline void log_debug(const std::string& message) { Logger::instance().log(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { Logger::instance().log(LogLevel::Info, message); }
inline void log_warn(const std::string& message) { Logger::instance().log(LogLevel::Warn, message); }
inline void log_error(const std::string& message) { Logger::instance().log(LogLevel::Error, message); }

#endif // LOGGER_H
