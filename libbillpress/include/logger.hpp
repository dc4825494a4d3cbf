//
// Created by Giuseppe Francione on 12/01/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used by every billpress component.
 */

#ifndef BILLPRESS_LOGGER_HPP
#define BILLPRESS_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace billpress {

/**
 * @brief Static logging facade.
 *
 * Delegates every message to all registered ILogSink implementations.
 * Sinks are owned by the Logger; a caller that installs a temporary sink
 * keeps the raw pointer returned by add_sink() to remove it later.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership.
     * @param sink Unique pointer to a sink implementation.
     * @return Non-owning pointer to the installed sink, usable with remove_sink().
     */
    static ILogSink* add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove (and destroy) a previously installed sink.
     * @param sink Pointer returned by add_sink(). Unknown pointers are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /// Remove all configured sinks.
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "billpress").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "billpress");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name as accepted by --log-level.
     * Case-sensitive; unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING" || level == "WARN")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace billpress

#endif // BILLPRESS_LOGGER_HPP
