//
// Created by Giuseppe Francione on 20/10/25.
//

#ifndef BILLPRESS_CONSOLE_LOG_SINK_HPP
#define BILLPRESS_CONSOLE_LOG_SINK_HPP

#include "../../../libbillpress/include/log_sink.hpp"
#include "../../../libbillpress/include/logger.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Prints messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public billpress::ILogSink {
public:
    billpress::LogLevel log_level = billpress::LogLevel::Error;

    void log(const billpress::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        std::ostream& out = level >= billpress::LogLevel::Warning ? std::cerr : std::cout;
        // the progress bar owns the current line
        out << "\n[" << billpress::Logger::level_to_string(level) << "][" << tag << "] " << message << std::endl;
    }

private:
    std::mutex mtx_;
};

#endif // BILLPRESS_CONSOLE_LOG_SINK_HPP
