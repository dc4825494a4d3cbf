//
// Created by Giuseppe Francione on 12/01/26.
//

#ifndef BILLPRESS_LOG_SINK_HPP
#define BILLPRESS_LOG_SINK_HPP

#include <string_view>

namespace billpress {

/**
 * @brief Severity levels for log messages.
 *
 * Ordered from the most verbose to the most severe, so sinks can filter
 * with a simple comparison against a threshold.
 */
enum class LogLevel {
    Debug,   ///< Per-rung and per-stream diagnostics
    Info,    ///< Normal progress (file started, strategy chosen, archive written)
    Warning, ///< Recoverable problems (fallbacks, skipped images, codec warnings)
    Error    ///< Failures that end up in the report or abort the batch
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, observer bridge).
 * The Logger facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "pdf_processor").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace billpress

#endif // BILLPRESS_LOG_SINK_HPP
