//
// Created by Giuseppe Francione on 12/01/26.
//

#ifndef TREEDUMP_LOG_SINK_HPP
#define TREEDUMP_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages, in increasing order.
 *
 * Sinks compare levels with the usual relational operators to implement
 * a threshold; None is only meaningful as a threshold and silences a sink.
 */
enum class LogLevel {
    Debug,   ///< Per-file progress, rotation decisions, queue activity
    Info,    ///< Run milestones (tree written, files collected, run finished)
    Warning, ///< A file was skipped or a subtree could not be read
    Error,   ///< A file could not be archived, or a fatal startup problem
    None     ///< Threshold only: log nothing
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations define where messages go (console or file).
 * Logger fans every message out to all registered sinks; a sink decides
 * for itself whether a message passes its threshold.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message (e.g. "capture", "sink").
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // TREEDUMP_LOG_SINK_HPP
