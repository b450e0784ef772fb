//
// Created by Giuseppe Francione on 12/01/26.
//

/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade shared by the library and the CLI.
 *
 * Every component logs through Logger::log with a short tag; the
 * application decides where messages end up by registering ILogSink
 * implementations at startup.
 */

#ifndef TREEDUMP_LOGGER_HPP
#define TREEDUMP_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Static logging facade for treedump.
 *
 * Workers log concurrently while capturing files, so both sink
 * registration and dispatch are serialized by a single mutex.
 */
class Logger {
public:
    /**
     * @brief Add a new log sink. The Logger takes ownership of the sink.
     * @param sink Unique pointer to a sink implementation; null is ignored.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Component tag (default: "treedump").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "treedump");

    /**
     * @brief Converts a LogLevel to the label used in log lines.
     * @param level The enum value.
     * @return A constant string (e.g. "DEBUG", "WARN").
     */
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
            case LogLevel::None:    return "NONE";
        }
        return "";
    }

    /**
     * @brief Parses a level name as accepted by --log-level.
     *
     * Matching is case-insensitive and accepts both "WARN" and "WARNING".
     * @param level The level name.
     * @return The level, or std::nullopt if the name is unknown.
     */
    static std::optional<LogLevel> string_to_level(std::string_view level);

private:
    ///< List of all registered sink implementations.
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    ///< Protects access to sinks_ and serializes dispatch.
    static std::mutex mtx_;
};

#endif // TREEDUMP_LOGGER_HPP
