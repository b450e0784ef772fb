//
// Created by Giuseppe Francione on 23/01/26.
//

#ifndef TREEDUMP_CONSOLE_LOG_SINK_HPP
#define TREEDUMP_CONSOLE_LOG_SINK_HPP

#include "../../../libtreedump/include/log_sink.hpp"
#include "color.hpp"
#include <iostream>

// Debug and Info go to stdout, Warning and Error to stderr.
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Info;
    bool use_colors = false;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (log_level == LogLevel::None || level < log_level) return;
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << (use_colors ? YELLOW : "") << "[WARN ][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << (use_colors ? RED : "") << "[ERROR][" << tag << "] " << message
                          << (use_colors ? RESET : "") << std::endl;
                break;
            case LogLevel::None:
                break;
        }
    }
};

#endif // TREEDUMP_CONSOLE_LOG_SINK_HPP
