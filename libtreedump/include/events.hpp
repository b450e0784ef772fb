//
// Created by Giuseppe Francione on 20/01/26.
//

#ifndef TREEDUMP_EVENTS_HPP
#define TREEDUMP_EVENTS_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace treedump {

/**
 * @brief Events published by CaptureExecutor while files are archived.
 *
 * Plain data carriers; they are published from worker threads, outside
 * the OutputSink lock.
 */

/**
 * @brief Emitted when a worker picks up a file.
 */
struct FileCaptureStartEvent {
    std::filesystem::path path; ///< Absolute path of the file
};

/**
 * @brief Emitted when a file's record was written completely.
 */
struct FileCapturedEvent {
    std::filesystem::path path;             ///< Absolute path of the file
    std::string relative_path;              ///< Path as written in the record
    std::uintmax_t size_bytes = 0;          ///< Content size
    std::filesystem::path archive;          ///< Archive that received the record
    std::chrono::milliseconds duration{0};  ///< Read + write time
};

/**
 * @brief Emitted when a file is left out of the archive.
 */
struct FileCaptureErrorEvent {
    std::filesystem::path path; ///< Absolute path of the file
    std::string error_message;  ///< Error description
};

} // namespace treedump

#endif // TREEDUMP_EVENTS_HPP
