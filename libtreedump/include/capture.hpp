//
// Created by Giuseppe Francione on 17/01/26.
//

#ifndef TREEDUMP_CAPTURE_HPP
#define TREEDUMP_CAPTURE_HPP

#include "archive_types.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace treedump {

/**
 * @brief Reads one file into a CapturedFile.
 *
 * Reads the whole content, stats the file and computes its path relative
 * to `root`. Each step can fail on its own; failures are logged with the
 * offending path and yield std::nullopt, never an exception.
 *
 * If the size reported by stat differs from the number of bytes read (the
 * file changed underneath us), a warning is logged and the number of
 * bytes read wins, so the "Size:" line always matches the content.
 *
 * @param path Absolute path of the file.
 * @param root Root of the walk, absolute and normalised.
 * @param error_out If not null, receives a one-line reason on failure.
 */
std::optional<CapturedFile> capture_file(const std::filesystem::path& path,
                                         const std::filesystem::path& root,
                                         std::string* error_out = nullptr);

} // namespace treedump

#endif // TREEDUMP_CAPTURE_HPP
