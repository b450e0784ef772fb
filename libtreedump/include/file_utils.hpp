//
// Created by Giuseppe Francione on 14/01/26.
//

#ifndef TREEDUMP_FILE_UTILS_HPP
#define TREEDUMP_FILE_UTILS_HPP

#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace treedump {

    struct FileCloser {
        void operator()(FILE* f) const { if (f) std::fclose(f); }
    };

    using unique_FILE = std::unique_ptr<FILE, FileCloser>;

    /**
     * @brief Opens a file using a filesystem path, handling Windows Unicode correctly.
     * @param path The path to the file.
     * @param mode The standard C fopen mode string (e.g., "rb", "wb").
     * @return FILE* pointer or nullptr if open failed.
     */
    FILE *open_file(const std::filesystem::path &path, const char *mode);

    /**
     * @brief Creates a directory (and its parents) if it does not exist yet.
     * @param dir The directory to create.
     * @param tag The logger tag used for the debug/error message.
     * @throws std::runtime_error if the directory cannot be created or the
     * path exists and is not a directory.
     */
    void ensure_directory(const std::filesystem::path &dir,
                          std::string_view tag = "file_utils");

    /**
     * @brief Builds the name of the index-th archive file: "output_007.txt".
     */
    std::string archive_file_name(unsigned index);

    /**
     * @brief Absolute, lexically normal form of a path without a trailing separator.
     *
     * This is the form used for PathNode::absolute_path and
     * FilterRules::skip_paths, so the two can be compared directly.
     */
    std::filesystem::path normalize_absolute(const std::filesystem::path &path);

} // namespace treedump

#endif // TREEDUMP_FILE_UTILS_HPP
