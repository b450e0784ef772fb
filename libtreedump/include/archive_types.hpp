//
// Created by Giuseppe Francione on 15/01/26.
//

#ifndef TREEDUMP_ARCHIVE_TYPES_HPP
#define TREEDUMP_ARCHIVE_TYPES_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace treedump {

/**
 * @brief One entry produced by the tree walk. Not retained after the visit.
 */
struct PathNode {
    std::filesystem::path absolute_path; ///< Absolute path of the entry
    std::string name;                    ///< Last path component
    bool is_directory = false;           ///< True for real directories (symlinks are never directories)
    unsigned depth = 0;                  ///< 0 for direct children of the root
};

/**
 * @brief A file read into memory, ready to be written as one archive record.
 */
struct CapturedFile {
    std::string name;                ///< File name shown in the "File:" line
    std::string relative_path;       ///< Path relative to the root, shown in the "Path:" line
    std::uintmax_t size_bytes = 0;   ///< Always equal to content.size()
    std::vector<char> content;       ///< Raw bytes, written unmodified
};

} // namespace treedump

#endif // TREEDUMP_ARCHIVE_TYPES_HPP
