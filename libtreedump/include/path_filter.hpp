//
// Created by Giuseppe Francione on 15/01/26.
//

/**
 * @file path_filter.hpp
 * @brief Skip/keep decision shared by tree rendering and file collection.
 */

#ifndef TREEDUMP_PATH_FILTER_HPP
#define TREEDUMP_PATH_FILTER_HPP

#include "archive_types.hpp"
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace treedump {

/**
 * @brief The skip rules of one run. Built once from configuration, then immutable.
 */
struct FilterRules {
    bool skip_hidden = true;                       ///< Skip names starting with '.'
    std::set<std::string> skip_extensions;         ///< Extensions including the dot, e.g. ".log"
    std::set<std::string> skip_dir_names;          ///< Directory names pruned wherever they appear
    std::set<std::filesystem::path> skip_paths;    ///< Absolute, normalised paths always skipped (directories pruned)

    /**
     * @brief Builds rules from raw, user-supplied lists.
     *
     * Entries are trimmed and empty ones dropped; extensions get a leading
     * '.' if they lack one ("log" -> ".log").
     */
    static FilterRules from_lists(const std::vector<std::string>& extensions,
                                  const std::vector<std::string>& dir_names,
                                  bool skip_hidden);
};

enum class FilterDecision {
    Keep,
    Skip ///< For a directory this means: prune the whole subtree
};

/**
 * @brief Pure predicate over a node's name and kind.
 *
 * @details Precedence: hidden names first, then skipped directory names,
 * then skipped file extensions. The extension of a name is its suffix
 * starting at the last '.', so ".bashrc" has extension ".bashrc" and
 * "Makefile" has none. Comparisons are case-sensitive.
 */
class PathFilter {
public:
    explicit PathFilter(FilterRules rules);

    /**
     * @brief Decides whether a node with this name is kept.
     * @param name Last path component.
     * @param is_directory Whether the node is a directory.
     */
    [[nodiscard]] FilterDecision decide(std::string_view name, bool is_directory) const;

    /**
     * @brief Same as decide(name, is_directory), but first skips any node
     * whose absolute path is listed in FilterRules::skip_paths.
     */
    [[nodiscard]] FilterDecision decide(const PathNode& node) const;

    [[nodiscard]] const FilterRules& rules() const { return rules_; }

    /**
     * @brief Extension of a file name as used by the filter, or "" if none.
     */
    static std::string_view extension_of(std::string_view name);

private:
    FilterRules rules_;
};

} // namespace treedump

#endif // TREEDUMP_PATH_FILTER_HPP
