//
// Created by Giuseppe Francione on 16/01/26.
//

/**
 * @file tree_walker.hpp
 * @brief Filtered pre-order walk of a directory tree and its two consumers.
 *
 * render_tree() and collect_files() are both thin visitors over
 * walk_tree(), so the directory listing at the top of the first archive
 * and the list of captured files can never disagree about what exists.
 */

#ifndef TREEDUMP_TREE_WALKER_HPP
#define TREEDUMP_TREE_WALKER_HPP

#include "archive_types.hpp"
#include "path_filter.hpp"
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace treedump {

/// Glyph written before file names in the rendered tree.
inline constexpr const char* TREE_FILE_GLYPH = "\xe2\x94\x9c\xe2\x94\x80\xe2\x94\x80 "; // "├── "
/// Glyph written before directory names in the rendered tree.
inline constexpr const char* TREE_DIR_GLYPH = "\xe2\x94\x94\xe2\x94\x80\xe2\x94\x80 ";  // "└── "

using NodeVisitor = std::function<void(const PathNode&)>;

/**
 * @brief Walks `root` top-down and calls `visit` for every kept node.
 *
 * @details The filter is consulted exactly once per node. A skipped
 * directory is pruned: nothing below it is listed, let alone visited.
 * The root itself is neither filtered nor visited. Entries are visited in
 * the order the filesystem returns them, which is not sorted and differs
 * between platforms. Symbolic links are reported as non-directory nodes
 * and never followed.
 *
 * A subdirectory that cannot be opened or iterated is logged as a
 * warning and the walk continues with its siblings.
 *
 * @throws std::runtime_error if `root` is not an existing directory or
 * cannot be opened.
 */
void walk_tree(const std::filesystem::path& root,
               const PathFilter& filter,
               const NodeVisitor& visit);

/**
 * @brief Renders the kept nodes as text, one line per node:
 * two spaces per depth level, a glyph (file or directory), the name, '\n'.
 */
std::string render_tree(const std::filesystem::path& root, const PathFilter& filter);

/**
 * @brief Absolute paths of every kept non-directory node, in walk order.
 */
std::vector<std::filesystem::path> collect_files(const std::filesystem::path& root,
                                                 const PathFilter& filter);

} // namespace treedump

#endif // TREEDUMP_TREE_WALKER_HPP
