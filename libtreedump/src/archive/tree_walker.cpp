//
// Created by Giuseppe Francione on 16/01/26.
//

#include "../../include/tree_walker.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace treedump {

namespace {

void walk_directory(const fs::path& dir,
                    const unsigned depth,
                    const PathFilter& filter,
                    const NodeVisitor& visit) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Cannot read directory " + dir.string() + ": " + ec.message(), "walker");
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const fs::directory_entry& entry = *it;

        std::error_code st_ec;
        const auto status = entry.symlink_status(st_ec);
        if (st_ec) {
            Logger::log(LogLevel::Warning, "Cannot stat " + entry.path().string() + ": " + st_ec.message(), "walker");
            continue;
        }

        PathNode node;
        node.absolute_path = entry.path();
        node.name = entry.path().filename().string();
        node.is_directory = fs::is_directory(status);
        node.depth = depth;

        if (filter.decide(node) == FilterDecision::Skip) {
            Logger::log(LogLevel::Debug,
                        std::string(node.is_directory ? "Pruned " : "Skipped ") + node.absolute_path.string(),
                        "walker");
            continue;
        }

        visit(node);

        if (node.is_directory) {
            walk_directory(node.absolute_path, depth + 1, filter, visit);
        }
    }

    if (ec) {
        Logger::log(LogLevel::Warning, "Error while listing " + dir.string() + ": " + ec.message(), "walker");
    }
}

} // namespace

void walk_tree(const fs::path& root, const PathFilter& filter, const NodeVisitor& visit) {
    const fs::path base = normalize_absolute(root);

    std::error_code ec;
    if (!fs::is_directory(base, ec)) {
        throw std::runtime_error("Root is not a directory: " + root.string());
    }
    // open once up front so an unreadable root is fatal rather than a warning
    fs::directory_iterator first(base, ec);
    if (ec) {
        throw std::runtime_error("Cannot read root directory " + root.string() + ": " + ec.message());
    }

    walk_directory(base, 0, filter, visit);
}

std::string render_tree(const fs::path& root, const PathFilter& filter) {
    std::string out;
    walk_tree(root, filter, [&out](const PathNode& node) {
        out.append(2 * static_cast<std::size_t>(node.depth), ' ');
        out += node.is_directory ? TREE_DIR_GLYPH : TREE_FILE_GLYPH;
        out += node.name;
        out += '\n';
    });
    return out;
}

std::vector<fs::path> collect_files(const fs::path& root, const PathFilter& filter) {
    std::vector<fs::path> files;
    walk_tree(root, filter, [&files](const PathNode& node) {
        if (!node.is_directory) {
            files.push_back(node.absolute_path);
        }
    });
    Logger::log(LogLevel::Info,
                "Collected " + std::to_string(files.size()) + " files under " + root.string(),
                "walker");
    return files;
}

} // namespace treedump
