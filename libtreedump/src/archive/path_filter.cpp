//
// Created by Giuseppe Francione on 15/01/26.
//

#include "../../include/path_filter.hpp"
#include <utility>

namespace treedump {

namespace {
std::string trim(const std::string_view s) {
    constexpr std::string_view ws = " \t\r\n";
    const auto start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return {};
    const auto end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}
} // namespace

FilterRules FilterRules::from_lists(const std::vector<std::string>& extensions,
                                    const std::vector<std::string>& dir_names,
                                    const bool skip_hidden) {
    FilterRules rules;
    rules.skip_hidden = skip_hidden;
    for (const auto& raw : extensions) {
        auto ext = trim(raw);
        if (ext.empty()) continue;
        if (!ext.starts_with('.')) ext.insert(ext.begin(), '.');
        rules.skip_extensions.insert(std::move(ext));
    }
    for (const auto& raw : dir_names) {
        auto dir = trim(raw);
        if (!dir.empty()) rules.skip_dir_names.insert(std::move(dir));
    }
    return rules;
}

PathFilter::PathFilter(FilterRules rules) : rules_(std::move(rules)) {}

std::string_view PathFilter::extension_of(const std::string_view name) {
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos) return {};
    return name.substr(dot);
}

FilterDecision PathFilter::decide(const std::string_view name, const bool is_directory) const {
    if (rules_.skip_hidden && name.starts_with('.')) {
        return FilterDecision::Skip;
    }
    if (is_directory) {
        if (rules_.skip_dir_names.contains(std::string(name))) {
            return FilterDecision::Skip;
        }
        return FilterDecision::Keep;
    }
    const auto ext = extension_of(name);
    if (!ext.empty() && rules_.skip_extensions.contains(std::string(ext))) {
        return FilterDecision::Skip;
    }
    return FilterDecision::Keep;
}

FilterDecision PathFilter::decide(const PathNode& node) const {
    if (!rules_.skip_paths.empty() &&
        rules_.skip_paths.contains(node.absolute_path.lexically_normal())) {
        return FilterDecision::Skip;
    }
    return decide(node.name, node.is_directory);
}

} // namespace treedump
