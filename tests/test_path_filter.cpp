//
// Created by Giuseppe Francione on 26/01/26.
//

#include <gtest/gtest.h>
#include "../libtreedump/include/path_filter.hpp"
#include "../libtreedump/include/file_utils.hpp"
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace treedump;

namespace {

PathFilter make_filter(const std::vector<std::string>& exts,
                       const std::vector<std::string>& dirs,
                       const bool skip_hidden = true) {
    return PathFilter(FilterRules::from_lists(exts, dirs, skip_hidden));
}

} // namespace

TEST(PathFilter, HiddenNamesSkippedWhenEnabled) {
    const auto filter = make_filter({}, {});
    EXPECT_EQ(filter.decide(".git", true), FilterDecision::Skip);
    EXPECT_EQ(filter.decide(".env", false), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("src", true), FilterDecision::Keep);
    EXPECT_EQ(filter.decide("main.cpp", false), FilterDecision::Keep);
}

TEST(PathFilter, HiddenNamesKeptWhenDisabled) {
    const auto filter = make_filter({}, {}, false);
    EXPECT_EQ(filter.decide(".git", true), FilterDecision::Keep);
    EXPECT_EQ(filter.decide(".env", false), FilterDecision::Keep);
}

TEST(PathFilter, DirectoryNamesOnlyMatchDirectories) {
    const auto filter = make_filter({}, {"node_modules", "build"});
    EXPECT_EQ(filter.decide("node_modules", true), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("build", true), FilterDecision::Skip);
    // a file that happens to share the name is kept
    EXPECT_EQ(filter.decide("build", false), FilterDecision::Keep);
    EXPECT_EQ(filter.decide("builds", true), FilterDecision::Keep);
}

TEST(PathFilter, ExtensionsOnlyMatchFiles) {
    const auto filter = make_filter({".log", ".tmp"}, {});
    EXPECT_EQ(filter.decide("app.log", false), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("x.tmp", false), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("app.log", true), FilterDecision::Keep);
    EXPECT_EQ(filter.decide("app.txt", false), FilterDecision::Keep);
}

TEST(PathFilter, ExtensionIsSuffixFromLastDot) {
    EXPECT_EQ(PathFilter::extension_of("archive.tar.gz"), ".gz");
    EXPECT_EQ(PathFilter::extension_of("Makefile"), "");
    EXPECT_EQ(PathFilter::extension_of(".bashrc"), ".bashrc");
    EXPECT_EQ(PathFilter::extension_of("trailing."), ".");

    const auto filter = make_filter({".gz"}, {}, false);
    EXPECT_EQ(filter.decide("archive.tar.gz", false), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("archive.tar", false), FilterDecision::Keep);
}

TEST(PathFilter, ComparisonIsCaseSensitive) {
    const auto filter = make_filter({".LOG"}, {"Vendor"});
    EXPECT_EQ(filter.decide("a.log", false), FilterDecision::Keep);
    EXPECT_EQ(filter.decide("a.LOG", false), FilterDecision::Skip);
    EXPECT_EQ(filter.decide("vendor", true), FilterDecision::Keep);
}

TEST(PathFilter, FromListsNormalisesEntries) {
    const auto rules = FilterRules::from_lists({"log", " .tmp ", "", "  "}, {" vendor", "", "dist "}, false);
    EXPECT_FALSE(rules.skip_hidden);
    EXPECT_EQ(rules.skip_extensions, (std::set<std::string>{".log", ".tmp"}));
    EXPECT_EQ(rules.skip_dir_names, (std::set<std::string>{"vendor", "dist"}));
    EXPECT_TRUE(rules.skip_paths.empty());
}

TEST(PathFilter, EmptyRulesKeepEverything) {
    const auto filter = make_filter({}, {}, false);
    EXPECT_TRUE(filter.rules().skip_extensions.empty());
    EXPECT_EQ(filter.decide("anything.log", false), FilterDecision::Keep);
    EXPECT_EQ(filter.decide("node_modules", true), FilterDecision::Keep);
}

TEST(PathFilter, SkipPathsMatchExactPaths) {
    auto rules = FilterRules::from_lists({}, {}, true);
    const auto out_dir = normalize_absolute("/tmp/project/output");
    rules.skip_paths.insert(out_dir);
    const PathFilter filter(std::move(rules));

    PathNode output{out_dir, "output", true, 0};
    EXPECT_EQ(filter.decide(output), FilterDecision::Skip);

    PathNode nested{normalize_absolute("/tmp/project/src/output"), "output", true, 1};
    EXPECT_EQ(filter.decide(nested), FilterDecision::Keep);

    PathNode same_path_file{out_dir, "output", false, 0};
    EXPECT_EQ(filter.decide(same_path_file), FilterDecision::Skip);
}

TEST(PathFilter, SkipPathsExcludeSingleFile) {
    auto rules = FilterRules::from_lists({}, {}, true);
    rules.skip_paths.insert(normalize_absolute("/tmp/project/run.log"));
    const PathFilter filter(std::move(rules));

    PathNode log{normalize_absolute("/tmp/project/run.log"), "run.log", false, 0};
    PathNode other{normalize_absolute("/tmp/project/app.log"), "app.log", false, 0};
    EXPECT_EQ(filter.decide(log), FilterDecision::Skip);
    EXPECT_EQ(filter.decide(other), FilterDecision::Keep);
}

TEST(PathFilter, NodeDecisionFallsBackToNameRules) {
    const auto filter = make_filter({".o"}, {"obj"});
    PathNode dir{normalize_absolute("/r/obj"), "obj", true, 0};
    PathNode file{normalize_absolute("/r/main.o"), "main.o", false, 0};
    PathNode hidden{normalize_absolute("/r/.cache"), ".cache", true, 0};
    EXPECT_EQ(filter.decide(dir), FilterDecision::Skip);
    EXPECT_EQ(filter.decide(file), FilterDecision::Skip);
    EXPECT_EQ(filter.decide(hidden), FilterDecision::Skip);
}
