//
// Created by Giuseppe Francione on 26/01/26.
//

#ifndef TREEDUMP_TESTS_TEMP_DIR_HPP
#define TREEDUMP_TESTS_TEMP_DIR_HPP

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <process.h>
#define getpid _getpid
#else
#include <unistd.h>
#endif

// Fixture owning a fresh directory under the system temp dir, removed after each test.
class TempDirTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("treedump_") + info->test_suite_name() + "_" + info->name() + "_" +
                std::to_string(getpid()));
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write_file(const std::filesystem::path& rel, const std::string& content) const {
        const auto path = dir_ / rel;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::filesystem::path make_dir(const std::filesystem::path& rel) const {
        const auto path = dir_ / rel;
        std::filesystem::create_directories(path);
        return path;
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

#endif // TREEDUMP_TESTS_TEMP_DIR_HPP
