//
// Created by Giuseppe Francione on 26/01/26.
//

#include "temp_dir.hpp"
#include "../libtreedump/include/capture.hpp"
#include "../libtreedump/include/file_utils.hpp"
#include <string>

using namespace treedump;
namespace fs = std::filesystem;

class CaptureTest : public TempDirTest {
protected:
    fs::path root() const { return normalize_absolute(dir_); }
};

TEST_F(CaptureTest, ReadsContentNameAndSize) {
    const auto path = write_file("src/main.cpp", "int main() { return 0; }\n");

    std::string error;
    const auto captured = capture_file(normalize_absolute(path), root(), &error);
    ASSERT_TRUE(captured.has_value()) << error;
    EXPECT_EQ(captured->name, "main.cpp");
    EXPECT_EQ(captured->relative_path, (fs::path("src") / "main.cpp").string());
    EXPECT_EQ(captured->size_bytes, 25u);
    EXPECT_EQ(std::string(captured->content.begin(), captured->content.end()), "int main() { return 0; }\n");
    EXPECT_TRUE(error.empty());
}

TEST_F(CaptureTest, BinaryContentIsUnmodified) {
    const std::string bytes("\x00\x01\xff\r\n\x00", 6);
    const auto path = write_file("blob.bin", bytes);

    const auto captured = capture_file(normalize_absolute(path), root());
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->size_bytes, 6u);
    EXPECT_EQ(std::string(captured->content.begin(), captured->content.end()), bytes);
}

TEST_F(CaptureTest, EmptyFile) {
    const auto path = write_file("empty.txt", "");
    const auto captured = capture_file(normalize_absolute(path), root());
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->size_bytes, 0u);
    EXPECT_TRUE(captured->content.empty());
}

TEST_F(CaptureTest, LargeFileSpanningSeveralReads) {
    const std::string big(200 * 1024 + 7, 'z');
    const auto path = write_file("big.dat", big);
    const auto captured = capture_file(normalize_absolute(path), root());
    ASSERT_TRUE(captured.has_value());
    EXPECT_EQ(captured->size_bytes, big.size());
    EXPECT_EQ(captured->content.size(), big.size());
}

TEST_F(CaptureTest, MissingFileFails) {
    std::string error;
    const auto captured = capture_file(normalize_absolute(dir_ / "gone.txt"), root(), &error);
    EXPECT_FALSE(captured.has_value());
    EXPECT_NE(error.find("gone.txt"), std::string::npos);
}

TEST_F(CaptureTest, DirectoryFails) {
    const auto sub = make_dir("sub");
    std::string error;
    EXPECT_FALSE(capture_file(normalize_absolute(sub), root(), &error).has_value());
    EXPECT_FALSE(error.empty());
}

TEST_F(CaptureTest, FileOutsideRootFails) {
    const auto inner = make_dir("inner");
    const auto outside = write_file("outside.txt", "x");
    std::string error;
    EXPECT_FALSE(capture_file(normalize_absolute(outside), normalize_absolute(inner), &error).has_value());
    EXPECT_NE(error.find("relative path"), std::string::npos);
}
