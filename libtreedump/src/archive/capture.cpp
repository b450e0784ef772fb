//
// Created by Giuseppe Francione on 17/01/26.
//

#include "../../include/capture.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace treedump {

namespace {

bool read_all(const fs::path& path, std::vector<char>& out, std::string& error) {
    const unique_FILE in(open_file(path, "rb"));
    if (!in) {
        error = std::strerror(errno);
        return false;
    }
    char buf[64 * 1024];
    for (;;) {
        const size_t n = std::fread(buf, 1, sizeof(buf), in.get());
        out.insert(out.end(), buf, buf + n);
        if (n < sizeof(buf)) break;
    }
    if (std::ferror(in.get())) {
        error = "read error";
        return false;
    }
    return true;
}

} // namespace

std::optional<CapturedFile> capture_file(const fs::path& path, const fs::path& root, std::string* error_out) {
    auto fail = [&](const std::string& reason) -> std::optional<CapturedFile> {
        Logger::log(LogLevel::Error, reason, "capture");
        if (error_out) *error_out = reason;
        return std::nullopt;
    };

    CapturedFile file;

    // checked first: opening a fifo or device for reading could block forever
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) {
        return fail("Error getting file info for " + path.string() + ": " +
                    (ec ? ec.message() : std::string("not a regular file")));
    }

    std::string error;
    if (!read_all(path, file.content, error)) {
        return fail("Error reading file " + path.string() + ": " + error);
    }

    const auto stat_size = fs::file_size(path, ec);
    if (ec) {
        return fail("Error getting file size for " + path.string() + ": " + ec.message());
    }

    const fs::path rel = path.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return fail("Error calculating relative path for " + path.string() + " (root " + root.string() + ")");
    }

    file.name = path.filename().string();
    file.relative_path = rel.string();
    file.size_bytes = file.content.size();
    if (stat_size != file.size_bytes) {
        Logger::log(LogLevel::Warning,
                    path.string() + " changed while reading: stat says " + std::to_string(stat_size) +
                    " bytes, read " + std::to_string(file.size_bytes),
                    "capture");
    }

    Logger::log(LogLevel::Debug, "Captured " + file.relative_path + " (" + std::to_string(file.size_bytes) + " bytes)",
                "capture");
    return file;
}

} // namespace treedump
