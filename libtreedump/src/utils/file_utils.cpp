//
// Created by Giuseppe Francione on 14/01/26.
//

#include <filesystem>
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace treedump {

    FILE* open_file(const std::filesystem::path& path, const char* mode) {
#ifdef _WIN32
        // On Windows, convert mode to wstring and use _wfopen, which accepts
        // wide-char paths (UTF-16), supporting Unicode and long paths.
        std::wstring wmode;
        for (const char* p = mode; *p; ++p) wmode += static_cast<wchar_t>(*p);

        std::error_code ec;
        auto abs_path = std::filesystem::absolute(path, ec);
        if (ec) {
            return _wfopen(path.wstring().c_str(), wmode.c_str());
        }

        // prepend the magic prefix to bypass MAX_PATH
        std::wstring long_path = L"\\\\?\\" + abs_path.wstring();
        return _wfopen(long_path.c_str(), wmode.c_str());
#else
        return std::fopen(path.string().c_str(), mode);
#endif
    }

    void ensure_directory(const std::filesystem::path& dir, const std::string_view tag) {
        std::error_code ec;
        if (std::filesystem::is_directory(dir, ec)) {
            return;
        }
        if (std::filesystem::exists(dir, ec)) {
            Logger::log(LogLevel::Error, "Not a directory: " + dir.string(), tag);
            throw std::runtime_error("Output path exists and is not a directory: " + dir.string());
        }
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error,
                "Failed to create directory: " + dir.string() + " (" + ec.message() + ")",
                tag);
            throw std::runtime_error("Failed to create output directory: " + dir.string());
        }
        Logger::log(LogLevel::Debug, "Created directory: " + dir.string(), tag);
    }

    std::string archive_file_name(const unsigned index) {
        std::ostringstream name;
        name << "output_" << std::setw(3) << std::setfill('0') << index << ".txt";
        return name.str();
    }

    std::filesystem::path normalize_absolute(const std::filesystem::path& path) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(path, ec);
        if (ec) abs = path;
        abs = abs.lexically_normal();
        if (!abs.has_filename() && abs.has_relative_path()) {
            abs = abs.parent_path();
        }
        return abs;
    }

} // namespace treedump
