//
// Created by Giuseppe Francione on 24/01/26.
//

#include "report_generator.hpp"
#include "../utils/color.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <system_error>

#ifdef _WIN32

#include <windows.h>
#include <io.h>      // _isatty, _fileno
#define isatty _isatty
#define fileno _fileno

#else

#include <sys/ioctl.h>
#include <unistd.h>

#endif

static bool is_stderr_a_tty() {
    return isatty(fileno(stderr)) != 0;
}

unsigned get_terminal_width() {
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_ERROR_HANDLE), &csbi))
        return csbi.srWindow.Right - csbi.srWindow.Left + 1;
    return 80;
#else
    winsize w{};
    if (ioctl(STDERR_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0)
        return w.ws_col;
    return 80;
#endif
}

std::string csv_escape(const std::string& data) {
    if (data.find_first_of(",\"\n\r") == std::string::npos) {
        return data;
    }
    std::string result;
    result.reserve(data.size() + 4);
    result.push_back('"');
    for (char c : data) {
        if (c == '"') {
            result.push_back('"'); // escape quote with another quote
        }
        result.push_back(c);
    }
    result.push_back('"');
    return result;
}

void print_console_report(const std::vector<Result>& results,
                          const std::vector<std::filesystem::path>& archives,
                          const unsigned num_threads,
                          const double total_seconds) {
    const bool use_colors = is_stderr_a_tty();

    struct ArchiveSummary {
        size_t records = 0;
        uintmax_t content_bytes = 0;
    };
    std::map<std::filesystem::path, ArchiveSummary> per_archive;
    for (const auto& a : archives) {
        per_archive[a];
    }

    size_t captured = 0;
    uintmax_t total_bytes = 0;
    std::vector<const Result*> failures;
    for (const auto& r : results) {
        if (r.success) {
            ++captured;
            total_bytes += r.size;
            auto& s = per_archive[r.archive];
            ++s.records;
            s.content_bytes += r.size;
        } else {
            failures.push_back(&r);
        }
    }

    size_t max_name = 10;
    for (const auto& [path, summary] : per_archive) {
        max_name = std::max(max_name, path.filename().string().size() + 2);
    }

    std::cerr << "\n"
              << std::left << std::setw(static_cast<int>(max_name)) << "Archive"
              << std::setw(10) << "Records"
              << std::setw(14) << "Content(KB)"
              << std::setw(14) << "On disk(KB)"
              << "\n";
    for (const auto& [path, summary] : per_archive) {
        std::error_code ec;
        const auto on_disk = std::filesystem::file_size(path, ec);
        std::cerr << std::left << std::setw(static_cast<int>(max_name)) << path.filename().string()
                  << std::setw(10) << summary.records
                  << std::setw(14) << (summary.content_bytes / 1024)
                  << std::setw(14) << (ec ? std::string("-") : std::to_string(on_disk / 1024))
                  << "\n";
    }

    if (!failures.empty()) {
        std::ranges::sort(failures, [](const Result* a, const Result* b) {
            return a->path < b->path;
        });
        std::cerr << "\n" << (use_colors ? RED : "") << "=== Not archived ===" << (use_colors ? RESET : "")
                  << "\n";
        const unsigned term_width = get_terminal_width();
        for (const auto* r : failures) {
            std::string line = r->path.string() + ": " + r->error_msg;
            if (line.size() > term_width && term_width > 3) {
                line = line.substr(0, term_width - 3) + "...";
            }
            std::cerr << line << "\n";
        }
    }

    std::cerr << "\nFiles archived: " << captured << " of " << results.size()
              << " (" << (total_bytes / 1024) << " KB in " << archives.size() << " archive"
              << (archives.size() == 1 ? "" : "s") << ")\n";
    std::cerr << "Total time: " << std::fixed << std::setprecision(2)
              << total_seconds << " s (" << num_threads << " thread"
              << (num_threads > 1U ? "s" : "") << ")\n";
}

bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       const double total_seconds) {
    std::ofstream out(output_path);
    if (!out) return false;

    out << "Path,Size (bytes),Archive,Status,Time(s),Error\n";

    auto sorted = results;
    std::ranges::sort(sorted, [](const Result& a, const Result& b) {
        return a.path < b.path;
    });

    size_t captured = 0;
    uintmax_t total_bytes = 0;
    for (const auto& r : sorted) {
        if (r.success) {
            ++captured;
            total_bytes += r.size;
        }
        std::ostringstream osstime;
        osstime << std::fixed << std::setprecision(3) << r.seconds;
        out << csv_escape(r.relative_path.empty() ? r.path.string() : r.relative_path) << ","
            << r.size << ","
            << csv_escape(r.archive.filename().string()) << ","
            << (r.success ? "OK" : "FAIL") << ","
            << osstime.str() << ","
            << csv_escape(r.error_msg) << "\n";
    }

    out << "\n\nFiles,Archived,Failed,Bytes archived,Total time (s)\n";
    out << sorted.size() << "," << captured << "," << (sorted.size() - captured) << ","
        << total_bytes << "," << std::fixed << std::setprecision(2) << total_seconds << "\n";
    return static_cast<bool>(out);
}
