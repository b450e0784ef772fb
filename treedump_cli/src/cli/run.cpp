//
// Created by Giuseppe Francione on 02/02/26.
//

#include "run.hpp"
#include "../report/report_generator.hpp"
#include "../utils/color.hpp"
#include "../utils/console_log_sink.hpp"
#include "../utils/file_log_sink.hpp"
#include "../../../libtreedump/include/capture_executor.hpp"
#include "../../../libtreedump/include/event_bus.hpp"
#include "../../../libtreedump/include/events.hpp"
#include "../../../libtreedump/include/file_utils.hpp"
#include "../../../libtreedump/include/logger.hpp"
#include "../../../libtreedump/include/output_sink.hpp"
#include "../../../libtreedump/include/path_filter.hpp"
#include "../../../libtreedump/include/tree_walker.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

using namespace treedump;
namespace fs = std::filesystem;

namespace {

// simple progress bar printer
void print_progress_bar(const size_t done, const size_t total, const double elapsed_seconds) {
    const unsigned term_width = get_terminal_width();
    const unsigned int bar_width = std::max(10u, term_width > 40u ? term_width - 40u : 20u);

    const double progress = total ? static_cast<double>(done) / static_cast<double>(total) : 1.0;
    const unsigned pos = static_cast<unsigned>(bar_width * progress);

    double percent = progress * 100.0;
    if (done < total && percent >= 99.95) {
        percent = 99.9;
    }

    std::cerr << "\r[";
    for (unsigned i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos && done < total) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] "
              << std::setw(5) << std::fixed << std::setprecision(1) << percent << "%"
              << " (" << done << "/" << total << ")"
              << " elapsed: " << std::fixed << std::setprecision(1) << elapsed_seconds << "s"
              << std::flush;
}

} // namespace

int run(const Settings& settings) {
    const bool stderr_tty = isatty(fileno(stderr)) != 0;
    const bool show_progress = !settings.quiet && stderr_tty;
    const LogLevel console_level = Logger::string_to_level(settings.log_level).value_or(LogLevel::Info);

    Logger::clear_sinks();
    if (!settings.log_file.empty()) {
        auto fileSink = std::make_unique<FileLogSink>(settings.log_file, false);
        if (!fileSink->is_open()) {
            std::cerr << RED << "Cannot open log file: " << settings.log_file.string() << RESET << std::endl;
            return 1;
        }
        Logger::add_sink(std::move(fileSink));
    }
    if (!settings.quiet) {
        auto consoleSink = std::make_unique<ConsoleLogSink>();
        // the progress bar owns the terminal line; keep per-file chatter out of it
        consoleSink->log_level = show_progress ? std::max(console_level, LogLevel::Warning) : console_level;
        consoleSink->use_colors = stderr_tty;
        Logger::add_sink(std::move(consoleSink));
    }

    const fs::path root = normalize_absolute(settings.root);
    const fs::path output_dir = normalize_absolute(settings.output_dir);

    FilterRules rules = FilterRules::from_lists(settings.skip_exts, settings.skip_dirs, settings.skip_hidden);
    // never archive our own output or the log we are appending to
    rules.skip_paths.insert(output_dir);
    if (!settings.log_file.empty()) {
        rules.skip_paths.insert(normalize_absolute(settings.log_file));
    }
    const PathFilter filter(std::move(rules));

    std::unique_ptr<OutputSink> sink;
    std::vector<fs::path> files;
    try {
        sink = std::make_unique<OutputSink>(output_dir, settings.max_bytes());
        const std::string tree = render_tree(root, filter);
        files = collect_files(root, filter);
        sink->write_tree(tree);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        if (settings.quiet) {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        return 1;
    }

    EventBus bus;
    std::vector<Result> results;
    results.reserve(files.size());
    const size_t total = files.size();
    size_t done = 0;
    const auto start_total = std::chrono::steady_clock::now();

    // handlers run one at a time under the bus mutex
    auto on_finish = [&]() {
        ++done;
        if (show_progress) {
            const double elapsed = std::chrono::duration<double>(
                std::chrono::steady_clock::now() - start_total).count();
            print_progress_bar(done, total, elapsed);
        }
    };

    bus.subscribe<FileCapturedEvent>([&](const FileCapturedEvent& e) {
        Result r;
        r.path = e.path;
        r.relative_path = e.relative_path;
        r.size = e.size_bytes;
        r.archive = e.archive;
        r.success = true;
        r.seconds = static_cast<double>(e.duration.count()) / 1000.0;
        results.push_back(std::move(r));
        on_finish();
    });

    bus.subscribe<FileCaptureErrorEvent>([&](const FileCaptureErrorEvent& e) {
        Result r;
        r.path = e.path;
        r.success = false;
        r.error_msg = e.error_message;
        results.push_back(std::move(r));
        on_finish();
    });

    CaptureExecutor executor(root, *sink, bus, settings.num_threads, settings.queue_size);
    const CaptureStats stats = executor.process(files);
    if (show_progress) {
        std::cerr << std::endl;
    }

    const std::vector<fs::path> archives = sink->archives();
    try {
        sink->close();
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Failed to finish last archive: ") + e.what(), "main");
    }

    const double total_seconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start_total).count();

    if (!settings.quiet) {
        print_console_report(results, archives, settings.num_threads, total_seconds);
    }

    if (!settings.report_path.empty()) {
        if (export_csv_report(results, settings.report_path, total_seconds)) {
            Logger::log(LogLevel::Info, "Report written to " + settings.report_path.string(), "main");
        } else {
            Logger::log(LogLevel::Error, "Cannot write report " + settings.report_path.string(), "main");
        }
    }

    Logger::log(LogLevel::Info,
                "File processing completed: " + std::to_string(stats.files_captured) + " archived, " +
                std::to_string(stats.files_failed) + " skipped",
                "main");
    return 0;
}
