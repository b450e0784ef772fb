//
// Created by Giuseppe Francione on 23/01/26.
//

#include "cli_parser.hpp"
#include "../../../libtreedump/include/file_utils.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <limits>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    // setup standard help and version flags
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.2");

    // --- Flags (booleans) ---
    app.add_flag("--skip-hidden,!--no-skip-hidden", settings.skip_hidden,
                 "Skip hidden files and directories (default: on).");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress console logging and the progress bar.");

    // --- Options ---
    app.add_option("--root", settings.root,
                   "Root directory to process (default: current directory).")
                   ->check(CLI::ExistingDirectory);

    app.add_option("--max-size", settings.max_size_kb,
                   "Maximum output file size in KB.")
                   ->default_val(settings.max_size_kb)
                   // the byte ceiling must fit in 64 bits
                   ->check(CLI::Range(std::uint64_t{1}, std::numeric_limits<std::uint64_t>::max() / 1024));

    app.add_option("-o,--output", settings.output_dir,
                   "Output directory for generated files, created if absent (default: output).");

    app.add_option("--skip-ext", settings.skip_exts,
                   "Comma-separated list of file extensions to skip (e.g. .log,.tmp).")
                   ->delimiter(',');

    app.add_option("--skip-dir", settings.skip_dirs,
                   "Comma-separated list of directory names to skip (e.g. node_modules,vendor).")
                   ->delimiter(',');

    app.add_option("--threads", settings.num_threads,
                   "Number of worker threads reading files.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--queue-size", settings.queue_size,
                   "Maximum number of queued paths (default: 4 per thread).")
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val(settings.log_level)
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Also write logs to this file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last(); // if used multiple times, take the last one

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        if (treedump::normalize_absolute(settings.output_dir) == treedump::normalize_absolute(settings.root)) {
            throw CLI::ValidationError("Output directory ('-o') must not be the root directory itself.");
        }
    });
}
