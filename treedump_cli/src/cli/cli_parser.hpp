//
// Created by Giuseppe Francione on 23/01/26.
//

#ifndef TREEDUMP_CLI_PARSER_HPP
#define TREEDUMP_CLI_PARSER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// forward declaration
namespace CLI { class App; }

struct Settings {
    std::filesystem::path root = ".";
    std::uint64_t max_size_kb = 1024;
    std::filesystem::path output_dir = "output";
    bool skip_hidden = true;
    bool quiet = false;

    unsigned num_threads = 4;
    std::size_t queue_size = 0; // 0 = four slots per thread
    std::string log_level = "INFO";
    std::filesystem::path log_file;
    std::filesystem::path report_path;
    std::vector<std::string> skip_exts;
    std::vector<std::string> skip_dirs;

    [[nodiscard]] std::uintmax_t max_bytes() const { return static_cast<std::uintmax_t>(max_size_kb) * 1024; }
};

/**
 * @brief Configures the CLI11 parser with all options and flags.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //TREEDUMP_CLI_PARSER_HPP
