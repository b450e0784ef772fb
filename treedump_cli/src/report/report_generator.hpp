//
// Created by Giuseppe Francione on 24/01/26.
//

#ifndef TREEDUMP_REPORT_GENERATOR_HPP
#define TREEDUMP_REPORT_GENERATOR_HPP

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct Result {
    std::filesystem::path path;        // absolute path of the source file
    std::string relative_path;         // as written in the record, empty on failure
    uintmax_t size{};                  // content size in bytes
    std::filesystem::path archive;     // archive holding the record, empty on failure
    bool success{};                    // record written completely
    double seconds{};                  // read + write time
    std::string error_msg;             // if !success, reason of failure
};

void print_console_report(const std::vector<Result>& results,
                          const std::vector<std::filesystem::path>& archives,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @return false if the report file could not be written.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       double total_seconds);

std::string csv_escape(const std::string& data);

unsigned get_terminal_width();

#endif //TREEDUMP_REPORT_GENERATOR_HPP
