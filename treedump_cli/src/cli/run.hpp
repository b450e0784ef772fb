//
// Created by Giuseppe Francione on 02/02/26.
//

#ifndef TREEDUMP_RUN_HPP
#define TREEDUMP_RUN_HPP

#include "cli_parser.hpp"

/**
 * @brief Runs one dump with already validated settings.
 *
 * Installs the log sinks, writes the tree block and every kept file into
 * the archives, then prints and exports the report.
 *
 * @return 0 once the run completed, even if some files were left out;
 * 1 if it could not start (log file, output directory, root or first
 * archive unusable).
 */
int run(const Settings& settings);

#endif // TREEDUMP_RUN_HPP
