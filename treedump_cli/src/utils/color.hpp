//
// Created by Giuseppe Francione on 23/01/26.
//

#ifndef TREEDUMP_COLOR_HPP
#define TREEDUMP_COLOR_HPP

// ANSI escape sequences for terminal output
inline constexpr const char* RESET  = "\033[0m";
inline constexpr const char* RED    = "\033[1;31m";
inline constexpr const char* YELLOW = "\033[1;33m";

#endif // TREEDUMP_COLOR_HPP
