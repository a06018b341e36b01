#pragma once

#include "lexport/log.hpp"

#include <iostream>
#include <ostream>
#include <string>

namespace lexport::console {

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* BOLD = "\033[1m";
}

// True when `os` is a terminal and colours were not turned off by
// SetColorsEnabled(false) or LEXPORT_NO_COLOR.
bool ColorsEnabled(std::ostream& os = std::cout);

void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text, std::ostream& os = std::cerr) { return Colorize(text, color::RED, os); }
inline std::string Green(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::GREEN, os); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cerr) { return Colorize(text, color::YELLOW, os); }
inline std::string Bold(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::BOLD, os); }

// Info and Ok go to stdout, Error to stderr.
Logger MakeLogger();

}  // namespace lexport::console
