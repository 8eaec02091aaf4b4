#pragma once

#include <iostream>
#include <ostream>
#include <string>

namespace sep39::cli {

namespace color {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[0;31m";
    constexpr const char* GREEN = "\033[0;32m";
    constexpr const char* YELLOW = "\033[0;33m";
    constexpr const char* CYAN = "\033[0;36m";
    constexpr const char* BOLD_WHITE = "\033[1;37m";
}

// Colors are on when the stream is a TTY, unless disabled by SEP39_NO_COLOR
// or --no-color.
bool ColorsEnabled(std::ostream& os = std::cout);
void SetColorsEnabled(bool enabled);

std::string Colorize(const std::string& text, const char* color, std::ostream& os = std::cout);

inline std::string Red(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::RED, os); }
inline std::string Green(const std::string& text) { return Colorize(text, color::GREEN); }
inline std::string Yellow(const std::string& text, std::ostream& os = std::cout) { return Colorize(text, color::YELLOW, os); }
inline std::string Cyan(const std::string& text) { return Colorize(text, color::CYAN); }
inline std::string Bold(const std::string& text) { return Colorize(text, color::BOLD_WHITE); }

}  // namespace sep39::cli
