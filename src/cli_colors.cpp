#include "sep39/cli_colors.hpp"

#include "sep39/env.hpp"

#include <cstdio>

#include <unistd.h>

namespace sep39::cli {

namespace {
    enum class Mode { Auto, On, Off };
    Mode g_mode = Mode::Auto;

    bool IsTty(std::ostream& os) {
        if (&os == &std::cout) {
            return isatty(fileno(stdout)) != 0;
        }
        if (&os == &std::cerr) {
            return isatty(fileno(stderr)) != 0;
        }
        return false;
    }
}

bool ColorsEnabled(std::ostream& os) {
    if (g_mode == Mode::Auto) {
        g_mode = env::IsEnabled(env::kNoColorVar) ? Mode::Off : Mode::Auto;
    }
    if (g_mode != Mode::Auto) {
        return g_mode == Mode::On;
    }
    return IsTty(os);
}

void SetColorsEnabled(bool enabled) {
    g_mode = enabled ? Mode::On : Mode::Off;
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace sep39::cli
