#include "stegbridge/cli_colors.hpp"

#include <atomic>
#include <cstdio>
#include <iostream>

#include <unistd.h>

namespace stegbridge::cli {

namespace {
    // -1 = not yet detected, 0 = off, 1 = on
    std::atomic<int> g_colors_state{-1};
}

bool ColorsEnabled(std::ostream& os) {
    int state = g_colors_state.load();
    if (state < 0) {
        // Auto-detect: only color a TTY
        bool is_tty = false;
        if (&os == &std::cout) {
            is_tty = isatty(fileno(stdout)) != 0;
        } else if (&os == &std::cerr || &os == &std::clog) {
            is_tty = isatty(fileno(stderr)) != 0;
        }
        state = is_tty ? 1 : 0;
        int expected = -1;
        if (!g_colors_state.compare_exchange_strong(expected, state)) {
            state = expected;
        }
    }
    return state == 1;
}

void SetColorsEnabled(bool enabled) {
    g_colors_state.store(enabled ? 1 : 0);
}

std::string Colorize(const std::string& text, const char* color, std::ostream& os) {
    if (!ColorsEnabled(os)) {
        return text;
    }
    return std::string(color) + text + color::RESET;
}

}  // namespace stegbridge::cli
