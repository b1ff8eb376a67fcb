#pragma once

// Host (Linux/macOS/test) console output.

#include <stdio.h>

namespace pl {

inline void print_native(const char *str) {
    fputs(str, stdout);
    fflush(stdout);
}

inline void println_native(const char *str) {
    fputs(str, stdout);
    fputc('\n', stdout);
    fflush(stdout);
}

} // namespace pl
