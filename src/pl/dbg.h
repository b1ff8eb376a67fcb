#pragma once

#include "pl/strstream.h"

// Forward declaration to avoid pulling in pl/io.h everywhere.
#ifndef PL_DBG_PRINTLN_DECLARED
#define PL_DBG_PRINTLN_DECLARED
namespace pl {
void println(const char *str);
}
#endif

namespace pl {
// ".build/src/pl/dbg.h" -> "src/pl/dbg.h"
// "blah/blah/blah.h" -> "blah.h"
inline const char *pulseled_file_offset(const char *file) {
    const char *p = file;
    const char *last_slash = nullptr;

    while (*p) {
        if (p[0] == 's' && p[1] == 'r' && p[2] == 'c' && p[3] == '/') {
            return p;
        }
        if (*p == '/') {
            last_slash = p;
        }
        p++;
    }
    if (last_slash) {
        return last_slash + 1;
    }
    return file;
}
} // namespace pl

#if !defined(RELEASE) || defined(PULSELED_TESTING)
#define PULSELED_FORCE_DBG 1
#endif

#ifndef PULSELED_FORCE_DBG
// Release firmware: the expression is type-checked but never evaluated.
#define PULSELED_HAS_DBG 0
#define _PULSELED_DBG(X)                                                       \
    do {                                                                       \
        if (false) {                                                           \
            pl::println((pl::StrStream() << X).c_str());                       \
        }                                                                      \
    } while (0)
#else
#define PULSELED_HAS_DBG 1
#define _PULSELED_DBG(X)                                                       \
    pl::println((pl::StrStream() << pl::pulseled_file_offset(__FILE__) << "("  \
                                 << int(__LINE__) << "): " << X)               \
                    .c_str())
#endif

#define PULSELED_DBG(X) _PULSELED_DBG(X)

#define PULSELED_DBG_IF(COND, MSG)                                             \
    do {                                                                       \
        if (COND) {                                                            \
            PULSELED_DBG(MSG);                                                 \
        }                                                                      \
    } while (0)

#ifndef PL_DBG
#define PL_DBG PULSELED_DBG
#define PL_DBG_IF PULSELED_DBG_IF
#endif

// Swallows a streaming expression without evaluating it.
#define PL_DBG_NO_OP(X)                                                        \
    do {                                                                       \
        if (false) {                                                           \
            pl::StrStream() << X;                                              \
        }                                                                      \
    } while (0)
