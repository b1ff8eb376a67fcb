#pragma once

#include "pl/compiler_control.h"
#include "pl/strstream.h"
#include "pl/warn.h"

namespace pl {

/// Logs the message and halts the platform. Used for conditions with no
/// safe continuation, e.g. a sequencer that refuses its configuration at
/// startup.
PL_NORETURN void fatal(const char *file, int line, const char *message);

} // namespace pl

#define PL_FATAL(MSG)                                                          \
    pl::fatal(pl::pulseled_file_offset(__FILE__), __LINE__,                    \
              (pl::StrStream() << MSG).c_str())

#define PL_FATAL_IF(COND, MSG)                                                 \
    do {                                                                       \
        if (PL_UNLIKELY(COND)) {                                               \
            PL_FATAL(MSG);                                                     \
        }                                                                      \
    } while (0)

#ifndef DEBUG
#define PL_ASSERT(x, MSG) PL_WARN_IF(!(x), MSG)
#elif defined(PULSELED_TESTING)
#include <assert.h>
#define PL_ASSERT(x, MSG)                                                      \
    do {                                                                       \
        PL_WARN_IF(!(x), MSG);                                                 \
        assert(x);                                                             \
    } while (0)
#else
#define PL_ASSERT(x, MSG) PL_FATAL_IF(!(x), MSG)
#endif
