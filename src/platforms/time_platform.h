#pragma once

/// @file platforms/time_platform.h
/// Primitives each platform provides for pl::micros(), pl::delay*() and
/// pl::fatal(). Implementations live in platforms/<platform>/time_*.cpp.

#include "pl/compiler_control.h"
#include "pl/int.h"

namespace pl {
namespace platforms {

/// Free-running microsecond counter.
u32 micros();

/// Busy/blocked wait. Never yields to other tasks.
void sleepMicroseconds(u32 us);

/// Gives the processor to the scheduler for up to `us` microseconds.
/// On targets without a scheduler this degrades to a short sleep.
void yieldMicroseconds(u32 us);

/// Stops the system after an unrecoverable error.
PL_NORETURN void halt();

} // namespace platforms
} // namespace pl
