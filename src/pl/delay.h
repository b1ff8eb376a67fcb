#pragma once

/// @file pl/delay.h
/// Microsecond waits for PulseLED
///
/// Two flavours, matching the two ways a frame can be waited out:
///   - delayMicroseconds(): holds the processor, nothing else runs.
///   - suspendMicroseconds(): pumps registered async runners and yields
///     to the platform scheduler until the time has elapsed.

#include "pl/int.h"

namespace pl {

/// Blocks for at least `us` microseconds. Never pumps async runners.
void delayMicroseconds(u32 us);

/// Waits at least `us` microseconds while letting other cooperative work
/// run. Async runners are pumped at least once per
/// PULSELED_ASYNC_SLICE_US slice, and at least once in total even when
/// `us` is 0.
void suspendMicroseconds(u32 us);

} // namespace pl
