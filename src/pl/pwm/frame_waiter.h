#pragma once

/// @file frame_waiter.h
/// Waiting out a WS2812 frame.
///
/// The wait is a fixed worst-case bound computed from the LED count; the
/// peripheral's completion status is never polled. Two policies share the
/// bound:
///
///   - BlockingWait holds the processor (pl::delayMicroseconds).
///   - CooperativeWait lets other async runners run meanwhile
///     (pl::suspendMicroseconds).
///
/// Both return exactly once, after the whole delay.

#include "pl/chipsets/led_timing.h"
#include "pl/int.h"

namespace pl {

/// Microseconds to clock out `leds` LEDs plus the latch gap:
/// ceil(leds * 24 * 1250 / 1000) + 270 with default timing.
/// frameDelayMicros(8) == 510.
constexpr u32 frameDelayMicros(u32 leds) {
    return div_ceil(leds * TIMING_WS2812_PWM::BITS_PER_LED * TIMING_WS2812_PWM::PERIOD,
                    1000) +
           TIMING_WS2812_PWM::RESET_US;
}

struct BlockingWait {
    static void wait(u32 us);
    static const char *name() { return "blocking"; }
};

struct CooperativeWait {
    static void wait(u32 us);
    static const char *name() { return "cooperative"; }
};

} // namespace pl
