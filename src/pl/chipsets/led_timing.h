/// @file led_timing.h
/// @brief WS2812 timing expressed in PWM sequencer ticks
///
/// The sequencer emits one duty value per bit. Each bit period starts high
/// and drops low after the duty value's number of ticks:
///
///   At T=0        : the line is raised hi to start a bit
///   At T=T0H      : the line is dropped low to transmit a zero bit
///   At T=T1H      : the line is dropped low to transmit a one bit
///   At T=PERIOD   : the bit is concluded (next bit can be sent)
///
/// After the last bit the line stays low for RESET_US, which latches the
/// frame into the LEDs.
///
/// Nanosecond inputs come from pulseled_config.h and are converted with
/// half-up rounding at the PWM base clock (16 ticks/us on nRF52).

#pragma once

#include "pulseled_config.h"
#include "pl/int.h"

namespace pl {

/// Converts nanoseconds to PWM clock ticks, rounding half up.
/// to_ticks(400) == 6, to_ticks(800) == 13, to_ticks(1250) == 20.
constexpr u32 to_ticks(u32 ns, u32 clock_mhz = PULSELED_PWM_CLOCK_MHZ) {
    return (ns * clock_mhz + 500) / 1000;
}

/// Integer ceil(a / b).
constexpr u32 div_ceil(u32 a, u32 b) { return (a + b - 1) / b; }

/// WS2812 @ 800 kHz on a DMA-fed PWM sequencer
struct TIMING_WS2812_PWM {
    enum : u32 {
        T0H = PULSELED_WS2812_T0H_NS,         ///< High time of a '0' (ns)
        T1H = PULSELED_WS2812_T1H_NS,         ///< High time of a '1' (ns)
        PERIOD = PULSELED_WS2812_PERIOD_NS,   ///< Bit period (ns)
        RESET_US = PULSELED_WS2812_RESET_US,  ///< Latch gap (us)
        BITS_PER_LED = 24,
        T0H_TICKS = to_ticks(PULSELED_WS2812_T0H_NS),
        T1H_TICKS = to_ticks(PULSELED_WS2812_T1H_NS),
        PERIOD_TICKS = to_ticks(PULSELED_WS2812_PERIOD_NS),
        RESET_TICKS = to_ticks(PULSELED_WS2812_RESET_US * 1000)
    };
};

static_assert(TIMING_WS2812_PWM::T0H_TICKS < TIMING_WS2812_PWM::T1H_TICKS,
              "'1' bit must stay high longer than a '0' bit");
static_assert(TIMING_WS2812_PWM::T1H_TICKS < TIMING_WS2812_PWM::PERIOD_TICKS,
              "'1' bit high time must fit inside the bit period");

} // namespace pl
