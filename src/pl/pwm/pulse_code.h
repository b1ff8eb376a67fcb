#pragma once

/// @file pulse_code.h
/// The two duty values a WS2812 frame is built from.

#include "pulseled_config.h"
#include "pl/chipsets/led_timing.h"
#include "pl/int.h"

namespace pl {

/// One sequencer slot: the high time of one protocol bit in PWM ticks,
/// with the polarity bit set so the period starts high.
typedef u16 PulseCode;

static const PulseCode kPolarityBit = PULSELED_PWM_POLARITY_BIT;

static const PulseCode ZERO_CODE =
    static_cast<PulseCode>(TIMING_WS2812_PWM::T0H_TICKS | PULSELED_PWM_POLARITY_BIT);
static const PulseCode ONE_CODE =
    static_cast<PulseCode>(TIMING_WS2812_PWM::T1H_TICKS | PULSELED_PWM_POLARITY_BIT);

/// Slots per LED: 8 bits each of green, red, blue.
static const pl::size kBitsPerLed = TIMING_WS2812_PWM::BITS_PER_LED;

} // namespace pl
