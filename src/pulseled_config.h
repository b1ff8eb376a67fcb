#pragma once

/// @file pulseled_config.h
/// Compile-time configuration for PulseLED. Every value below can be
/// overridden with a -D flag or by defining it before including PulseLED.h.

// ============================================================================
// WS2812 protocol timing
// ============================================================================

/// High time of a '0' bit, nanoseconds.
#ifndef PULSELED_WS2812_T0H_NS
#define PULSELED_WS2812_T0H_NS 400
#endif

/// High time of a '1' bit, nanoseconds.
#ifndef PULSELED_WS2812_T1H_NS
#define PULSELED_WS2812_T1H_NS 800
#endif

/// Full bit period, nanoseconds (800 kHz class).
#ifndef PULSELED_WS2812_PERIOD_NS
#define PULSELED_WS2812_PERIOD_NS 1250
#endif

// Minimum reset is 250us for some batches, plus slop.
#ifndef PULSELED_WS2812_RESET_US
#define PULSELED_WS2812_RESET_US 270
#endif

// ============================================================================
// Sequencer hardware
// ============================================================================

/// PWM base clock in MHz (ticks per microsecond). The nRF52 PWM runs
/// from the 16 MHz HFCLK with prescaler DIV_1.
#ifndef PULSELED_PWM_CLOCK_MHZ
#define PULSELED_PWM_CLOCK_MHZ 16
#endif

/// Bit 15 of every duty value selects the edge polarity on nRF52.
#ifndef PULSELED_PWM_POLARITY_BIT
#define PULSELED_PWM_POLARITY_BIT 0x8000
#endif

// ============================================================================
// Cooperative runtime
// ============================================================================

/// Granularity of pl::suspendMicroseconds(). Other runners are pumped
/// at least once per slice while a frame is in flight.
#ifndef PULSELED_ASYNC_SLICE_US
#define PULSELED_ASYNC_SLICE_US 100
#endif

// ============================================================================
// Debug output
// ============================================================================

/// Size of the inline buffer used by pl::StrStream for one log line.
#ifndef PULSELED_STRSTREAM_CAPACITY
#define PULSELED_STRSTREAM_CAPACITY 160
#endif
