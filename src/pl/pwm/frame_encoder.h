#pragma once

/// @file frame_encoder.h
/// RGB colors -> WS2812 pulse codes.

#include "pl/int.h"
#include "pl/pwm/pulse_code.h"
#include "pl/rgb8.h"
#include "pl/span.h"

namespace pl {

/// Writes one 24-slot chunk per color into `codes`, in input order.
///
/// Each chunk holds green, then red, then blue, most significant bit
/// first; a 1 bit becomes ONE_CODE and a 0 bit ZERO_CODE.
///
/// Only the first min(colors.size(), codes.size() / 24) chunks are
/// written. Chunks past the supplied colors keep whatever they held before,
/// so a short write updates the head of the strip and leaves the tail LEDs
/// showing their previous frame. Colors that do not fit are ignored.
///
/// @return number of LEDs encoded
pl::size encodeFrame(span<const RGB8> colors, span<PulseCode> codes);

/// Encodes a single byte into 8 slots, MSB first.
inline void encodeByte(u8 value, PulseCode *out) {
    for (int bit = 7; bit >= 0; --bit) {
        *out++ = ((value >> bit) & 1) ? ONE_CODE : ZERO_CODE;
    }
}

} // namespace pl
