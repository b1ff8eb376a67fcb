#pragma once

/// @file pl/colorutils.h
/// Brightness scaling applied by applications before handing colors to the
/// driver.

#include "pl/compiler_control.h"
#include "pl/int.h"
#include "pl/rgb8.h"
#include "pl/span.h"

namespace pl {

/// Scale one byte by a second one, which is treated as the numerator of a
/// fraction whose denominator is 256. scale8(i, 255) == i, and
/// scale8(i, 0) == 0.
PL_FORCE_INLINE u8 scale8(u8 i, u8 scale) {
    return static_cast<u8>((static_cast<u16>(i) * (static_cast<u16>(scale) + 1)) >> 8);
}

/// Scales every channel of every color in `in` by `level` and writes the
/// result to `out`. Processes min(in.size(), out.size()) colors; `in` and
/// `out` may alias. Returns the number of colors written.
pl::size brightness(span<const RGB8> in, span<RGB8> out, u8 level);

} // namespace pl
