#pragma once

/// @file pl/rgb8.h
/// 8-bit RGB color as supplied by callers of the driver.

#include "pl/int.h"

namespace pl {

/// One LED color. Channel order on the wire is handled by the encoder, so
/// callers always think in r/g/b.
struct RGB8 {
    u8 r;
    u8 g;
    u8 b;

    RGB8() : r(0), g(0), b(0) {}
    constexpr RGB8(u8 ir, u8 ig, u8 ib) : r(ir), g(ig), b(ib) {}

    bool operator==(const RGB8 &rhs) const {
        return r == rhs.r && g == rhs.g && b == rhs.b;
    }
    bool operator!=(const RGB8 &rhs) const { return !(*this == rhs); }

    static const RGB8 Black;
    static const RGB8 Red;
    static const RGB8 Green;
    static const RGB8 Blue;
    static const RGB8 White;
    static const RGB8 Yellow;
    static const RGB8 Cyan;
    static const RGB8 Magenta;
};

} // namespace pl
