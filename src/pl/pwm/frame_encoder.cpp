#include "pl/pwm/frame_encoder.h"

namespace pl {

pl::size encodeFrame(span<const RGB8> colors, span<PulseCode> codes) {
    const pl::size chunks = codes.size() / kBitsPerLed;
    const pl::size n = colors.size() < chunks ? colors.size() : chunks;
    PulseCode *out = codes.data();
    for (pl::size i = 0; i < n; ++i) {
        const RGB8 &c = colors[i];
        // GRB on the wire.
        encodeByte(c.g, out);
        encodeByte(c.r, out + 8);
        encodeByte(c.b, out + 16);
        out += kBitsPerLed;
    }
    return n;
}

} // namespace pl
