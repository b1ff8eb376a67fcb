#include "pl/colorutils.h"

namespace pl {

pl::size brightness(span<const RGB8> in, span<RGB8> out, u8 level) {
    const pl::size n = in.size() < out.size() ? in.size() : out.size();
    for (pl::size i = 0; i < n; ++i) {
        const RGB8 c = in[i];
        out[i] = RGB8(scale8(c.r, level), scale8(c.g, level), scale8(c.b, level));
    }
    return n;
}

} // namespace pl
