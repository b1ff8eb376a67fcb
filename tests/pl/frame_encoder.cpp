#include "test.h"
#include "pl/pwm/frame_buffer.h"
#include "pl/pwm/frame_encoder.h"

namespace {

void checkAll(span<const u16> codes, pl::size begin, pl::size end, u16 expected) {
    for (pl::size i = begin; i < end; ++i) {
        INFO("slot " << i);
        CHECK_EQ(codes[i], expected);
    }
}

} // namespace

TEST_CASE("FrameBuffer") {
    FrameBuffer<48> buffer;
    CHECK_EQ(buffer.size(), 48u);
    CHECK_EQ(buffer.leds(), 2u);
    CHECK_EQ(FrameBuffer<48>::kLeds, 2u);
    checkAll(buffer.codes(), 0, 48, 0);

    buffer.fill(0x1234);
    checkAll(buffer.codes(), 0, 48, 0x1234);
    CHECK_EQ(buffer.codes().size(), 48u);
}

TEST_CASE("encodeFrame single colors") {
    FrameBuffer<24> buffer;

    SUBCASE("black is all zeros") {
        RGB8 colors[] = {RGB8(0, 0, 0)};
        CHECK_EQ(encodeFrame(colors, buffer.codes()), 1u);
        checkAll(buffer.codes(), 0, 24, ZERO_CODE);
    }

    SUBCASE("white is all ones") {
        RGB8 colors[] = {RGB8(255, 255, 255)};
        CHECK_EQ(encodeFrame(colors, buffer.codes()), 1u);
        checkAll(buffer.codes(), 0, 24, ONE_CODE);
    }

    SUBCASE("pure red lands in the middle byte") {
        RGB8 colors[] = {RGB8(255, 0, 0)};
        encodeFrame(colors, buffer.codes());
        checkAll(buffer.codes(), 0, 8, ZERO_CODE);   // green
        checkAll(buffer.codes(), 8, 16, ONE_CODE);   // red
        checkAll(buffer.codes(), 16, 24, ZERO_CODE); // blue
    }

    SUBCASE("pure green goes first") {
        RGB8 colors[] = {RGB8::Green};
        encodeFrame(colors, buffer.codes());
        checkAll(buffer.codes(), 0, 8, ONE_CODE);
        checkAll(buffer.codes(), 8, 24, ZERO_CODE);
    }

    SUBCASE("bits are MSB first") {
        RGB8 colors[] = {RGB8(0, 0x80, 0x01)};
        encodeFrame(colors, buffer.codes());
        CHECK_EQ(buffer[0], ONE_CODE);
        checkAll(buffer.codes(), 1, 23, ZERO_CODE);
        CHECK_EQ(buffer[23], ONE_CODE);
    }
}

TEST_CASE("encodeFrame decodes back to the input") {
    FrameBuffer<24 * 5> buffer;
    RGB8 colors[] = {RGB8(1, 2, 3), RGB8(0xA5, 0x5A, 0xFF), RGB8::Magenta,
                     RGB8(0x80, 0x7F, 0x01), RGB8::Black};
    CHECK_EQ(encodeFrame(colors, buffer.codes()), 5u);
    for (pl::size i = 0; i < 5; ++i) {
        bool ok = false;
        CHECK_EQ(decodeLed(buffer.codes(), i, &ok), colors[i]);
        CHECK(ok);
    }
}

TEST_CASE("encodeFrame is deterministic") {
    FrameBuffer<72> a;
    FrameBuffer<72> b;
    RGB8 colors[] = {RGB8::Yellow, RGB8(12, 34, 56), RGB8::Cyan};
    encodeFrame(colors, a.codes());
    encodeFrame(colors, b.codes());
    for (pl::size i = 0; i < 72; ++i) {
        CHECK_EQ(a[i], b[i]);
    }
    encodeFrame(colors, a.codes());
    for (pl::size i = 0; i < 72; ++i) {
        CHECK_EQ(a[i], b[i]);
    }
}

TEST_CASE("encodeFrame leaves the tail alone") {
    const u16 sentinel = 0x5555;
    FrameBuffer<48> buffer;
    buffer.fill(sentinel);

    RGB8 colors[] = {RGB8::White};
    CHECK_EQ(encodeFrame(colors, buffer.codes()), 1u);
    checkAll(buffer.codes(), 0, 24, ONE_CODE);
    checkAll(buffer.codes(), 24, 48, sentinel);
}

TEST_CASE("encodeFrame ignores colors past the buffer") {
    FrameBuffer<24> buffer;
    RGB8 colors[] = {RGB8::White, RGB8::Black, RGB8::Black};
    CHECK_EQ(encodeFrame(colors, buffer.codes()), 1u);
    checkAll(buffer.codes(), 0, 24, ONE_CODE);
}

TEST_CASE("encodeFrame with no colors") {
    FrameBuffer<24> buffer;
    buffer.fill(7);
    CHECK_EQ(encodeFrame(span<const RGB8>(), buffer.codes()), 0u);
    checkAll(buffer.codes(), 0, 24, 7);
}
