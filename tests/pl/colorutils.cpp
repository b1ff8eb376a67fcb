#include "test.h"
#include "pl/colorutils.h"

TEST_CASE("scale8") {
    CHECK_EQ(scale8(255, 255), 255);
    CHECK_EQ(scale8(0, 255), 0);
    CHECK_EQ(scale8(255, 0), 0);
    CHECK_EQ(scale8(128, 127), 64);
    CHECK_EQ(scale8(255, 10), 10);
    CHECK_EQ(scale8(200, 10), 8);
}

TEST_CASE("brightness") {
    RGB8 in[3] = {RGB8::Red, RGB8::Green, RGB8(100, 200, 50)};
    RGB8 out[3];

    SUBCASE("level 10") {
        CHECK_EQ(brightness(in, out, 10), 3u);
        CHECK_EQ(out[0], RGB8(10, 0, 0));
        CHECK_EQ(out[1], RGB8(0, 10, 0));
        CHECK_EQ(out[2], RGB8(4, 8, 2));
    }

    SUBCASE("full level is identity") {
        brightness(in, out, 255);
        for (int i = 0; i < 3; ++i) {
            CHECK_EQ(out[i], in[i]);
        }
    }

    SUBCASE("in place") {
        brightness(in, in, 0);
        CHECK_EQ(in[2], RGB8::Black);
    }

    SUBCASE("shorter output wins") {
        span<RGB8> two(out, 2);
        out[2] = RGB8::White;
        CHECK_EQ(brightness(in, two, 128), 2u);
        CHECK_EQ(out[2], RGB8::White);
    }
}

TEST_CASE("named colors") {
    CHECK_EQ(RGB8::Black, RGB8(0, 0, 0));
    CHECK_EQ(RGB8::White, RGB8(255, 255, 255));
    CHECK_EQ(RGB8::Yellow, RGB8(255, 255, 0));
    CHECK_EQ(RGB8::Cyan, RGB8(0, 255, 255));
    CHECK_EQ(RGB8::Magenta, RGB8(255, 0, 255));
    CHECK(RGB8::Red != RGB8::Blue);
}
