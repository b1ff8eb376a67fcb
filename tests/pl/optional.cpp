#include "test.h"
#include "pl/optional.h"

TEST_CASE("Optional") {
    Optional<int> opt;
    CHECK(opt.empty());
    CHECK_FALSE(opt.has_value());
    CHECK(opt == nullopt);
    CHECK(opt.ptr() == nullptr);

    opt = 3;
    CHECK(opt.has_value());
    CHECK_EQ(*opt, 3);
    CHECK(opt == 3);

    opt.reset();
    CHECK(opt.empty());

    opt.emplace(5);
    Optional<int> copy = opt;
    CHECK(copy == opt);
    copy = nullopt;
    CHECK(copy != opt);
}

TEST_CASE("Optional::take leaves the source empty") {
    int value = 9;
    Optional<int *> slot(&value);

    Optional<int *> taken = slot.take();
    CHECK(slot.empty());
    REQUIRE(taken.has_value());
    CHECK_EQ(**taken, 9);

    Optional<int *> nothing = slot.take();
    CHECK(nothing.empty());
    CHECK(slot.empty());

    slot = taken.take();
    CHECK(slot.has_value());
    CHECK(taken.empty());
}

namespace {
struct Counted {
    static int alive;
    Counted() { ++alive; }
    Counted(const Counted &) { ++alive; }
    ~Counted() { --alive; }
};
int Counted::alive = 0;
} // namespace

TEST_CASE("Optional destroys what it holds") {
    {
        Optional<Counted> opt;
        opt = Counted();
        CHECK_EQ(Counted::alive, 1);
        opt.reset();
        CHECK_EQ(Counted::alive, 0);
        opt = Counted();
    }
    CHECK_EQ(Counted::alive, 0);
}
