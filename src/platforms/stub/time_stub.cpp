// Host implementation of the platform time primitives.

#ifdef PULSELED_STUB_IMPL

#include <chrono>
#include <cstdlib>
#include <thread>

#include "platforms/time_platform.h"

namespace pl {
namespace platforms {

namespace {
std::chrono::steady_clock::time_point start_time() {
    static const std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    return start;
}
} // namespace

u32 micros() {
    const auto elapsed = std::chrono::steady_clock::now() - start_time();
    return static_cast<u32>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

void sleepMicroseconds(u32 us) {
    // Spin rather than sleep: the OS sleep granularity is far coarser than
    // a WS2812 frame.
    const u32 start = micros();
    while (micros() - start < us) {
    }
}

void yieldMicroseconds(u32 us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

void halt() { std::abort(); }

} // namespace platforms
} // namespace pl

#endif // PULSELED_STUB_IMPL
