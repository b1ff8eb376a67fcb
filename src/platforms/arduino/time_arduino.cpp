// Arduino-core implementation of the platform time primitives. On the
// Adafruit nRF52 core yield() and delay() hand over to FreeRTOS.

#if defined(ARDUINO) && !defined(PULSELED_STUB_IMPL)

#include <Arduino.h>

#include "platforms/time_platform.h"

namespace pl {
namespace platforms {

u32 micros() { return static_cast<u32>(::micros()); }

void sleepMicroseconds(u32 us) {
    // delayMicroseconds() takes an unsigned int and is only accurate
    // for a few milliseconds at a time.
    while (us > 10000) {
        ::delayMicroseconds(10000);
        us -= 10000;
    }
    ::delayMicroseconds(static_cast<unsigned int>(us));
}

void yieldMicroseconds(u32 us) {
    (void)us;
    ::yield();
}

void halt() {
    noInterrupts();
    for (;;) {
#if defined(NRF52_SERIES)
        __WFE();
#endif
    }
}

} // namespace platforms
} // namespace pl

#endif // ARDUINO && !PULSELED_STUB_IMPL
