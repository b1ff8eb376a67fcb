/// @file pl/delay.cpp

#include "pl/delay.h"

#include "pulseled_config.h"
#include "pl/async.h"
#include "pl/time.h"
#include "platforms/time_platform.h"

namespace pl {

void delayMicroseconds(u32 us) {
#ifdef PULSELED_TESTING
    if (MockTimeProvider *mock = injected_time_provider()) {
        mock->advance(us);
        return;
    }
#endif
    platforms::sleepMicroseconds(us);
}

void suspendMicroseconds(u32 us) {
    const u32 start = micros();
    u32 elapsed = 0;
    do {
        async_run();
        elapsed = micros() - start;
        if (elapsed >= us) {
            break;
        }
        u32 remaining = us - elapsed;
        u32 slice = remaining < PULSELED_ASYNC_SLICE_US ? remaining
                                                        : PULSELED_ASYNC_SLICE_US;
#ifdef PULSELED_TESTING
        if (MockTimeProvider *mock = injected_time_provider()) {
            mock->advance(slice);
            elapsed = micros() - start;
            continue;
        }
#endif
        platforms::yieldMicroseconds(slice);
        elapsed = micros() - start;
    } while (elapsed < us);
}

} // namespace pl
