#include "pl/time.h"

#include "platforms/time_platform.h"

namespace pl {

#ifdef PULSELED_TESTING

static MockTimeProvider *&get_time_provider() {
    static MockTimeProvider *provider = nullptr;
    return provider;
}

MockTimeProvider::MockTimeProvider(u32 initial_time) : mCurrentTime(initial_time) {}

void MockTimeProvider::advance(u32 microseconds) { mCurrentTime += microseconds; }

void MockTimeProvider::set_time(u32 microseconds) { mCurrentTime = microseconds; }

u32 MockTimeProvider::current_time() const { return mCurrentTime; }

void inject_time_provider(MockTimeProvider &provider) { get_time_provider() = &provider; }

void clear_time_provider() { get_time_provider() = nullptr; }

MockTimeProvider *injected_time_provider() { return get_time_provider(); }

#endif // PULSELED_TESTING

u32 micros() {
#ifdef PULSELED_TESTING
    if (MockTimeProvider *mock = get_time_provider()) {
        return mock->current_time();
    }
#endif
    return platforms::micros();
}

} // namespace pl
