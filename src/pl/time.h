#pragma once

/// @file time.h
/// @brief Monotonic microsecond clock
///
/// `pl::micros()` is the single time source for frame delays. It wraps
/// around every 2^32 microseconds (about 71 minutes); compare with
/// unsigned subtraction (`now - start >= us`), never with `<`.

#include "pl/int.h"

namespace pl {

/// Microseconds since the platform started.
u32 micros();

#ifdef PULSELED_TESTING

/// Controllable clock for unit tests. While injected, pl::micros()
/// returns its value, and pl::delayMicroseconds() / pl::suspendMicroseconds()
/// advance it instead of sleeping.
///
/// @code
/// pl::MockTimeProvider mock(1000);
/// pl::inject_time_provider(mock);
/// pl::delayMicroseconds(510);
/// CHECK(pl::micros() == 1510);
/// pl::clear_time_provider();
/// @endcode
class MockTimeProvider {
  public:
    explicit MockTimeProvider(u32 initial_time = 0);

    void advance(u32 microseconds);
    void set_time(u32 microseconds);
    u32 current_time() const;

  private:
    u32 mCurrentTime;
};

void inject_time_provider(MockTimeProvider &provider);
void clear_time_provider();

/// The injected provider, or nullptr.
MockTimeProvider *injected_time_provider();

#endif // PULSELED_TESTING

} // namespace pl
