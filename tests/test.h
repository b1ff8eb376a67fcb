#pragma once

#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "pl/async.h"
#include "pl/int.h"
#include "pl/io.h"
#include "pl/pwm/pulse_code.h"
#include "pl/pwm/sequence_pwm.h"
#include "pl/rgb8.h"
#include "pl/span.h"
#include "pl/strstream.h"
#include "pl/time.h"

namespace doctest {
template <> struct StringMaker<pl::RGB8> {
    static String convert(const pl::RGB8 &value) {
        pl::StrStream s;
        s << "RGB8(" << value.r << "," << value.g << "," << value.b << ")";
        return s.c_str();
    }
};

template <> struct StringMaker<pl::PwmError> {
    static String convert(const pl::PwmError &value) { return pl::toString(value); }
};
} // namespace doctest

/// Collects everything printed through pl::println while alive.
class CapturedLog {
  public:
    CapturedLog() {
        lines().clear();
        pl::inject_println_handler(&CapturedLog::capture);
    }
    ~CapturedLog() { pl::clear_io_handlers(); }

    const std::vector<std::string> &get() const { return lines(); }

    bool contains(const char *needle) const {
        for (size_t i = 0; i < lines().size(); ++i) {
            if (lines()[i].find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

  private:
    static std::vector<std::string> &lines() {
        static std::vector<std::string> sLines;
        return sLines;
    }
    static void capture(const char *line) { lines().push_back(line); }
};

/// Injects a mock clock for the lifetime of the scope.
class ScopedMockTime {
  public:
    explicit ScopedMockTime(pl::u32 start = 0) : mMock(start) {
        pl::inject_time_provider(mMock);
    }
    ~ScopedMockTime() { pl::clear_time_provider(); }

    pl::MockTimeProvider &mock() { return mMock; }
    pl::u32 now() const { return mMock.current_time(); }

  private:
    pl::MockTimeProvider mMock;
};

/// Keeps a runner registered with the AsyncManager for the scope.
class ScopedRunner {
  public:
    explicit ScopedRunner(pl::async_runner *runner) : mRunner(runner) {
        pl::AsyncManager::instance().register_runner(runner);
    }
    ~ScopedRunner() { pl::AsyncManager::instance().unregister_runner(mRunner); }

  private:
    pl::async_runner *mRunner;
};

/// Reads the 24 pulse codes of one LED back into a color. Codes other
/// than ZERO_CODE / ONE_CODE make `ok` false.
inline pl::RGB8 decodeLed(pl::span<const pl::u16> codes, pl::size led, bool *ok) {
    pl::u8 channels[3] = {0, 0, 0};  // g, r, b
    *ok = true;
    const pl::size base = led * pl::kBitsPerLed;
    for (pl::size i = 0; i < pl::kBitsPerLed; ++i) {
        const pl::u16 code = codes[base + i];
        if (code != pl::ZERO_CODE && code != pl::ONE_CODE) {
            *ok = false;
        }
        pl::u8 &channel = channels[i / 8];
        channel = static_cast<pl::u8>((channel << 1) | (code == pl::ONE_CODE ? 1 : 0));
    }
    return pl::RGB8(channels[1], channels[0], channels[2]);
}

using namespace pl;
