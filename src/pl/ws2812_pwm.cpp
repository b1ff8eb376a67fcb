#include "pl/ws2812_pwm.h"

namespace pl {

const char *toString(DriverState state) {
    switch (state) {
    case DriverState::kIdle:
        return "idle";
    case DriverState::kEncoding:
        return "encoding";
    case DriverState::kTransmitting:
        return "transmitting";
    case DriverState::kWaiting:
        return "waiting";
    }
    return "unknown";
}

const char *toString(const Ws2812Error &err) { return toString(err.cause); }

SequencePwm::Config ws2812PwmConfig() {
    SequencePwm::Config config;
    config.counter_mode = CounterMode::UP;
    config.max_duty = static_cast<u16>(TIMING_WS2812_PWM::PERIOD_TICKS);
    config.prescaler = Prescaler::DIV_1;
    config.sequence_load = SequenceLoad::COMMON;
    config.drive = OutputDrive::HIGH_DRIVE_0_STANDARD_1;
    return config;
}

SequenceConfig ws2812SequenceConfig() {
    SequenceConfig config;
    config.refresh = 0;
    config.end_delay = TIMING_WS2812_PWM::RESET_TICKS;
    return config;
}

} // namespace pl
