#include "pl/pwm/sequence_pwm.h"

#include "pl/log.h"

namespace pl {

const pl::size SequencePwm::kMaxSequenceLength;
const u16 SequencePwm::kMinCountertop;
const u16 SequencePwm::kMaxCountertop;

const char *toString(PwmError err) {
    switch (err) {
    case PwmError::OK:
        return "OK";
    case PwmError::SEQUENCE_TOO_LONG:
        return "SEQUENCE_TOO_LONG";
    case PwmError::BUFFER_NOT_IN_RAM:
        return "BUFFER_NOT_IN_RAM";
    case PwmError::SEQUENCE_TIMES_AT_LEAST_ONE:
        return "SEQUENCE_TIMES_AT_LEAST_ONE";
    case PwmError::BUSY:
        return "BUSY";
    case PwmError::INVALID_CONFIG:
        return "INVALID_CONFIG";
    case PwmError::NOT_INITIALIZED:
        return "NOT_INITIALIZED";
    }
    return "UNKNOWN";
}

Result<void, PwmError> validateConfig(const SequencePwm::Config &config, OutputPin pin) {
    if (!pin.valid()) {
        return Result<void, PwmError>::failure(PwmError::INVALID_CONFIG,
                                               "no output pin");
    }
    if (config.max_duty < SequencePwm::kMinCountertop ||
        config.max_duty > SequencePwm::kMaxCountertop) {
        PL_LOG_PWM("countertop " << config.max_duty << " out of range");
        return Result<void, PwmError>::failure(PwmError::INVALID_CONFIG,
                                               "countertop out of range");
    }
    return Result<void, PwmError>::success();
}

Result<void, PwmError> validateSequence(span<const u16> sequence, u16 times) {
    if (times == 0) {
        return Result<void, PwmError>::failure(PwmError::SEQUENCE_TIMES_AT_LEAST_ONE,
                                               "sequence must play at least once");
    }
    if (sequence.empty()) {
        return Result<void, PwmError>::failure(PwmError::INVALID_CONFIG,
                                               "empty sequence");
    }
    if (sequence.size() > SequencePwm::kMaxSequenceLength) {
        return Result<void, PwmError>::failure(PwmError::SEQUENCE_TOO_LONG,
                                               "sequence longer than 0x7FFF values");
    }
    return Result<void, PwmError>::success();
}

} // namespace pl
