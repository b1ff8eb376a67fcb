#include "pl/pwm/single_sequencer.h"

#include "pl/log.h"

namespace pl {

SingleSequencer::SingleSequencer(SequencePwm &pwm, span<const u16> sequence,
                                 const SequenceConfig &config)
    : mPwm(pwm), mSequence(sequence), mConfig(config), mStarted(false) {}

SingleSequencer::~SingleSequencer() { stop(); }

Result<void, PwmError> SingleSequencer::start(u16 times) {
    Result<void, PwmError> result = mPwm.startSingle(mSequence, mConfig, times);
    if (!result) {
        PL_LOG_PWM(mPwm.getName() << " refused sequence: " << toString(result.error()));
        return result;
    }
    mStarted = true;
    return result;
}

void SingleSequencer::stop() {
    if (mStarted) {
        mPwm.stop();
        mStarted = false;
    }
}

} // namespace pl
