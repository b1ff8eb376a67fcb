/// @file sequence_pwm_stub.cpp
/// @brief Stub/Mock PWM sequencer implementation for testing

#if defined(PULSELED_TESTING) || defined(PULSELED_STUB_IMPL)

#include "platforms/stub/sequence_pwm_stub.h"
#include "platforms/sequence_pwm.h"
#include "pl/log.h"

namespace pl {

SequencePwmStub::SequencePwmStub(int index, const char *name)
    : mIndex(index), mName(name), mInitialized(false), mBusy(false), mConfig(),
      mPin(), mLastSequenceConfig(), mLastTimes(0), mStartCount(0),
      mStopCount(0), mRejectConfig(PwmError::OK), mFailNextStart(PwmError::OK),
      mLastSequence() {}

Result<void, PwmError> SequencePwmStub::begin(const Config &config, OutputPin pin) {
    if (mRejectConfig != PwmError::OK) {
        PL_LOG_PWM(mName << " rejecting config: " << toString(mRejectConfig));
        return Result<void, PwmError>::failure(mRejectConfig, "configuration rejected");
    }
    Result<void, PwmError> valid = validateConfig(config, pin);
    if (!valid) {
        return valid;
    }
    mConfig = config;
    mPin = pin;
    mBusy = false;
    mInitialized = true;
    PL_LOG_PWM(mName << " begin pin=" << pin.number << " top=" << config.max_duty);
    return Result<void, PwmError>::success();
}

void SequencePwmStub::end() {
    if (!mInitialized) {
        return; // Already ended - idempotent
    }
    mBusy = false;
    mInitialized = false;
    mPin = OutputPin();
}

Result<void, PwmError> SequencePwmStub::startSingle(span<const u16> sequence,
                                                    const SequenceConfig &config,
                                                    u16 times) {
    if (!mInitialized) {
        return Result<void, PwmError>::failure(PwmError::NOT_INITIALIZED,
                                               "sequencer not initialized");
    }
    if (mFailNextStart != PwmError::OK) {
        PwmError err = mFailNextStart;
        mFailNextStart = PwmError::OK;
        return Result<void, PwmError>::failure(err, "injected start failure");
    }
    Result<void, PwmError> valid = validateSequence(sequence, times);
    if (!valid) {
        return valid;
    }
    if (mBusy) {
        return Result<void, PwmError>::failure(PwmError::BUSY, "sequence already playing");
    }

    // Capture data for inspection
    mLastSequence.assign(sequence.begin(), sequence.end());
    mLastSequenceConfig = config;
    mLastTimes = times;
    mStartCount++;
    mBusy = true;
    return Result<void, PwmError>::success();
}

void SequencePwmStub::stop() {
    mBusy = false;
    mStopCount++;
}

bool SequencePwmStub::isBusy() const { return mBusy; }

bool SequencePwmStub::isInitialized() const { return mInitialized; }

int SequencePwmStub::getIndex() const { return mIndex; }

const char *SequencePwmStub::getName() const { return mName; }

const std::vector<u16> &SequencePwmStub::getLastSequence() const { return mLastSequence; }

const SequenceConfig &SequencePwmStub::getLastSequenceConfig() const {
    return mLastSequenceConfig;
}

u16 SequencePwmStub::getLastTimes() const { return mLastTimes; }

u32 SequencePwmStub::getStartCount() const { return mStartCount; }

u32 SequencePwmStub::getStopCount() const { return mStopCount; }

const SequencePwm::Config &SequencePwmStub::getConfig() const { return mConfig; }

OutputPin SequencePwmStub::getPin() const { return mPin; }

void SequencePwmStub::rejectConfig(PwmError err) { mRejectConfig = err; }

void SequencePwmStub::failNextStart(PwmError err) { mFailNextStart = err; }

void SequencePwmStub::reset() {
    mInitialized = false;
    mBusy = false;
    mConfig = Config();
    mPin = OutputPin();
    mLastSequenceConfig = SequenceConfig();
    mLastTimes = 0;
    mStartCount = 0;
    mStopCount = 0;
    mRejectConfig = PwmError::OK;
    mFailNextStart = PwmError::OK;
    mLastSequence.clear();
}

// ============================================================================
// Factory Implementation
// ============================================================================

namespace platforms {

int sequencePwmCount() { return 4; }

SequencePwm *getSequencePwm(int index) {
    // Mirrors the four PWM instances of an nRF52840.
    static SequencePwmStub pwm0(0, "PWM0");
    static SequencePwmStub pwm1(1, "PWM1");
    static SequencePwmStub pwm2(2, "PWM2");
    static SequencePwmStub pwm3(3, "PWM3");
    switch (index) {
    case 0:
        return &pwm0;
    case 1:
        return &pwm1;
    case 2:
        return &pwm2;
    case 3:
        return &pwm3;
    default:
        return nullptr;
    }
}

} // namespace platforms

} // namespace pl

#endif // defined(PULSELED_TESTING) || defined(PULSELED_STUB_IMPL)
