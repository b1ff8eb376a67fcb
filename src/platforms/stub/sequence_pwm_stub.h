/// @file sequence_pwm_stub.h
/// @brief Stub/Mock PWM sequencer for testing
///
/// This header exposes the SequencePwmStub class for tests to access
/// test-specific inspection and fault injection methods.

#pragma once

#include "pl/pwm/sequence_pwm.h"

#if defined(PULSELED_TESTING) || defined(PULSELED_STUB_IMPL)

#include <vector>

namespace pl {

/// Mock sequencer for testing without real hardware.
/// A started sequence counts as playing until stop() or end() is called.
class SequencePwmStub : public SequencePwm {
  public:
    explicit SequencePwmStub(int index = -1, const char *name = "MockPWM");
    ~SequencePwmStub() override = default;

    Result<void, PwmError> begin(const Config &config, OutputPin pin) override;
    void end() override;
    Result<void, PwmError> startSingle(span<const u16> sequence,
                                       const SequenceConfig &config,
                                       u16 times) override;
    void stop() override;
    bool isBusy() const override;
    bool isInitialized() const override;
    int getIndex() const override;
    const char *getName() const override;

    // Test inspection methods
    const std::vector<u16> &getLastSequence() const;
    const SequenceConfig &getLastSequenceConfig() const;
    u16 getLastTimes() const;
    u32 getStartCount() const;
    u32 getStopCount() const;
    const Config &getConfig() const;
    OutputPin getPin() const;

    // Fault injection
    /// Makes every following begin() fail with `err`. PwmError::OK clears it.
    void rejectConfig(PwmError err);
    /// Makes the next startSingle() fail with `err` without starting.
    void failNextStart(PwmError err);

    /// Back to a freshly constructed state.
    void reset();

  private:
    int mIndex;
    const char *mName;
    bool mInitialized;
    bool mBusy;
    Config mConfig;
    OutputPin mPin;
    SequenceConfig mLastSequenceConfig;
    u16 mLastTimes;
    u32 mStartCount;
    u32 mStopCount;
    PwmError mRejectConfig;
    PwmError mFailNextStart;
    std::vector<u16> mLastSequence;
};

/// Cast SequencePwm* to SequencePwmStub* for test inspection
/// @param pwm SequencePwm pointer (must be from test environment)
inline SequencePwmStub *toStub(SequencePwm *pwm) {
    return static_cast<SequencePwmStub *>(pwm);
}

} // namespace pl

#endif // defined(PULSELED_TESTING) || defined(PULSELED_STUB_IMPL)
