#pragma once

/// @file sequence_pwm_nrf52.h
/// @brief nRF52 PWMn implementation of SequencePwm
///
/// Only channel 0 is routed to a pin; the decoder is free to use any load
/// mode, but WS2812 output uses COMMON so every value is one bit period.

#include "pl/pwm/sequence_pwm.h"

#if defined(NRF52_SERIES) && !defined(PULSELED_STUB_IMPL)

#include "platforms/arm/nrf52/led_sysdefs_arm_nrf52.h"

namespace pl {

class SequencePwmNrf52 : public SequencePwm {
  public:
    SequencePwmNrf52(NRF_PWM_Type *regs, int index, const char *name);
    ~SequencePwmNrf52() override;

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

    SequencePwmNrf52(const SequencePwmNrf52 &) = delete;
    SequencePwmNrf52 &operator=(const SequencePwmNrf52 &) = delete;

  private:
    static bool inDataRam(const void *ptr);
    static nrf_gpio_pin_drive_t toGpioDrive(OutputDrive drive);

    NRF_PWM_Type *mRegs;
    int mIndex;
    const char *mName;
    OutputPin mPin;
    bool mInitialized;
    bool mStarted;
};

} // namespace pl

#endif // NRF52_SERIES && !PULSELED_STUB_IMPL
