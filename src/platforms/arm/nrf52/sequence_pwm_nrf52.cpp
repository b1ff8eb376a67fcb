/// @file sequence_pwm_nrf52.cpp
/// @brief nRF52 PWMn sequencer driven through EasyDMA

#include "platforms/arm/nrf52/sequence_pwm_nrf52.h"

#if defined(NRF52_SERIES) && !defined(PULSELED_STUB_IMPL)

#include "platforms/sequence_pwm.h"
#include "pl/log.h"

namespace pl {

namespace {

const u32 kPselDisconnected = 0xFFFFFFFFUL;

// STOP is acknowledged within one PWM period; bound the spin in case the
// peripheral was never started.
const u32 kStopSpinLimit = 100000;

} // namespace

SequencePwmNrf52::SequencePwmNrf52(NRF_PWM_Type *regs, int index, const char *name)
    : mRegs(regs), mIndex(index), mName(name), mPin(), mInitialized(false),
      mStarted(false) {}

SequencePwmNrf52::~SequencePwmNrf52() { end(); }

bool SequencePwmNrf52::inDataRam(const void *ptr) {
    const uptr addr = reinterpret_cast<uptr>(ptr);
    return (addr & PULSELED_NRF52_RAM_MASK) == PULSELED_NRF52_RAM_BASE;
}

nrf_gpio_pin_drive_t SequencePwmNrf52::toGpioDrive(OutputDrive drive) {
    switch (drive) {
    case OutputDrive::HIGH_DRIVE_0_STANDARD_1:
        return NRF_GPIO_PIN_H0S1;
    case OutputDrive::STANDARD_0_HIGH_DRIVE_1:
        return NRF_GPIO_PIN_S0H1;
    case OutputDrive::HIGH_DRIVE:
        return NRF_GPIO_PIN_H0H1;
    case OutputDrive::STANDARD:
        break;
    }
    return NRF_GPIO_PIN_S0S1;
}

Result<void, PwmError> SequencePwmNrf52::begin(const Config &config, OutputPin pin) {
    Result<void, PwmError> valid = validateConfig(config, pin);
    if (!valid) {
        return valid;
    }
    if (mInitialized) {
        end();
    }

    // Idle low, then hand the pin to the peripheral.
    nrf_gpio_pin_clear(static_cast<u32>(pin.number));
    nrf_gpio_cfg(static_cast<u32>(pin.number), NRF_GPIO_PIN_DIR_OUTPUT,
                 NRF_GPIO_PIN_INPUT_DISCONNECT, NRF_GPIO_PIN_NOPULL,
                 toGpioDrive(config.drive), NRF_GPIO_PIN_NOSENSE);

    mRegs->PSEL.OUT[0] = static_cast<u32>(pin.number);
    mRegs->PSEL.OUT[1] = kPselDisconnected;
    mRegs->PSEL.OUT[2] = kPselDisconnected;
    mRegs->PSEL.OUT[3] = kPselDisconnected;

    mRegs->ENABLE = PWM_ENABLE_ENABLE_Enabled << PWM_ENABLE_ENABLE_Pos;
    mRegs->MODE = (config.counter_mode == CounterMode::UP ? PWM_MODE_UPDOWN_Up
                                                          : PWM_MODE_UPDOWN_UpAndDown)
                  << PWM_MODE_UPDOWN_Pos;
    mRegs->PRESCALER = static_cast<u32>(config.prescaler) << PWM_PRESCALER_PRESCALER_Pos;
    mRegs->COUNTERTOP = static_cast<u32>(config.max_duty) << PWM_COUNTERTOP_COUNTERTOP_Pos;
    mRegs->DECODER = (static_cast<u32>(config.sequence_load) << PWM_DECODER_LOAD_Pos) |
                     (PWM_DECODER_MODE_RefreshCount << PWM_DECODER_MODE_Pos);
    mRegs->LOOP = PWM_LOOP_CNT_Disabled << PWM_LOOP_CNT_Pos;
    mRegs->SHORTS = 0;
    mRegs->INTENCLR = 0xFFFFFFFFUL;

    for (int i = 0; i < 2; ++i) {
        mRegs->SEQ[i].PTR = 0;
        mRegs->SEQ[i].CNT = 0;
        mRegs->SEQ[i].REFRESH = 0;
        mRegs->SEQ[i].ENDDELAY = 0;
    }
    mRegs->EVENTS_STOPPED = 0;

    mPin = pin;
    mInitialized = true;
    mStarted = false;
    PL_LOG_PWM(mName << " begin pin=" << pin.number << " top=" << config.max_duty);
    return Result<void, PwmError>::success();
}

void SequencePwmNrf52::end() {
    if (!mInitialized) {
        return;
    }
    stop();
    mRegs->ENABLE = PWM_ENABLE_ENABLE_Disabled << PWM_ENABLE_ENABLE_Pos;
    mRegs->PSEL.OUT[0] = kPselDisconnected;
    nrf_gpio_cfg_default(static_cast<u32>(mPin.number));
    mPin = OutputPin();
    mInitialized = false;
}

Result<void, PwmError> SequencePwmNrf52::startSingle(span<const u16> sequence,
                                                     const SequenceConfig &config,
                                                     u16 times) {
    if (!mInitialized) {
        return Result<void, PwmError>::failure(PwmError::NOT_INITIALIZED,
                                               "sequencer not initialized");
    }
    Result<void, PwmError> valid = validateSequence(sequence, times);
    if (!valid) {
        return valid;
    }
    if (!inDataRam(sequence.data())) {
        return Result<void, PwmError>::failure(PwmError::BUFFER_NOT_IN_RAM,
                                               "EasyDMA cannot read this buffer");
    }
    if (isBusy()) {
        return Result<void, PwmError>::failure(PwmError::BUSY,
                                               "sequence already playing");
    }

    const u32 ptr = static_cast<u32>(reinterpret_cast<uptr>(sequence.data()));
    const u32 cnt = static_cast<u32>(sequence.size());

    // Both sequence slots play the same buffer so loop counts above one
    // simply alternate between them.
    for (int i = 0; i < 2; ++i) {
        mRegs->SEQ[i].PTR = ptr;
        mRegs->SEQ[i].CNT = cnt;
        mRegs->SEQ[i].REFRESH = config.refresh;
        mRegs->SEQ[i].ENDDELAY = config.end_delay;
    }

    // One pass: no looping, stop at the end of SEQ[0].
    // Even n: n/2 loops of SEQ[0]+SEQ[1].
    // Odd n: start on SEQ[1], which counts as half a loop.
    int start = 0;
    if (times == 1) {
        mRegs->LOOP = PWM_LOOP_CNT_Disabled << PWM_LOOP_CNT_Pos;
        mRegs->SHORTS = PWM_SHORTS_SEQEND0_STOP_Msk;
    } else if ((times & 1) == 0) {
        mRegs->LOOP = static_cast<u32>(times / 2) << PWM_LOOP_CNT_Pos;
        mRegs->SHORTS = PWM_SHORTS_LOOPSDONE_STOP_Msk;
    } else {
        mRegs->LOOP = static_cast<u32>(times / 2 + 1) << PWM_LOOP_CNT_Pos;
        mRegs->SHORTS = PWM_SHORTS_LOOPSDONE_STOP_Msk;
        start = 1;
    }

    mRegs->EVENTS_STOPPED = 0;
    mRegs->EVENTS_SEQEND[0] = 0;
    mRegs->EVENTS_SEQEND[1] = 0;
    mRegs->EVENTS_LOOPSDONE = 0;

    // Registers above must land before the DMA engine starts reading.
    __DSB();
    mRegs->TASKS_SEQSTART[start] = 1;
    mStarted = true;
    PL_LOG_PWM(mName << " start cnt=" << cnt << " times=" << times);
    return Result<void, PwmError>::success();
}

void SequencePwmNrf52::stop() {
    if (!mStarted) {
        return;
    }
    if (!mRegs->EVENTS_STOPPED) {
        mRegs->TASKS_STOP = 1;
        for (u32 i = 0; i < kStopSpinLimit && !mRegs->EVENTS_STOPPED; ++i) {
        }
        PL_WARN_IF(!mRegs->EVENTS_STOPPED, mName << " did not acknowledge STOP");
    }
    mRegs->EVENTS_STOPPED = 0;
    mRegs->SHORTS = 0;
    mStarted = false;
}

bool SequencePwmNrf52::isBusy() const { return mStarted && !mRegs->EVENTS_STOPPED; }

bool SequencePwmNrf52::isInitialized() const { return mInitialized; }

int SequencePwmNrf52::getIndex() const { return mIndex; }

const char *SequencePwmNrf52::getName() const { return mName; }

// ============================================================================
// Factory Implementation
// ============================================================================

namespace platforms {

int sequencePwmCount() {
#if defined(NRF_PWM3)
    return 4;
#elif defined(NRF_PWM2)
    return 3;
#elif defined(NRF_PWM1)
    return 2;
#else
    return 1;
#endif
}

SequencePwm *getSequencePwm(int index) {
    static SequencePwmNrf52 pwm0(NRF_PWM0, 0, "PWM0");
#if defined(NRF_PWM1)
    static SequencePwmNrf52 pwm1(NRF_PWM1, 1, "PWM1");
#endif
#if defined(NRF_PWM2)
    static SequencePwmNrf52 pwm2(NRF_PWM2, 2, "PWM2");
#endif
#if defined(NRF_PWM3)
    static SequencePwmNrf52 pwm3(NRF_PWM3, 3, "PWM3");
#endif
    switch (index) {
    case 0:
        return &pwm0;
#if defined(NRF_PWM1)
    case 1:
        return &pwm1;
#endif
#if defined(NRF_PWM2)
    case 2:
        return &pwm2;
#endif
#if defined(NRF_PWM3)
    case 3:
        return &pwm3;
#endif
    default:
        return nullptr;
    }
}

} // namespace platforms

} // namespace pl

#endif // NRF52_SERIES && !PULSELED_STUB_IMPL
