#pragma once

/// @file sequence_pwm.h
/// @brief Platform-agnostic interface to a DMA-fed PWM sequencer
///
/// A sequencer plays a buffer of 16-bit duty values out of RAM, one value
/// per PWM period, without CPU involvement. Platform implementations
/// (nRF52 PWMn, the host stub) inherit from SequencePwm.
///
/// **Implementation Notes:**
/// - nRF52: EasyDMA reads SEQ[0] straight from RAM; a value's bit 15 picks
///   the edge polarity, bits 0..14 the compare value.
/// - Stub: records every started sequence for test inspection.

#include "pl/int.h"
#include "pl/result.h"
#include "pl/span.h"

namespace pl {

/// Errors reported by a sequencer
enum class PwmError : u8 {
    OK = 0,
    SEQUENCE_TOO_LONG,            ///< More values than the DMA counter can hold
    BUFFER_NOT_IN_RAM,            ///< EasyDMA cannot read flash
    SEQUENCE_TIMES_AT_LEAST_ONE,  ///< A sequence must play at least once
    BUSY,                         ///< A sequence is already playing
    INVALID_CONFIG,               ///< Configuration rejected by the peripheral
    NOT_INITIALIZED               ///< begin() has not succeeded
};

/// Human readable name for logs.
const char *toString(PwmError err);

/// Period counter behaviour
enum class CounterMode : u8 {
    UP,          ///< Edge-aligned
    UP_AND_DOWN  ///< Center-aligned
};

/// PWM base clock divider applied to the 16 MHz source
enum class Prescaler : u8 {
    DIV_1 = 0,
    DIV_2,
    DIV_4,
    DIV_8,
    DIV_16,
    DIV_32,
    DIV_64,
    DIV_128
};

/// How values in the sequence buffer map onto the channels
enum class SequenceLoad : u8 {
    COMMON,      ///< One value drives every channel
    GROUPED,     ///< Two values, channels (0,1) and (2,3)
    INDIVIDUAL,  ///< Four values, one per channel
    WAVEFORM     ///< Three values plus a per-period countertop
};

/// Pin drive strength for the low (0) and high (1) levels
enum class OutputDrive : u8 {
    STANDARD,                   ///< S0S1
    HIGH_DRIVE_0_STANDARD_1,    ///< H0S1
    STANDARD_0_HIGH_DRIVE_1,    ///< S0H1
    HIGH_DRIVE                  ///< H0H1
};

/// A GPIO able to drive the PWM output. On nRF52 the number is
/// port * 32 + pin, so P0.13 is 13 and P1.02 is 34.
struct OutputPin {
    int number;

    explicit OutputPin(int n = -1) : number(n) {}
    bool valid() const { return number >= 0; }
};

/// Per-sequence timing
struct SequenceConfig {
    /// Extra PWM periods each value is held for (0 = one period per value).
    u32 refresh;
    /// PWM periods of idle output after the last value.
    u32 end_delay;

    SequenceConfig() : refresh(0), end_delay(0) {}
};

/// Abstract interface for platform-specific PWM sequencers
class SequencePwm {
  public:
    /// Largest sequence the DMA counter accepts, in values.
    static const pl::size kMaxSequenceLength = 0x7FFF;
    /// Legal countertop (max_duty) range.
    static const u16 kMinCountertop = 3;
    static const u16 kMaxCountertop = 0x7FFF;

    /// Platform-agnostic configuration structure
    struct Config {
        CounterMode counter_mode;
        u16 max_duty;  ///< Countertop, PWM clock ticks per period
        Prescaler prescaler;
        SequenceLoad sequence_load;
        OutputDrive drive;

        Config()
            : counter_mode(CounterMode::UP), max_duty(1000),
              prescaler(Prescaler::DIV_16), sequence_load(SequenceLoad::COMMON),
              drive(OutputDrive::STANDARD) {}
    };

    virtual ~SequencePwm() = default;

    /// Configures the peripheral and routes channel 0 to `pin`. The output
    /// idles low until a sequence is started.
    virtual Result<void, PwmError> begin(const Config &config, OutputPin pin) = 0;

    /// Stops output and releases the pin.
    virtual void end() = 0;

    /// Plays `sequence` `times` times, then stops. Returns without waiting
    /// for the output to finish. `sequence` must stay alive and unmodified
    /// until the output has finished or stop() is called.
    virtual Result<void, PwmError> startSingle(span<const u16> sequence,
                                               const SequenceConfig &config,
                                               u16 times) = 0;

    /// Stops any sequence in progress.
    virtual void stop() = 0;

    virtual bool isBusy() const = 0;

    virtual bool isInitialized() const = 0;

    /// Peripheral instance number (PWM0 -> 0).
    virtual int getIndex() const = 0;

    /// Human-readable peripheral name, e.g. "PWM0".
    virtual const char *getName() const = 0;
};

/// Checks a configuration against the hardware limits shared by all
/// sequencer implementations.
Result<void, PwmError> validateConfig(const SequencePwm::Config &config, OutputPin pin);

/// Checks a sequence against the DMA limits. Does not check RAM placement,
/// which is platform specific.
Result<void, PwmError> validateSequence(span<const u16> sequence, u16 times);

} // namespace pl
