#pragma once

/// @file single_sequencer.h
/// One-shot playback of a buffer on a SequencePwm.

#include "pl/int.h"
#include "pl/pwm/sequence_pwm.h"
#include "pl/result.h"
#include "pl/span.h"

namespace pl {

/// Binds a sequencer to a buffer for the lifetime of one transmission.
///
/// The sequencer and the buffer are borrowed, not owned, and must outlive
/// this object. Destroying a started SingleSequencer stops the peripheral,
/// so it must live until the output is known to have finished.
///
/// @code
/// pl::SingleSequencer seq(pwm, frame.codes(), config);
/// auto started = seq.start();
/// if (!started) { return started; }
/// pl::delayMicroseconds(frameTime);
/// // seq goes out of scope here and stops the PWM
/// @endcode
class SingleSequencer {
  public:
    SingleSequencer(SequencePwm &pwm, span<const u16> sequence,
                    const SequenceConfig &config);
    ~SingleSequencer();

    /// Plays the buffer `times` times. Returns without waiting. On failure
    /// nothing was output.
    Result<void, PwmError> start(u16 times = 1);

    /// Stops the output early. Also done by the destructor.
    void stop();

    bool started() const { return mStarted; }

    SingleSequencer(const SingleSequencer &) = delete;
    SingleSequencer &operator=(const SingleSequencer &) = delete;

  private:
    SequencePwm &mPwm;
    span<const u16> mSequence;
    SequenceConfig mConfig;
    bool mStarted;
};

} // namespace pl
