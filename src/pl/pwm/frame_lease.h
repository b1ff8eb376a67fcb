#pragma once

/// @file frame_lease.h
/// Scoped hand-off of a driver's sequencer and frame buffer.

#include "pl/optional.h"
#include "pl/pwm/sequence_pwm.h"

namespace pl {

/// Moves the sequencer and buffer out of a driver's slots for the length
/// of one frame and moves them back when destroyed, whichever way the
/// frame ended.
///
/// While a lease is alive both slots are empty. A second lease on the same
/// slots therefore acquires nothing, which is how an overlapping write is
/// detected: there is simply nothing left to borrow.
template <typename BUFFER> class FrameLease {
  public:
    FrameLease(Optional<SequencePwm *> &pwmSlot, Optional<BUFFER *> &bufferSlot)
        : mPwmSlot(pwmSlot), mBufferSlot(bufferSlot) {
        if (pwmSlot && bufferSlot) {
            mPwm = pwmSlot.take();
            mBuffer = bufferSlot.take();
        }
    }

    ~FrameLease() {
        if (mPwm) {
            mPwmSlot = mPwm.take();
        }
        if (mBuffer) {
            mBufferSlot = mBuffer.take();
        }
    }

    bool acquired() const { return mPwm && mBuffer; }

    SequencePwm &pwm() { return **mPwm; }
    BUFFER &buffer() { return **mBuffer; }

    FrameLease(const FrameLease &) = delete;
    FrameLease &operator=(const FrameLease &) = delete;

  private:
    Optional<SequencePwm *> &mPwmSlot;
    Optional<BUFFER *> &mBufferSlot;
    Optional<SequencePwm *> mPwm;
    Optional<BUFFER *> mBuffer;
};

} // namespace pl
