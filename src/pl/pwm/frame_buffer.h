#pragma once

/// @file frame_buffer.h
/// Statically sized storage for one encoded WS2812 frame.

#include "pl/int.h"
#include "pl/pwm/pulse_code.h"
#include "pl/span.h"

namespace pl {

/// Holds SLOTS pulse codes, 24 per LED. The storage is a plain member array
/// so a FrameBuffer with static storage duration lands in RAM, where the
/// sequencer's EasyDMA can read it.
template <pl::size SLOTS> class FrameBuffer {
  public:
    static_assert(SLOTS > 0, "FrameBuffer needs at least one LED");
    static_assert(SLOTS % kBitsPerLed == 0,
                  "FrameBuffer capacity must be a multiple of 24 slots");

    static const pl::size kSlots = SLOTS;
    static const pl::size kLeds = SLOTS / kBitsPerLed;

    FrameBuffer() { fill(0); }

    span<PulseCode> codes() { return span<PulseCode>(mCodes, SLOTS); }
    span<const PulseCode> codes() const {
        return span<const PulseCode>(mCodes, SLOTS);
    }

    void fill(PulseCode code) {
        for (pl::size i = 0; i < SLOTS; ++i) {
            mCodes[i] = code;
        }
    }

    PulseCode &operator[](pl::size i) { return mCodes[i]; }
    const PulseCode &operator[](pl::size i) const { return mCodes[i]; }

    pl::size size() const { return SLOTS; }
    pl::size leds() const { return kLeds; }

    FrameBuffer(const FrameBuffer &) = delete;
    FrameBuffer &operator=(const FrameBuffer &) = delete;

  private:
    PulseCode mCodes[SLOTS];
};

template <pl::size SLOTS> const pl::size FrameBuffer<SLOTS>::kSlots;
template <pl::size SLOTS> const pl::size FrameBuffer<SLOTS>::kLeds;

} // namespace pl
