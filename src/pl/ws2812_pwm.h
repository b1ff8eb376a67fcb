#pragma once

/// @file ws2812_pwm.h
/// @brief WS2812 driver on a DMA-fed PWM sequencer
///
/// Colors are encoded into one PWM duty value per bit and played out by
/// the sequencer with no CPU involvement. The CPU only waits for the fixed
/// frame time, either holding the processor (write) or pumping other async
/// runners (writeAsync).
///
/// @code
/// #include "PulseLED.h"
///
/// pl::Ws2812Pwm<8> strip(*pl::platforms::getSequencePwm(0), pl::OutputPin(13));
///
/// void loop() {
///     pl::RGB8 colors[8] = {pl::RGB8::Red, pl::RGB8::Green, pl::RGB8::Blue};
///     auto result = strip.writeAsync(colors);
///     if (!result) {
///         PL_WARN("frame failed: " << pl::toString(result.error()));
///     }
/// }
/// @endcode

#include "pl/assert.h"
#include "pl/chipsets/led_timing.h"
#include "pl/int.h"
#include "pl/log.h"
#include "pl/optional.h"
#include "pl/pwm/frame_buffer.h"
#include "pl/pwm/frame_encoder.h"
#include "pl/pwm/frame_lease.h"
#include "pl/pwm/frame_waiter.h"
#include "pl/pwm/pulse_code.h"
#include "pl/pwm/sequence_pwm.h"
#include "pl/pwm/single_sequencer.h"
#include "pl/result.h"
#include "pl/rgb8.h"
#include "pl/span.h"

namespace pl {

/// Where a driver is in its write cycle.
enum class DriverState : u8 {
    kIdle,          ///< Holds the sequencer and the buffer
    kEncoding,      ///< Writing pulse codes into the buffer
    kTransmitting,  ///< Starting the sequencer
    kWaiting        ///< Frame on the wire, waiting out the frame time
};

const char *toString(DriverState state);

/// Failure of a write. Wraps whatever the sequencer reported; BUSY also
/// covers a write issued while another write on the same driver is still
/// waiting.
struct Ws2812Error {
    PwmError cause;

    Ws2812Error() : cause(PwmError::OK) {}
    explicit Ws2812Error(PwmError c) : cause(c) {}

    bool operator==(const Ws2812Error &other) const { return cause == other.cause; }
    bool operator!=(const Ws2812Error &other) const { return cause != other.cause; }
};

const char *toString(const Ws2812Error &err);

/// Sequencer configuration shared by all Ws2812Pwm instances:
/// up counter, countertop one bit period, prescaler /1, common load,
/// high drive on the low level.
SequencePwm::Config ws2812PwmConfig();

/// One pass per value, reset gap after the last one.
SequenceConfig ws2812SequenceConfig();

/// Driver for a chain of up to NUM_LEDS WS2812 LEDs on one output pin.
///
/// The frame buffer lives inside the driver, so a driver with static
/// storage duration keeps its buffer in RAM where EasyDMA can read it.
template <pl::size NUM_LEDS> class Ws2812Pwm {
  public:
    static_assert(NUM_LEDS * kBitsPerLed <= SequencePwm::kMaxSequenceLength,
                  "Ws2812Pwm: NUM_LEDS * 24 exceeds the sequencer's 0x7FFF value limit");

    typedef FrameBuffer<NUM_LEDS * kBitsPerLed> Buffer;
    typedef Result<void, Ws2812Error> WriteResult;

    static const pl::size kNumLeds = NUM_LEDS;

    /// Configures `pwm` for WS2812 output on `pin`. A sequencer that
    /// refuses the configuration halts the system.
    Ws2812Pwm(SequencePwm &pwm, OutputPin pin)
        : mState(DriverState::kIdle), mFramesSent(0), mBuffer(), mPwmSlot(&pwm),
          mBufferSlot(&mBuffer), mSequenceConfig(ws2812SequenceConfig()) {
        Result<void, PwmError> configured = configure(pwm, pin);
        if (!configured) {
            PL_FATAL("WS2812 setup failed on " << pwm.getName() << ": "
                                               << toString(configured.error()) << " ("
                                               << configured.message() << ")");
        }
        PL_LOG_WS2812(pwm.getName() << " drives " << int(NUM_LEDS) << " LEDs on pin "
                                    << pin.number);
    }

    /// The configuration step of the constructor, without the halt.
    static Result<void, PwmError> configure(SequencePwm &pwm, OutputPin pin) {
        return pwm.begin(ws2812PwmConfig(), pin);
    }

    /// Sends `colors` and returns after the frame has been latched. Holds
    /// the processor for the whole frame time.
    ///
    /// Only the first min(colors.size(), NUM_LEDS) LEDs are re-encoded; the
    /// rest of the chain receives its previous colors again.
    WriteResult write(span<const RGB8> colors) {
        return transmit<BlockingWait>(EncodeColors(colors));
    }

    /// Same as write(), but other async runners run while the frame is on
    /// the wire.
    WriteResult writeAsync(span<const RGB8> colors) {
        return transmit<CooperativeWait>(EncodeColors(colors));
    }

    /// Turns every LED in the chain off.
    WriteResult clear() { return transmit<BlockingWait>(EncodeBlack()); }

    /// Frames fully sent since construction.
    u32 framesSent() const { return mFramesSent; }

    DriverState state() const { return mState; }

    bool idle() const { return mState == DriverState::kIdle; }

    /// Encoded frame as it will be (or was last) sent.
    span<const u16> frame() const { return mBuffer.codes(); }

    /// Frame time including the reset gap.
    static u32 frameTimeMicros() { return frameDelayMicros(NUM_LEDS); }

    Ws2812Pwm(const Ws2812Pwm &) = delete;
    Ws2812Pwm &operator=(const Ws2812Pwm &) = delete;

  private:
    struct EncodeColors {
        span<const RGB8> colors;
        explicit EncodeColors(span<const RGB8> c) : colors(c) {}
        pl::size operator()(Buffer &buffer) const {
            return encodeFrame(colors, buffer.codes());
        }
    };

    struct EncodeBlack {
        pl::size operator()(Buffer &buffer) const {
            buffer.fill(ZERO_CODE);
            return NUM_LEDS;
        }
    };

    // Back to idle on every exit path, after the lease has returned the
    // sequencer and the buffer.
    struct IdleOnExit {
        DriverState &state;
        explicit IdleOnExit(DriverState &s) : state(s) {}
        ~IdleOnExit() { state = DriverState::kIdle; }
    };

    template <typename WaitPolicy, typename Encoder>
    WriteResult transmit(const Encoder &encode) {
        if (mState != DriverState::kIdle) {
            PL_WARN("WS2812 write while " << toString(mState) << ", refused");
            return WriteResult::failure(Ws2812Error(PwmError::BUSY),
                                        "frame already in flight");
        }
        IdleOnExit idleOnExit(mState);
        FrameLease<Buffer> lease(mPwmSlot, mBufferSlot);
        if (!lease.acquired()) {
            return WriteResult::failure(Ws2812Error(PwmError::BUSY),
                                        "sequencer or buffer not returned");
        }

        mState = DriverState::kEncoding;
        const pl::size encoded = encode(lease.buffer());

        mState = DriverState::kTransmitting;
        {
            SingleSequencer sequencer(lease.pwm(), lease.buffer().codes(),
                                      mSequenceConfig);
            Result<void, PwmError> started = sequencer.start(1);
            if (!started) {
                PL_LOG_WS2812("trigger failed: " << toString(started.error()));
                return WriteResult::failure(Ws2812Error(started.error()),
                                            started.message());
            }

            mState = DriverState::kWaiting;
            PL_LOG_WS2812(WaitPolicy::name() << " wait " << frameTimeMicros()
                                             << "us, " << encoded << " LEDs encoded");
            WaitPolicy::wait(frameTimeMicros());
        }

        ++mFramesSent;
        return WriteResult::success();
    }

    DriverState mState;
    u32 mFramesSent;
    Buffer mBuffer;
    Optional<SequencePwm *> mPwmSlot;
    Optional<Buffer *> mBufferSlot;
    SequenceConfig mSequenceConfig;
};

template <pl::size NUM_LEDS> const pl::size Ws2812Pwm<NUM_LEDS>::kNumLeds;

} // namespace pl
