#include "test.h"
#include "platforms/stub/sequence_pwm_stub.h"
#include "pl/pwm/single_sequencer.h"

TEST_CASE("SingleSequencer") {
    SequencePwmStub pwm(0, "PWM0");
    REQUIRE(pwm.begin(SequencePwm::Config(), OutputPin(13)).ok());
    u16 codes[24];
    for (int i = 0; i < 24; ++i) {
        codes[i] = (i & 1) ? ONE_CODE : ZERO_CODE;
    }
    SequenceConfig config;
    config.end_delay = 4320;

    SUBCASE("start plays once and the destructor stops") {
        {
            SingleSequencer seq(pwm, codes, config);
            CHECK_FALSE(seq.started());
            REQUIRE(seq.start().ok());
            CHECK(seq.started());
            CHECK(pwm.isBusy());
            CHECK_EQ(pwm.getLastTimes(), 1);
            CHECK_EQ(pwm.getLastSequence().size(), 24u);
            CHECK_EQ(pwm.getLastSequence()[1], ONE_CODE);
            CHECK_EQ(pwm.getLastSequenceConfig().end_delay, 4320u);
            CHECK_EQ(pwm.getStopCount(), 0u);
        }
        CHECK_FALSE(pwm.isBusy());
        CHECK_EQ(pwm.getStopCount(), 1u);
    }

    SUBCASE("explicit stop is not repeated by the destructor") {
        {
            SingleSequencer seq(pwm, codes, config);
            REQUIRE(seq.start(3).ok());
            CHECK_EQ(pwm.getLastTimes(), 3);
            seq.stop();
            CHECK_FALSE(seq.started());
        }
        CHECK_EQ(pwm.getStopCount(), 1u);
    }

    SUBCASE("rejected start outputs nothing") {
        pwm.failNextStart(PwmError::INVALID_CONFIG);
        {
            SingleSequencer seq(pwm, codes, config);
            Result<void, PwmError> r = seq.start();
            CHECK_FALSE(r.ok());
            CHECK_EQ(r.error(), PwmError::INVALID_CONFIG);
            CHECK_FALSE(seq.started());
        }
        CHECK_EQ(pwm.getStartCount(), 0u);
        CHECK_EQ(pwm.getStopCount(), 0u);
    }

    SUBCASE("zero times is refused") {
        SingleSequencer seq(pwm, codes, config);
        CHECK_EQ(seq.start(0).error(), PwmError::SEQUENCE_TIMES_AT_LEAST_ONE);
        CHECK_FALSE(pwm.isBusy());
    }
}
