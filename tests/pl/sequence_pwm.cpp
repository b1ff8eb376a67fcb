#include "test.h"
#include "platforms/sequence_pwm.h"
#include "platforms/stub/sequence_pwm_stub.h"

TEST_CASE("toString(PwmError)") {
    CHECK_EQ(std::string(toString(PwmError::OK)), "OK");
    CHECK_EQ(std::string(toString(PwmError::SEQUENCE_TOO_LONG)), "SEQUENCE_TOO_LONG");
    CHECK_EQ(std::string(toString(PwmError::BUFFER_NOT_IN_RAM)), "BUFFER_NOT_IN_RAM");
    CHECK_EQ(std::string(toString(PwmError::BUSY)), "BUSY");
    CHECK_EQ(std::string(toString(PwmError::INVALID_CONFIG)), "INVALID_CONFIG");
    CHECK_EQ(std::string(toString(PwmError::NOT_INITIALIZED)), "NOT_INITIALIZED");
}

TEST_CASE("validateConfig") {
    SequencePwm::Config config;

    SUBCASE("defaults are valid") {
        CHECK(validateConfig(config, OutputPin(13)).ok());
    }
    SUBCASE("countertop limits") {
        config.max_duty = 3;
        CHECK(validateConfig(config, OutputPin(13)).ok());
        config.max_duty = 0x7FFF;
        CHECK(validateConfig(config, OutputPin(13)).ok());
        config.max_duty = 2;
        CHECK_EQ(validateConfig(config, OutputPin(13)).error(), PwmError::INVALID_CONFIG);
        config.max_duty = 0x8000;
        CHECK_EQ(validateConfig(config, OutputPin(13)).error(), PwmError::INVALID_CONFIG);
    }
    SUBCASE("missing pin") {
        Result<void, PwmError> r = validateConfig(config, OutputPin());
        CHECK_FALSE(r.ok());
        CHECK_EQ(r.error(), PwmError::INVALID_CONFIG);
        CHECK(std::string(r.message()).size() > 0);
    }
}

TEST_CASE("validateSequence") {
    u16 values[4] = {1, 2, 3, 4};

    CHECK(validateSequence(values, 1).ok());
    CHECK(validateSequence(values, 5).ok());
    CHECK_EQ(validateSequence(values, 0).error(), PwmError::SEQUENCE_TIMES_AT_LEAST_ONE);
    CHECK_EQ(validateSequence(span<const u16>(), 1).error(), PwmError::INVALID_CONFIG);

    // Length is checked before anything reads the data.
    span<const u16> huge(values, 0x8000);
    CHECK_EQ(validateSequence(huge, 1).error(), PwmError::SEQUENCE_TOO_LONG);
    span<const u16> largest(values, 0x7FFF);
    CHECK(validateSequence(largest, 1).ok());
}

TEST_CASE("platforms::getSequencePwm") {
    CHECK_EQ(platforms::sequencePwmCount(), 4);
    for (int i = 0; i < platforms::sequencePwmCount(); ++i) {
        SequencePwm *pwm = platforms::getSequencePwm(i);
        REQUIRE(pwm != nullptr);
        CHECK_EQ(pwm->getIndex(), i);
    }
    CHECK_EQ(std::string(platforms::getSequencePwm(0)->getName()), "PWM0");
    CHECK(platforms::getSequencePwm(-1) == nullptr);
    CHECK(platforms::getSequencePwm(4) == nullptr);
    // Same instance every time.
    CHECK(platforms::getSequencePwm(1) == platforms::getSequencePwm(1));
}

TEST_CASE("SequencePwmStub") {
    SequencePwmStub stub(7, "TestPWM");
    u16 values[3] = {0x8006, 0x800D, 0x8006};
    SequenceConfig seqConfig;
    seqConfig.end_delay = 4320;

    SUBCASE("identity") {
        CHECK_EQ(stub.getIndex(), 7);
        CHECK_EQ(std::string(stub.getName()), "TestPWM");
        CHECK_FALSE(stub.isInitialized());
        CHECK_FALSE(stub.isBusy());
    }

    SUBCASE("start before begin") {
        CHECK_EQ(stub.startSingle(values, seqConfig, 1).error(), PwmError::NOT_INITIALIZED);
        CHECK_EQ(stub.getStartCount(), 0u);
    }

    SUBCASE("begin records pin and config") {
        SequencePwm::Config config;
        config.max_duty = 20;
        config.prescaler = Prescaler::DIV_1;
        config.drive = OutputDrive::HIGH_DRIVE_0_STANDARD_1;
        REQUIRE(stub.begin(config, OutputPin(13)).ok());
        CHECK(stub.isInitialized());
        CHECK_EQ(stub.getPin().number, 13);
        CHECK_EQ(stub.getConfig().max_duty, 20);
        CHECK(stub.getConfig().prescaler == Prescaler::DIV_1);
        CHECK(stub.getConfig().drive == OutputDrive::HIGH_DRIVE_0_STANDARD_1);

        stub.end();
        CHECK_FALSE(stub.isInitialized());
        CHECK_FALSE(stub.getPin().valid());
        stub.end(); // idempotent
    }

    SUBCASE("begin rejects invalid configuration") {
        SequencePwm::Config config;
        config.max_duty = 1;
        CHECK_EQ(stub.begin(config, OutputPin(13)).error(), PwmError::INVALID_CONFIG);
        CHECK_FALSE(stub.isInitialized());
    }

    SUBCASE("rejectConfig") {
        stub.rejectConfig(PwmError::INVALID_CONFIG);
        CHECK_EQ(stub.begin(SequencePwm::Config(), OutputPin(13)).error(),
                 PwmError::INVALID_CONFIG);
        stub.rejectConfig(PwmError::OK);
        CHECK(stub.begin(SequencePwm::Config(), OutputPin(13)).ok());
    }

    SUBCASE("startSingle captures the sequence") {
        REQUIRE(stub.begin(SequencePwm::Config(), OutputPin(2)).ok());
        REQUIRE(stub.startSingle(values, seqConfig, 1).ok());
        CHECK(stub.isBusy());
        CHECK_EQ(stub.getStartCount(), 1u);
        CHECK_EQ(stub.getLastTimes(), 1);
        CHECK_EQ(stub.getLastSequenceConfig().end_delay, 4320u);
        CHECK_EQ(stub.getLastSequenceConfig().refresh, 0u);
        REQUIRE_EQ(stub.getLastSequence().size(), 3u);
        CHECK_EQ(stub.getLastSequence()[1], 0x800D);

        SUBCASE("busy until stopped") {
            CHECK_EQ(stub.startSingle(values, seqConfig, 1).error(), PwmError::BUSY);
            CHECK_EQ(stub.getStartCount(), 1u);
            stub.stop();
            CHECK_FALSE(stub.isBusy());
            CHECK_EQ(stub.getStopCount(), 1u);
            CHECK(stub.startSingle(values, seqConfig, 4).ok());
            CHECK_EQ(stub.getLastTimes(), 4);
        }
    }

    SUBCASE("failNextStart fails exactly once") {
        REQUIRE(stub.begin(SequencePwm::Config(), OutputPin(2)).ok());
        stub.failNextStart(PwmError::BUSY);
        CHECK_EQ(stub.startSingle(values, seqConfig, 1).error(), PwmError::BUSY);
        CHECK_FALSE(stub.isBusy());
        CHECK_EQ(stub.getStartCount(), 0u);
        CHECK(stub.getLastSequence().empty());
        CHECK(stub.startSingle(values, seqConfig, 1).ok());
    }

    SUBCASE("reset") {
        REQUIRE(stub.begin(SequencePwm::Config(), OutputPin(2)).ok());
        REQUIRE(stub.startSingle(values, seqConfig, 1).ok());
        stub.reset();
        CHECK_FALSE(stub.isInitialized());
        CHECK_FALSE(stub.isBusy());
        CHECK_EQ(stub.getStartCount(), 0u);
        CHECK(stub.getLastSequence().empty());
    }
}
