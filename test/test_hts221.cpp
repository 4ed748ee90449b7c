// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
#include <gtest/gtest.h>
#include "drivers/hts221.h"
#include "fake_bus.h"

using namespace sensehub::drivers;
using sensehub::test::FakeBus;
using sensehub::test::Transfer;

constexpr uint8_t kAddr = kHts221Addr;
constexpr float kTol = 1e-3f;

class Hts221Test : public ::testing::Test {
protected:
    void SetUp() override {
        bus.setRegister(kAddr, 0x0F, kHts221WhoAmI);

        // Humidity: 20 %rH at 0 counts, 80 %rH at 6000 counts
        bus.setRegister(kAddr, 0x30, 40);
        bus.setRegister(kAddr, 0x31, 160);
        bus.setInt16(kAddr, 0x36, 0);
        bus.setInt16(kAddr, 0x3A, 6000);

        // Temperature: 10 C at 0 counts, 30 C at 1000 counts
        bus.setRegister(kAddr, 0x32, 80);
        bus.setRegister(kAddr, 0x33, 240);
        bus.setRegister(kAddr, 0x35, 0x00);
        bus.setInt16(kAddr, 0x3C, 0);
        bus.setInt16(kAddr, 0x3E, 1000);
    }

    FakeBus bus;
};

// ============================================================================
// Initialization and Calibration
// ============================================================================

TEST_F(Hts221Test, InitConfiguresAndLoadsCalibration) {
    Hts221 hygro(&bus);
    ASSERT_EQ(hygro.init(), SensorError::OK);
    EXPECT_TRUE(hygro.initiated());

    std::vector<Transfer> writes = bus.writes();
    ASSERT_EQ(writes.size(), 2u);
    EXPECT_EQ(writes[0].reg, 0x20); EXPECT_EQ(writes[0].value, 0x87);
    EXPECT_EQ(writes[1].reg, 0x10); EXPECT_EQ(writes[1].value, 0x1B);

    Hts221Calibration cal;
    ASSERT_TRUE(hygro.getCalibration(cal));
    EXPECT_NEAR(cal.humidity_m, 0.01f, 1e-6f);
    EXPECT_NEAR(cal.humidity_c, 20.0f, kTol);
    EXPECT_NEAR(cal.temperature_m, 0.02f, 1e-6f);
    EXPECT_NEAR(cal.temperature_c, 10.0f, kTol);
}

TEST_F(Hts221Test, TemperatureCalibrationUsesMsbBits) {
    // T0 = 0x100 / 8 = 32 C, T1 = (0x100 | 80) / 8 = 42 C
    bus.setRegister(kAddr, 0x32, 0x00);
    bus.setRegister(kAddr, 0x33, 80);
    bus.setRegister(kAddr, 0x35, 0x05);
    bus.setInt16(kAddr, 0x3C, -500);
    bus.setInt16(kAddr, 0x3E, 500);

    Hts221 hygro(&bus);
    ASSERT_EQ(hygro.init(), SensorError::OK);

    bus.setRegister(kAddr, 0x27, 0x01);
    bus.setInt16(kAddr, 0x2A, -500);
    bool newSample = false;
    ASSERT_EQ(hygro.update(newSample), SensorError::OK);
    EXPECT_NEAR(hygro.readings().temperature_c, 32.0f, kTol);

    bus.setInt16(kAddr, 0x2A, 500);
    ASSERT_EQ(hygro.update(newSample), SensorError::OK);
    EXPECT_NEAR(hygro.readings().temperature_c, 42.0f, kTol);
}

TEST_F(Hts221Test, WrongIdentityFaults) {
    bus.setRegister(kAddr, 0x0F, 0xBD);
    Hts221 hygro(&bus);

    EXPECT_EQ(hygro.init(), SensorError::ERR_IDENTITY_MISMATCH);
    EXPECT_EQ(hygro.getObservedId(), 0xBD);
    EXPECT_EQ(hygro.getState(), DeviceState::FAULTED);
}

TEST_F(Hts221Test, CalibrationReadFailureFaults) {
    bus.failRead(kAddr, 0x3A);
    Hts221 hygro(&bus);

    EXPECT_EQ(hygro.init(), SensorError::ERR_READ);
    EXPECT_EQ(hygro.getState(), DeviceState::FAULTED);

    Hts221Calibration cal;
    EXPECT_FALSE(hygro.getCalibration(cal));
}

TEST_F(Hts221Test, DegenerateCalibrationIsConfigurationError) {
    bus.setInt16(kAddr, 0x3A, 0);
    Hts221 hygro(&bus);

    EXPECT_EQ(hygro.init(), SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(hygro.getState(), DeviceState::FAULTED);
    EXPECT_STRNE(hygro.lastError(), "");
}

// ============================================================================
// Acquisition
// ============================================================================

TEST_F(Hts221Test, ConvertsHumidityAndTemperature) {
    Hts221 hygro(&bus);
    ASSERT_EQ(hygro.init(), SensorError::OK);

    bus.setRegister(kAddr, 0x27, 0x03);
    bus.setInt16(kAddr, 0x28, 3000);
    bus.setInt16(kAddr, 0x2A, 500);

    bool newSample = false;
    ASSERT_EQ(hygro.update(newSample), SensorError::OK);
    ASSERT_TRUE(newSample);

    const SensorReading& r = hygro.readings();
    EXPECT_TRUE(r.humidity_valid);
    EXPECT_TRUE(r.temperature_valid);
    EXPECT_NEAR(r.humidity_rh, 50.0f, kTol);
    EXPECT_NEAR(r.temperature_c, 20.0f, kTol);
}

TEST_F(Hts221Test, NotReadyIssuesNoDataRead) {
    Hts221 hygro(&bus);
    ASSERT_EQ(hygro.init(), SensorError::OK);
    bus.setRegister(kAddr, 0x27, 0x00);

    bool newSample = true;
    EXPECT_EQ(hygro.update(newSample), SensorError::OK);
    EXPECT_FALSE(newSample);
    EXPECT_EQ(bus.countReads(kAddr, 0x80 | 0x28), 0u);
    EXPECT_EQ(bus.countReads(kAddr, 0x80 | 0x2A), 0u);
}

TEST_F(Hts221Test, StatusReadFailureIsReadError) {
    Hts221 hygro(&bus);
    ASSERT_EQ(hygro.init(), SensorError::OK);
    bus.failRead(kAddr, 0x27);

    bool newSample = true;
    EXPECT_EQ(hygro.update(newSample), SensorError::ERR_READ);
    EXPECT_FALSE(newSample);
    EXPECT_TRUE(hygro.initiated());
}
