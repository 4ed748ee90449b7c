// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
#include <gtest/gtest.h>
#include "drivers/lsm9ds1_codec.h"

using namespace sensehub::drivers;
using namespace sensehub::drivers::lsm9ds1;

constexpr float kDegToRad = 0.017453292519943295f;

// ============================================================================
// Gyro CTRL_REG1_G
// ============================================================================

TEST(Lsm9ds1CodecTest, GyroRatesMapToNominalHz) {
    const uint8_t expectedOdr[] = {0x20, 0x40, 0x60, 0x80, 0xA0, 0xC0};
    const uint16_t expectedHz[] = {15, 60, 119, 238, 476, 952};

    for (uint8_t code = 0; code < 6; code++) {
        GyroCtrlValue v{};
        ASSERT_EQ(encodeGyroCtrl(static_cast<GyroSampleRate>(code), GyroBandwidth::BW_CODE_0,
                                 GyroFullScale::RANGE_250DPS, v),
                  SensorError::OK) << "code " << static_cast<int>(code);
        EXPECT_EQ(v.ctrl1, expectedOdr[code]);
        EXPECT_EQ(v.sample_rate_hz, expectedHz[code]);
        EXPECT_EQ(gyroSampleRateHz(static_cast<GyroSampleRate>(code)), expectedHz[code]);
    }
}

TEST(Lsm9ds1CodecTest, GyroBandwidthAndFullScaleBits) {
    GyroCtrlValue v{};
    ASSERT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_119HZ, GyroBandwidth::BW_CODE_1,
                             GyroFullScale::RANGE_500DPS, v), SensorError::OK);
    EXPECT_EQ(v.ctrl1, 0x69);

    ASSERT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_952HZ, GyroBandwidth::BW_CODE_3,
                             GyroFullScale::RANGE_2000DPS, v), SensorError::OK);
    EXPECT_EQ(v.ctrl1, 0xDB);
}

TEST(Lsm9ds1CodecTest, GyroScaleIsRadiansPerLsb) {
    GyroCtrlValue v{};
    ASSERT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_59_5HZ, GyroBandwidth::BW_CODE_0,
                             GyroFullScale::RANGE_250DPS, v), SensorError::OK);
    EXPECT_FLOAT_EQ(v.scale, 0.00875f * kDegToRad);

    ASSERT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_59_5HZ, GyroBandwidth::BW_CODE_0,
                             GyroFullScale::RANGE_500DPS, v), SensorError::OK);
    EXPECT_FLOAT_EQ(v.scale, 0.0175f * kDegToRad);

    ASSERT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_59_5HZ, GyroBandwidth::BW_CODE_0,
                             GyroFullScale::RANGE_2000DPS, v), SensorError::OK);
    EXPECT_FLOAT_EQ(v.scale, 0.07f * kDegToRad);
}

TEST(Lsm9ds1CodecTest, GyroRejectsIllegalCodesWithoutTouchingOutput) {
    GyroCtrlValue v{0xEE, 1234, 9.0f};

    EXPECT_EQ(encodeGyroCtrl(static_cast<GyroSampleRate>(6), GyroBandwidth::BW_CODE_0,
                             GyroFullScale::RANGE_250DPS, v), SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_119HZ, static_cast<GyroBandwidth>(4),
                             GyroFullScale::RANGE_250DPS, v), SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(encodeGyroCtrl(GyroSampleRate::RATE_119HZ, GyroBandwidth::BW_CODE_0,
                             static_cast<GyroFullScale>(3), v), SensorError::ERR_CONFIGURATION);

    EXPECT_EQ(v.ctrl1, 0xEE);
    EXPECT_EQ(v.sample_rate_hz, 1234);
    EXPECT_EQ(gyroSampleRateHz(static_cast<GyroSampleRate>(200)), 0);
}

// ============================================================================
// Gyro CTRL_REG3_G
// ============================================================================

TEST(Lsm9ds1CodecTest, HighPassAlwaysEnabled) {
    for (uint8_t code = 0; code < 10; code++) {
        uint8_t ctrl3 = 0;
        ASSERT_EQ(encodeHighPassFilterCtrl(static_cast<GyroHighPass>(code), ctrl3), SensorError::OK);
        EXPECT_EQ(ctrl3, 0x40 | code);
    }

    uint8_t ctrl3 = 0x11;
    EXPECT_EQ(encodeHighPassFilterCtrl(static_cast<GyroHighPass>(10), ctrl3),
              SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(ctrl3, 0x11);
}

// ============================================================================
// Accel CTRL_REG6_XL
// ============================================================================

TEST(Lsm9ds1CodecTest, AccelFullScaleUsesDatasheetFieldOrder) {
    // FS_XL: 00 = 2g, 10 = 4g, 11 = 8g, 01 = 16g (bits 4:3)
    const uint8_t expectedFs[] = {0x00, 0x10, 0x18, 0x08};
    const float expectedScale[] = {0.000061f, 0.000122f, 0.000244f, 0.000732f};

    for (uint8_t fs = 0; fs < 4; fs++) {
        AccelCtrlValue v{};
        ASSERT_EQ(encodeAccelCtrl(AccelSampleRate::POWER_DOWN, AccelLowPass::BW_408HZ,
                                  static_cast<AccelFullScale>(fs), v), SensorError::OK);
        EXPECT_EQ(v.ctrl6, expectedFs[fs]);
        EXPECT_FLOAT_EQ(v.scale, expectedScale[fs]);
    }
}

TEST(Lsm9ds1CodecTest, AccelRateAndLowPassFields) {
    AccelCtrlValue v{};
    ASSERT_EQ(encodeAccelCtrl(AccelSampleRate::RATE_119HZ, AccelLowPass::BW_50HZ,
                              AccelFullScale::RANGE_8G, v), SensorError::OK);
    EXPECT_EQ(v.ctrl6, 0x7B);

    ASSERT_EQ(encodeAccelCtrl(AccelSampleRate::RATE_952HZ, AccelLowPass::BW_211HZ,
                              AccelFullScale::RANGE_2G, v), SensorError::OK);
    EXPECT_EQ(v.ctrl6, 0xC1);
}

TEST(Lsm9ds1CodecTest, AccelRejectsIllegalCodes) {
    AccelCtrlValue v{};
    EXPECT_EQ(encodeAccelCtrl(static_cast<AccelSampleRate>(7), AccelLowPass::BW_408HZ,
                              AccelFullScale::RANGE_2G, v), SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(encodeAccelCtrl(AccelSampleRate::RATE_10HZ, static_cast<AccelLowPass>(4),
                              AccelFullScale::RANGE_2G, v), SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(encodeAccelCtrl(AccelSampleRate::RATE_10HZ, AccelLowPass::BW_408HZ,
                              static_cast<AccelFullScale>(4), v), SensorError::ERR_CONFIGURATION);
}

// ============================================================================
// Magnetometer CTRL_REG1_M / CTRL_REG2_M
// ============================================================================

TEST(Lsm9ds1CodecTest, MagRateAndScale) {
    const uint8_t expectedCtrl2[] = {0x00, 0x20, 0x40, 0x60};
    const float expectedScale[] = {0.014f, 0.029f, 0.043f, 0.058f};

    for (uint8_t fs = 0; fs < 4; fs++) {
        MagCtrlValue v{};
        ASSERT_EQ(encodeMagCtrl(MagSampleRate::RATE_20HZ, static_cast<MagFullScale>(fs), v),
                  SensorError::OK);
        EXPECT_EQ(v.ctrl1, 0x14);
        EXPECT_EQ(v.ctrl2, expectedCtrl2[fs]);
        EXPECT_FLOAT_EQ(v.scale, expectedScale[fs]);
    }
}

TEST(Lsm9ds1CodecTest, MagRejectsIllegalCodes) {
    MagCtrlValue v{};
    EXPECT_EQ(encodeMagCtrl(static_cast<MagSampleRate>(6), MagFullScale::RANGE_4GAUSS, v),
              SensorError::ERR_CONFIGURATION);
    EXPECT_EQ(encodeMagCtrl(MagSampleRate::RATE_0_625HZ, static_cast<MagFullScale>(4), v),
              SensorError::ERR_CONFIGURATION);
}

// ============================================================================
// Raw Conversion
// ============================================================================

TEST(Lsm9ds1CodecTest, ConvertsLittleEndianSignedAxes) {
    // x = 1, y = -1, z = -32768
    const uint8_t raw[kAxisBlockSize] = {0x01, 0x00, 0xFF, 0xFF, 0x00, 0x80};
    sensehub::Vec3 v = convertToVector(raw, 2.0f);

    EXPECT_FLOAT_EQ(v.x, 2.0f);
    EXPECT_FLOAT_EQ(v.y, -2.0f);
    EXPECT_FLOAT_EQ(v.z, -65536.0f);
}

TEST(Lsm9ds1CodecTest, ConvertAppliesScale) {
    // x = 1000, y = 32767, z = 0
    const uint8_t raw[kAxisBlockSize] = {0xE8, 0x03, 0xFF, 0x7F, 0x00, 0x00};
    sensehub::Vec3 v = convertToVector(raw, 0.000244f);

    EXPECT_FLOAT_EQ(v.x, 1000.0f * 0.000244f);
    EXPECT_FLOAT_EQ(v.y, 32767.0f * 0.000244f);
    EXPECT_FLOAT_EQ(v.z, 0.0f);
}
