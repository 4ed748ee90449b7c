// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lsm9ds1_codec.cpp
 * @brief LSM9DS1 configuration codec implementation
 */

#include "lsm9ds1_codec.h"

namespace sensehub {
namespace drivers {
namespace lsm9ds1 {

// ============================================================================
// Lookup Tables (indexed by enum value)
// ============================================================================

constexpr float kDegToRad = 0.017453292519943295F;

// CTRL_REG1_G ODR_G bits [7:5] and nominal rate
constexpr uint8_t kGyroOdrBits[] = {0x20, 0x40, 0x60, 0x80, 0xA0, 0xC0};
constexpr uint16_t kGyroRateHz[] = {15, 60, 119, 238, 476, 952};
constexpr uint8_t kGyroRateCount = sizeof(kGyroOdrBits) / sizeof(kGyroOdrBits[0]);

constexpr uint8_t kGyroBandwidthCount = 4;

// CTRL_REG1_G FS_G bits [4:3] and sensitivity (dps/LSB)
constexpr uint8_t kGyroFsBits[] = {0x00, 0x08, 0x18};
constexpr float kGyroSensitivity[] = {0.00875F, 0.0175F, 0.07F};
constexpr uint8_t kGyroFsCount = sizeof(kGyroFsBits) / sizeof(kGyroFsBits[0]);

constexpr uint8_t kGyroHighPassCount = 10;

constexpr uint8_t kAccelRateCount = 7;
constexpr uint8_t kAccelLowPassCount = 4;

// CTRL_REG6_XL FS_XL field values: 00 = ±2g, 01 = ±16g, 10 = ±4g, 11 = ±8g
constexpr uint8_t kAccelFsField[] = {0x0, 0x2, 0x3, 0x1};
constexpr float kAccelSensitivity[] = {0.000061F, 0.000122F, 0.000244F, 0.000732F};
constexpr uint8_t kAccelFsCount = sizeof(kAccelFsField) / sizeof(kAccelFsField[0]);

constexpr uint8_t kMagRateCount = 6;

// CTRL_REG2_M FS bits [6:5] and sensitivity (uT/LSB)
constexpr uint8_t kMagFsBits[] = {0x00, 0x20, 0x40, 0x60};
constexpr float kMagSensitivity[] = {0.014F, 0.029F, 0.043F, 0.058F};
constexpr uint8_t kMagFsCount = sizeof(kMagFsBits) / sizeof(kMagFsBits[0]);

// ============================================================================
// Codec
// ============================================================================

SensorError encodeGyroCtrl(GyroSampleRate rate, GyroBandwidth bandwidth,
                           GyroFullScale fullScale, GyroCtrlValue& out) {
    const uint8_t r = static_cast<uint8_t>(rate);
    const uint8_t bw = static_cast<uint8_t>(bandwidth);
    const uint8_t fs = static_cast<uint8_t>(fullScale);

    if (r >= kGyroRateCount || bw >= kGyroBandwidthCount || fs >= kGyroFsCount) {
        return SensorError::ERR_CONFIGURATION;
    }

    out.ctrl1 = static_cast<uint8_t>(kGyroOdrBits[r] | kGyroFsBits[fs] | bw);
    out.sample_rate_hz = kGyroRateHz[r];
    out.scale = kGyroSensitivity[fs] * kDegToRad;
    return SensorError::OK;
}

SensorError encodeAccelCtrl(AccelSampleRate rate, AccelLowPass lowPass,
                            AccelFullScale fullScale, AccelCtrlValue& out) {
    const uint8_t r = static_cast<uint8_t>(rate);
    const uint8_t lp = static_cast<uint8_t>(lowPass);
    const uint8_t fs = static_cast<uint8_t>(fullScale);

    if (r >= kAccelRateCount || lp >= kAccelLowPassCount || fs >= kAccelFsCount) {
        return SensorError::ERR_CONFIGURATION;
    }

    out.ctrl6 = static_cast<uint8_t>((r << 5) | (kAccelFsField[fs] << 3) | lp);
    out.scale = kAccelSensitivity[fs];
    return SensorError::OK;
}

SensorError encodeMagCtrl(MagSampleRate rate, MagFullScale fullScale,
                          MagCtrlValue& out) {
    const uint8_t r = static_cast<uint8_t>(rate);
    const uint8_t fs = static_cast<uint8_t>(fullScale);

    if (r >= kMagRateCount || fs >= kMagFsCount) {
        return SensorError::ERR_CONFIGURATION;
    }

    out.ctrl1 = static_cast<uint8_t>(r << 2);
    out.ctrl2 = kMagFsBits[fs];
    out.scale = kMagSensitivity[fs];
    return SensorError::OK;
}

SensorError encodeHighPassFilterCtrl(GyroHighPass code, uint8_t& ctrl3) {
    const uint8_t c = static_cast<uint8_t>(code);
    if (c >= kGyroHighPassCount) {
        return SensorError::ERR_CONFIGURATION;
    }

    ctrl3 = static_cast<uint8_t>(c | bit::kHighPassEnable);
    return SensorError::OK;
}

uint16_t gyroSampleRateHz(GyroSampleRate rate) {
    const uint8_t r = static_cast<uint8_t>(rate);
    return (r < kGyroRateCount) ? kGyroRateHz[r] : 0;
}

Vec3 convertToVector(const uint8_t bytes[kAxisBlockSize], float scale) {
    const int16_t x = static_cast<int16_t>(static_cast<uint16_t>(bytes[0]) |
                                           (static_cast<uint16_t>(bytes[1]) << 8));
    const int16_t y = static_cast<int16_t>(static_cast<uint16_t>(bytes[2]) |
                                           (static_cast<uint16_t>(bytes[3]) << 8));
    const int16_t z = static_cast<int16_t>(static_cast<uint16_t>(bytes[4]) |
                                           (static_cast<uint16_t>(bytes[5]) << 8));

    return Vec3(static_cast<float>(x), static_cast<float>(y), static_cast<float>(z)) * scale;
}

} // namespace lsm9ds1
} // namespace drivers
} // namespace sensehub
