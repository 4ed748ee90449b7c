// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file config.h
 * @brief SenseHub build configuration and board address map
 */

#ifndef SENSEHUB_CONFIG_H
#define SENSEHUB_CONFIG_H

#include <cstdint>

// ============================================================================
// Version Information
// ============================================================================

constexpr uint8_t     kVersionMajor  = 0;
constexpr uint8_t     kVersionMinor  = 3;
constexpr uint8_t     kVersionPatch  = 0;
constexpr const char* kVersionString = "0.3.0";

// ============================================================================
// Feature Flags
// ============================================================================

#define SENSEHUB_FEATURE_IMU        1   // LSM9DS1 accel/gyro/mag
#define SENSEHUB_FEATURE_PRESSURE   1   // LPS25H barometer
#define SENSEHUB_FEATURE_HUMIDITY   1   // HTS221 humidity/temperature

namespace sensehub {
namespace board {

// ============================================================================
// Bus
// ============================================================================

// Raspberry Pi header I2C (pins 3/5) is exposed as /dev/i2c-1
constexpr const char* kDefaultBusDevice = "/dev/i2c-1";

// ============================================================================
// Sense HAT address map
// ============================================================================

constexpr uint8_t kAddrLsm9ds1AccelGyro = 0x6A;
constexpr uint8_t kAddrLsm9ds1Mag       = 0x1C;
constexpr uint8_t kAddrLps25h           = 0x5C;
constexpr uint8_t kAddrHts221           = 0x5F;

// ============================================================================
// Console
// ============================================================================

constexpr uint32_t kStatusPrintIntervalMs = 1000;

} // namespace board
} // namespace sensehub

#endif // SENSEHUB_CONFIG_H
