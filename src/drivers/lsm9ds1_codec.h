// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lsm9ds1_codec.h
 * @brief LSM9DS1 register map and configuration codec
 *
 * ST LSM9DS1 iNEMO 9-axis module, two dies in one package:
 * - Accelerometer + gyroscope: ±2/4/8/16 g, ±250/500/2000 dps, 16-bit
 * - Magnetometer: ±4/8/12/16 gauss, 16-bit
 *
 * Pure functions only: configuration selection -> control register byte and
 * scale factor, raw output bytes -> scaled vector. No state, no bus access.
 *
 * Reference: LSM9DS1 datasheet DocID025715 Rev 3
 */

#ifndef SENSEHUB_DRIVERS_LSM9DS1_CODEC_H
#define SENSEHUB_DRIVERS_LSM9DS1_CODEC_H

#include <cstdint>

#include "math/vec3.h"
#include "sensor_device.h"

namespace sensehub {
namespace drivers {
namespace lsm9ds1 {

// ============================================================================
// Addresses and Identity
// ============================================================================

constexpr uint8_t kAddrAccelGyro    = 0x6A;  // SDO_AG low
constexpr uint8_t kAddrAccelGyroAlt = 0x6B;  // SDO_AG high
constexpr uint8_t kAddrMag          = 0x1C;  // SDO_M low
constexpr uint8_t kAddrMagAlt       = 0x1E;  // SDO_M high

constexpr uint8_t kAccelGyroId      = 0x68;
constexpr uint8_t kMagId            = 0x3D;

// ============================================================================
// Register Definitions
// ============================================================================

namespace reg {
    // Accelerometer / gyroscope die
    constexpr uint8_t kWhoAmI       = 0x0F;
    constexpr uint8_t kCtrlReg1G    = 0x10;
    constexpr uint8_t kCtrlReg3G    = 0x12;
    constexpr uint8_t kStatusReg    = 0x17;
    constexpr uint8_t kOutXLG       = 0x18;
    constexpr uint8_t kCtrlReg6XL   = 0x20;
    constexpr uint8_t kCtrlReg7XL   = 0x21;
    constexpr uint8_t kCtrlReg8     = 0x22;
    constexpr uint8_t kOutXLXL      = 0x28;

    // Magnetometer die
    constexpr uint8_t kWhoAmIM      = 0x0F;
    constexpr uint8_t kCtrlReg1M    = 0x20;
    constexpr uint8_t kCtrlReg2M    = 0x21;
    constexpr uint8_t kCtrlReg3M    = 0x22;
    constexpr uint8_t kOutXLM       = 0x28;
} // namespace reg

namespace bit {
    // CTRL_REG8: BOOT (reload trimming) + SW_RESET
    constexpr uint8_t kBootSoftReset = 0x81;

    // STATUS_REG: accel (XLDA) and gyro (GDA) data available
    constexpr uint8_t kStatusXlda    = (1U << 0);
    constexpr uint8_t kStatusGda     = (1U << 1);
    constexpr uint8_t kStatusDataReady = kStatusXlda | kStatusGda;

    // CTRL_REG3_G: high-pass filter enable
    constexpr uint8_t kHighPassEnable = 0x40;
} // namespace bit

// Output block: three little-endian int16 axes
constexpr uint8_t kAxisBlockSize = 6;

// ============================================================================
// Configuration Selections
// ============================================================================

/**
 * @brief Gyroscope output data rate (CTRL_REG1_G ODR_G)
 */
enum class GyroSampleRate : uint8_t {
    RATE_14_9HZ = 0,
    RATE_59_5HZ = 1,
    RATE_119HZ  = 2,
    RATE_238HZ  = 3,
    RATE_476HZ  = 4,
    RATE_952HZ  = 5,
};

/**
 * @brief Gyroscope bandwidth selection (CTRL_REG1_G BW_G, meaning depends on ODR)
 */
enum class GyroBandwidth : uint8_t {
    BW_CODE_0 = 0,
    BW_CODE_1 = 1,
    BW_CODE_2 = 2,
    BW_CODE_3 = 3,
};

enum class GyroFullScale : uint8_t {
    RANGE_250DPS  = 0,
    RANGE_500DPS  = 1,
    RANGE_2000DPS = 2,
};

/**
 * @brief Gyroscope high-pass cutoff (CTRL_REG3_G HPCF_G, 0-9)
 */
enum class GyroHighPass : uint8_t {
    HPF_CODE_0 = 0,
    HPF_CODE_1 = 1,
    HPF_CODE_2 = 2,
    HPF_CODE_3 = 3,
    HPF_CODE_4 = 4,
    HPF_CODE_5 = 5,
    HPF_CODE_6 = 6,
    HPF_CODE_7 = 7,
    HPF_CODE_8 = 8,
    HPF_CODE_9 = 9,
};

/**
 * @brief Accelerometer output data rate (CTRL_REG6_XL ODR_XL)
 */
enum class AccelSampleRate : uint8_t {
    POWER_DOWN = 0,
    RATE_10HZ  = 1,
    RATE_50HZ  = 2,
    RATE_119HZ = 3,
    RATE_238HZ = 4,
    RATE_476HZ = 5,
    RATE_952HZ = 6,
};

/**
 * @brief Accelerometer anti-aliasing bandwidth (CTRL_REG6_XL BW_XL)
 */
enum class AccelLowPass : uint8_t {
    BW_408HZ = 0,
    BW_211HZ = 1,
    BW_105HZ = 2,
    BW_50HZ  = 3,
};

enum class AccelFullScale : uint8_t {
    RANGE_2G  = 0,
    RANGE_4G  = 1,
    RANGE_8G  = 2,
    RANGE_16G = 3,
};

/**
 * @brief Magnetometer output data rate (CTRL_REG1_M DO)
 */
enum class MagSampleRate : uint8_t {
    RATE_0_625HZ = 0,
    RATE_1_25HZ  = 1,
    RATE_2_5HZ   = 2,
    RATE_5HZ     = 3,
    RATE_10HZ    = 4,
    RATE_20HZ    = 5,
};

enum class MagFullScale : uint8_t {
    RANGE_4GAUSS  = 0,
    RANGE_8GAUSS  = 1,
    RANGE_12GAUSS = 2,
    RANGE_16GAUSS = 3,
};

// ============================================================================
// Encoded Values
// ============================================================================

struct GyroCtrlValue {
    uint8_t ctrl1;            ///< CTRL_REG1_G
    uint16_t sample_rate_hz;  ///< Nominal rate for interval and poll timing
    float scale;              ///< rad/s per LSB
};

struct AccelCtrlValue {
    uint8_t ctrl6;            ///< CTRL_REG6_XL
    float scale;              ///< g per LSB
};

struct MagCtrlValue {
    uint8_t ctrl1;            ///< CTRL_REG1_M
    uint8_t ctrl2;            ///< CTRL_REG2_M
    float scale;              ///< uT per LSB
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Encode CTRL_REG1_G and derive rate and scale
 * @return ERR_CONFIGURATION if any selection is outside its legal set
 *         (out is left untouched)
 */
SensorError encodeGyroCtrl(GyroSampleRate rate, GyroBandwidth bandwidth,
                           GyroFullScale fullScale, GyroCtrlValue& out);

/**
 * @brief Encode CTRL_REG6_XL and derive scale
 */
SensorError encodeAccelCtrl(AccelSampleRate rate, AccelLowPass lowPass,
                            AccelFullScale fullScale, AccelCtrlValue& out);

/**
 * @brief Encode CTRL_REG1_M / CTRL_REG2_M and derive scale
 */
SensorError encodeMagCtrl(MagSampleRate rate, MagFullScale fullScale,
                          MagCtrlValue& out);

/**
 * @brief Encode CTRL_REG3_G with the high-pass enable bit set
 */
SensorError encodeHighPassFilterCtrl(GyroHighPass code, uint8_t& ctrl3);

/**
 * @brief Nominal gyro rate in Hz, 0 for an illegal code
 */
uint16_t gyroSampleRateHz(GyroSampleRate rate);

/**
 * @brief Convert one output block to a scaled vector
 * @param bytes X_L, X_H, Y_L, Y_H, Z_L, Z_H
 */
Vec3 convertToVector(const uint8_t bytes[kAxisBlockSize], float scale);

} // namespace lsm9ds1
} // namespace drivers
} // namespace sensehub

#endif // SENSEHUB_DRIVERS_LSM9DS1_CODEC_H
