// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lsm9ds1.cpp
 * @brief LSM9DS1 9-axis IMU driver implementation
 *
 * The accel/gyro and magnetometer dies are separate I2C targets and are
 * opened, identified and configured independently. Both identities are
 * checked before any control register is written, so a wrong part on
 * either address never receives configuration.
 *
 * CTRL_REG7_XL is always written as 0x00. The high-resolution value 0x05
 * is known to misbehave on this part and must not be written.
 */

#include "lsm9ds1.h"
#include "hal/Timing.h"
#include "debug.h"

namespace sensehub {
namespace drivers {

using namespace lsm9ds1;
using hal::Timing;

// CTRL_REG7_XL: high-resolution mode off, filtered data bypass
constexpr uint8_t kAccelCtrl7 = 0x00;

// CTRL_REG3_M: I2C enabled, continuous conversion
constexpr uint8_t kMagCtrl3 = 0x00;

// ============================================================================
// Construction
// ============================================================================

Lsm9ds1::Lsm9ds1(hal::BusChannel* bus, uint8_t accelGyroAddress, uint8_t magAddress,
                 const Lsm9ds1Config& config)
    : m_accelGyro(bus, accelGyroAddress)
    , m_mag(bus, magAddress)
    , m_config(config)
    , m_state(DeviceState::UNINITIALIZED)
    , m_observedId(0)
    , m_sampleRateHz(kDefaultSampleRateHz)
    , m_sampleIntervalUs(0)
{
    uint16_t rate = gyroSampleRateHz(config.gyro_sample_rate);
    if (rate != 0) {
        m_sampleRateHz = rate;
    }
    m_sampleIntervalUs = 1000000U / m_sampleRateHz;
}

// ============================================================================
// Initialization
// ============================================================================

SensorError Lsm9ds1::init() {
    m_accelGyro.close();
    m_mag.close();
    m_state = DeviceState::UNINITIALIZED;
    m_error.clear();
    m_observedId = 0;
    m_scale = Lsm9ds1ScaleFactors();

    // Encode the whole profile up front: an illegal selection never
    // reaches the bus
    GyroCtrlValue gyro{};
    if (encodeGyroCtrl(m_config.gyro_sample_rate, m_config.gyro_bandwidth,
                       m_config.gyro_full_scale, gyro) != SensorError::OK) {
        m_error.set("Illegal LSM9DS1 gyro config (rate %u, bw %u, fsr %u)",
                    static_cast<unsigned>(m_config.gyro_sample_rate),
                    static_cast<unsigned>(m_config.gyro_bandwidth),
                    static_cast<unsigned>(m_config.gyro_full_scale));
        return fault(SensorError::ERR_CONFIGURATION);
    }

    uint8_t gyroCtrl3 = 0;
    if (encodeHighPassFilterCtrl(m_config.gyro_high_pass, gyroCtrl3) != SensorError::OK) {
        m_error.set("Illegal LSM9DS1 gyro high pass filter code %u",
                    static_cast<unsigned>(m_config.gyro_high_pass));
        return fault(SensorError::ERR_CONFIGURATION);
    }

    AccelCtrlValue accel{};
    if (encodeAccelCtrl(m_config.accel_sample_rate, m_config.accel_low_pass,
                        m_config.accel_full_scale, accel) != SensorError::OK) {
        m_error.set("Illegal LSM9DS1 accel config (rate %u, lpf %u, fsr %u)",
                    static_cast<unsigned>(m_config.accel_sample_rate),
                    static_cast<unsigned>(m_config.accel_low_pass),
                    static_cast<unsigned>(m_config.accel_full_scale));
        return fault(SensorError::ERR_CONFIGURATION);
    }

    MagCtrlValue mag{};
    if (encodeMagCtrl(m_config.mag_sample_rate, m_config.mag_full_scale, mag) != SensorError::OK) {
        m_error.set("Illegal LSM9DS1 compass config (rate %u, fsr %u)",
                    static_cast<unsigned>(m_config.mag_sample_rate),
                    static_cast<unsigned>(m_config.mag_full_scale));
        return fault(SensorError::ERR_CONFIGURATION);
    }

    // --- Connect ---
    m_state = DeviceState::CONNECTING;
    if (!m_accelGyro.open()) {
        m_error.set("Failed to connect to LSM9DS1 accel/gyro 0x%02X on %s",
                    m_accelGyro.getAddress(), m_accelGyro.getBusName());
        return fault(SensorError::ERR_CONNECTION);
    }
    if (!m_mag.open()) {
        m_error.set("Failed to connect to LSM9DS1 compass 0x%02X on %s",
                    m_mag.getAddress(), m_mag.getBusName());
        return fault(SensorError::ERR_CONNECTION);
    }

    // --- Boot ---
    m_state = DeviceState::BOOTING;
    if (!m_accelGyro.writeRegister(reg::kCtrlReg8, bit::kBootSoftReset)) {
        m_error.set("Failed to boot LSM9DS1");
        return fault(SensorError::ERR_BOOT);
    }
    Timing::delayMs(kBootSettleMs);

    // --- Identity ---
    m_state = DeviceState::VERIFYING_IDENTITY;
    if (!verifyId(m_accelGyro, reg::kWhoAmI, kAccelGyroId, "accel/gyro")) {
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }
    if (!verifyId(m_mag, reg::kWhoAmIM, kMagId, "compass")) {
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }

    // --- Configure (order matters: rates before scales are trusted) ---
    m_state = DeviceState::CONFIGURING;
    Lsm9ds1ScaleFactors staged;

    if (!writeConfig(m_accelGyro, reg::kCtrlReg1G, gyro.ctrl1, "gyro CTRL_REG1_G")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }
    staged.gyro = gyro.scale;

    if (!writeConfig(m_accelGyro, reg::kCtrlReg3G, gyroCtrl3, "gyro CTRL_REG3_G")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }

    if (!writeConfig(m_accelGyro, reg::kCtrlReg6XL, accel.ctrl6, "accel CTRL_REG6_XL")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }
    staged.accel = accel.scale;

    if (!writeConfig(m_accelGyro, reg::kCtrlReg7XL, kAccelCtrl7, "accel CTRL_REG7_XL")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }

    if (!writeConfig(m_mag, reg::kCtrlReg1M, mag.ctrl1, "compass CTRL_REG1_M")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }

    if (!writeConfig(m_mag, reg::kCtrlReg2M, mag.ctrl2, "compass CTRL_REG2_M")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }
    staged.mag = mag.scale;

    if (!writeConfig(m_mag, reg::kCtrlReg3M, kMagCtrl3, "compass CTRL_REG3_M")) {
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }

    m_scale = staged;
    m_state = DeviceState::READY;

    DBG_PRINT("[LSM9DS1] Ready on %s (0x%02X/0x%02X), %u Hz\n",
              m_accelGyro.getBusName(), m_accelGyro.getAddress(),
              m_mag.getAddress(), static_cast<unsigned>(m_sampleRateHz));
    return SensorError::OK;
}

SensorError Lsm9ds1::fault(SensorError err) {
    m_state = DeviceState::FAULTED;
    m_accelGyro.close();
    m_mag.close();
    DBG_ERROR("[LSM9DS1] %s: %s\n", sensorErrorName(err), m_error.c_str());
    return err;
}

bool Lsm9ds1::verifyId(hal::BusDevice& dev, uint8_t idReg, uint8_t expected, const char* die) {
    uint8_t id = 0;
    if (!dev.readRegister(idReg, id)) {
        m_error.set("Failed to read LSM9DS1 %s id", die);
        return false;
    }

    m_observedId = id;
    if (id != expected) {
        m_error.set("Incorrect LSM9DS1 %s id 0x%02X (expected 0x%02X)", die, id, expected);
        return false;
    }
    return true;
}

bool Lsm9ds1::writeConfig(hal::BusDevice& dev, uint8_t reg, uint8_t value, const char* regName) {
    if (!dev.writeRegister(reg, value)) {
        m_error.set("Failed to set LSM9DS1 %s (0x%02X)", regName, reg);
        return false;
    }
    return true;
}

bool Lsm9ds1::getScaleFactors(Lsm9ds1ScaleFactors& out) const {
    if (m_state != DeviceState::READY) {
        return false;
    }
    out = m_scale;
    return true;
}

// ============================================================================
// Acquisition
// ============================================================================

SensorError Lsm9ds1::update(bool& newSample) {
    newSample = false;

    if (m_state != DeviceState::READY) {
        return SensorError::ERR_NOT_INITIATED;
    }

    uint8_t status = 0;
    if (!m_accelGyro.readRegister(reg::kStatusReg, status)) {
        m_error.set("Failed to read LSM9DS1 status");
        return SensorError::ERR_READ;
    }

    if ((status & bit::kStatusDataReady) != bit::kStatusDataReady) {
        return SensorError::OK;  // Polled faster than the ODR
    }

    uint8_t gyroRaw[kAxisBlockSize];
    uint8_t accelRaw[kAxisBlockSize];
    uint8_t magRaw[kAxisBlockSize];

    if (!m_accelGyro.readBurst(reg::kOutXLG, gyroRaw, sizeof(gyroRaw))) {
        m_error.set("Failed to read LSM9DS1 gyro data");
        return SensorError::ERR_READ;
    }
    if (!m_accelGyro.readBurst(reg::kOutXLXL, accelRaw, sizeof(accelRaw))) {
        m_error.set("Failed to read LSM9DS1 accel data");
        return SensorError::ERR_READ;
    }
    if (!m_mag.readBurst(reg::kOutXLM, magRaw, sizeof(magRaw))) {
        m_error.set("Failed to read LSM9DS1 compass data");
        return SensorError::ERR_READ;
    }

    SensorReading reading;
    reading.timestamp_us = Timing::micros();
    reading.gyro = convertToVector(gyroRaw, m_scale.gyro);
    reading.accel = convertToVector(accelRaw, m_scale.accel);
    reading.mag = convertToVector(magRaw, m_scale.mag);

    // Die mounting differs from the datasheet frame
    reading.gyro.z = -reading.gyro.z;
    reading.accel.x = -reading.accel.x;
    reading.accel.y = -reading.accel.y;
    reading.mag.x = -reading.mag.x;
    reading.mag.z = -reading.mag.z;

    reading.gyro_valid = true;
    reading.accel_valid = true;
    reading.mag_valid = true;

    m_reading = reading;
    newSample = true;
    return SensorError::OK;
}

} // namespace drivers
} // namespace sensehub
