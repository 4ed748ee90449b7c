// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lsm9ds1.h
 * @brief LSM9DS1 9-axis IMU driver (accel/gyro die + magnetometer die)
 *
 * Init sequence: validate profile, open both sub-addresses, reboot, settle,
 * verify both WHO_AM_I registers, then write the control registers in a
 * fixed order. Steady state polls STATUS_REG and burst-reads all three
 * output blocks once accel and gyro data are both available.
 *
 * Reference: LSM9DS1 datasheet DocID025715 Rev 3
 */

#ifndef SENSEHUB_DRIVERS_LSM9DS1_H
#define SENSEHUB_DRIVERS_LSM9DS1_H

#include <cstdint>

#include "hal/Bus.h"
#include "lsm9ds1_codec.h"
#include "sensor_device.h"

namespace sensehub {
namespace drivers {

/**
 * @brief LSM9DS1 configuration profile
 *
 * Supplied once at construction. Selections are range-checked by init(),
 * not here.
 */
struct Lsm9ds1Config {
    lsm9ds1::GyroSampleRate  gyro_sample_rate  = lsm9ds1::GyroSampleRate::RATE_119HZ;
    lsm9ds1::GyroBandwidth   gyro_bandwidth    = lsm9ds1::GyroBandwidth::BW_CODE_1;
    lsm9ds1::GyroHighPass    gyro_high_pass    = lsm9ds1::GyroHighPass::HPF_CODE_4;
    lsm9ds1::GyroFullScale   gyro_full_scale   = lsm9ds1::GyroFullScale::RANGE_500DPS;

    lsm9ds1::AccelSampleRate accel_sample_rate = lsm9ds1::AccelSampleRate::RATE_119HZ;
    lsm9ds1::AccelLowPass    accel_low_pass    = lsm9ds1::AccelLowPass::BW_50HZ;
    lsm9ds1::AccelFullScale  accel_full_scale  = lsm9ds1::AccelFullScale::RANGE_8G;

    lsm9ds1::MagSampleRate   mag_sample_rate   = lsm9ds1::MagSampleRate::RATE_20HZ;
    lsm9ds1::MagFullScale    mag_full_scale    = lsm9ds1::MagFullScale::RANGE_4GAUSS;
};

/**
 * @brief Conversion factors committed at the READY transition
 */
struct Lsm9ds1ScaleFactors {
    float gyro = 0.0f;   ///< rad/s per LSB
    float accel = 0.0f;  ///< g per LSB
    float mag = 0.0f;    ///< uT per LSB
};

class Lsm9ds1 : public SensorDevice {
public:
    // Nominal rate used when the profile's gyro rate is illegal
    static constexpr uint16_t kDefaultSampleRateHz = 100;

    // Post-reboot settle time; first reads after reset are undefined
    static constexpr uint32_t kBootSettleMs = 100;

    Lsm9ds1(hal::BusChannel* bus, uint8_t accelGyroAddress, uint8_t magAddress,
            const Lsm9ds1Config& config = Lsm9ds1Config());

    SensorError init() override;
    SensorError update(bool& newSample) override;

    const SensorReading& readings() const override { return m_reading; }
    bool initiated() const override { return m_state == DeviceState::READY; }
    const char* getName() const override { return "LSM9DS1"; }
    const char* lastError() const override { return m_error.c_str(); }

    DeviceState getState() const { return m_state; }

    /**
     * @brief Last identity byte read during init (0 if never read)
     */
    uint8_t getObservedId() const { return m_observedId; }

    /**
     * @brief Copy the committed scale factors
     * @return false unless READY
     */
    bool getScaleFactors(Lsm9ds1ScaleFactors& out) const;

    // Derived from the profile at construction, valid in every state
    uint16_t getSampleRate() const { return m_sampleRateHz; }
    uint32_t getSampleIntervalUs() const { return m_sampleIntervalUs; }
    uint32_t getPollInterval() const { return 400U / m_sampleRateHz; }

private:
    SensorError fault(SensorError err);
    bool verifyId(hal::BusDevice& dev, uint8_t idReg, uint8_t expected, const char* die);
    bool writeConfig(hal::BusDevice& dev, uint8_t reg, uint8_t value, const char* regName);

    hal::BusDevice m_accelGyro;
    hal::BusDevice m_mag;
    const Lsm9ds1Config m_config;

    DeviceState m_state;
    ErrorText m_error;
    uint8_t m_observedId;

    Lsm9ds1ScaleFactors m_scale;
    SensorReading m_reading;

    uint16_t m_sampleRateHz;
    uint32_t m_sampleIntervalUs;
};

} // namespace drivers
} // namespace sensehub

#endif // SENSEHUB_DRIVERS_LSM9DS1_H
