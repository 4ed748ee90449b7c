// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file hts221.h
 * @brief HTS221 relative humidity and temperature sensor driver
 *
 * Outputs are uncalibrated counts. Each part carries two factory
 * calibration points per quantity in registers 0x30-0x3F; init() reads them
 * once and every sample is converted by linear interpolation.
 *
 * Reference: HTS221 datasheet DocID026333 Rev 4, TN1218
 */

#ifndef SENSEHUB_DRIVERS_HTS221_H
#define SENSEHUB_DRIVERS_HTS221_H

#include <cstdint>

#include "hal/Bus.h"
#include "sensor_device.h"

namespace sensehub {
namespace drivers {

constexpr uint8_t kHts221Addr   = 0x5F;
constexpr uint8_t kHts221WhoAmI = 0xBC;

/**
 * @brief Linear conversion value = m * counts + c
 */
struct Hts221Calibration {
    float humidity_m = 0.0f;
    float humidity_c = 0.0f;
    float temperature_m = 0.0f;
    float temperature_c = 0.0f;
};

class Hts221 : public SensorDevice {
public:
    explicit Hts221(hal::BusChannel* bus, uint8_t address = kHts221Addr);

    SensorError init() override;
    SensorError update(bool& newSample) override;

    const SensorReading& readings() const override { return m_reading; }
    bool initiated() const override { return m_state == DeviceState::READY; }
    const char* getName() const override { return "HTS221"; }
    const char* lastError() const override { return m_error.c_str(); }

    DeviceState getState() const { return m_state; }
    uint8_t getObservedId() const { return m_observedId; }

    /**
     * @brief Copy the factory calibration line
     * @return false unless READY
     */
    bool getCalibration(Hts221Calibration& out) const;

private:
    SensorError fault(SensorError err);
    SensorError readCalibration(Hts221Calibration& cal);
    bool readInt16(uint8_t reg, int16_t& value);

    hal::BusDevice m_dev;
    DeviceState m_state;
    ErrorText m_error;
    uint8_t m_observedId;
    Hts221Calibration m_cal;
    SensorReading m_reading;
};

} // namespace drivers
} // namespace sensehub

#endif // SENSEHUB_DRIVERS_HTS221_H
