// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lps25h.h
 * @brief LPS25H barometric pressure sensor driver
 *
 * ST LPS25H MEMS pressure sensor:
 * - Pressure: 260-1260 hPa, 24-bit, 4096 LSB/hPa
 * - Temperature: 16-bit, 480 LSB/degC, 42.5 degC offset
 *
 * Reference: LPS25H datasheet DocID023722 Rev 6
 */

#ifndef SENSEHUB_DRIVERS_LPS25H_H
#define SENSEHUB_DRIVERS_LPS25H_H

#include <cstdint>

#include "hal/Bus.h"
#include "sensor_device.h"

namespace sensehub {
namespace drivers {

// I2C address (0x5C with SA0 low, 0x5D with SA0 high)
constexpr uint8_t kLps25hAddrDefault = 0x5C;
constexpr uint8_t kLps25hAddrAlt     = 0x5D;

constexpr uint8_t kLps25hWhoAmI      = 0xBD;

class Lps25h : public SensorDevice {
public:
    explicit Lps25h(hal::BusChannel* bus, uint8_t address = kLps25hAddrDefault);

    SensorError init() override;
    SensorError update(bool& newSample) override;

    const SensorReading& readings() const override { return m_reading; }
    bool initiated() const override { return m_state == DeviceState::READY; }
    const char* getName() const override { return "LPS25H"; }
    const char* lastError() const override { return m_error.c_str(); }

    DeviceState getState() const { return m_state; }
    uint8_t getObservedId() const { return m_observedId; }

private:
    SensorError fault(SensorError err);

    hal::BusDevice m_dev;
    DeviceState m_state;
    ErrorText m_error;
    uint8_t m_observedId;
    SensorReading m_reading;
};

} // namespace drivers
} // namespace sensehub

#endif // SENSEHUB_DRIVERS_LPS25H_H
