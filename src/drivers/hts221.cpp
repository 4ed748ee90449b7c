// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file hts221.cpp
 * @brief HTS221 humidity sensor driver implementation
 */

#include "hts221.h"
#include "hal/Timing.h"
#include "debug.h"

namespace sensehub {
namespace drivers {

using hal::Timing;

// ============================================================================
// Register Definitions
// ============================================================================

namespace hts221_reg {
    constexpr uint8_t kWhoAmI       = 0x0F;
    constexpr uint8_t kAvConf       = 0x10;
    constexpr uint8_t kCtrlReg1     = 0x20;
    constexpr uint8_t kStatusReg    = 0x27;
    constexpr uint8_t kHumidityOutL = 0x28;
    constexpr uint8_t kTempOutL     = 0x2A;

    // Factory calibration block
    constexpr uint8_t kH0rHx2       = 0x30;
    constexpr uint8_t kH1rHx2       = 0x31;
    constexpr uint8_t kT0degCx8     = 0x32;
    constexpr uint8_t kT1degCx8     = 0x33;
    constexpr uint8_t kT1T0Msb      = 0x35;
    constexpr uint8_t kH0T0Out      = 0x36;
    constexpr uint8_t kH1T0Out      = 0x3A;
    constexpr uint8_t kT0Out        = 0x3C;
    constexpr uint8_t kT1Out        = 0x3E;
} // namespace hts221_reg

// CTRL_REG1: power on, block data update, ODR 12.5 Hz
constexpr uint8_t kCtrl1Value  = 0x87;
// AV_CONF: 32 humidity / 16 temperature internal averages
constexpr uint8_t kAvConfValue = 0x1B;

// STATUS_REG
constexpr uint8_t kStatusTempReady     = (1U << 0);
constexpr uint8_t kStatusHumidityReady = (1U << 1);

// ============================================================================
// Hts221 class implementation
// ============================================================================

Hts221::Hts221(hal::BusChannel* bus, uint8_t address)
    : m_dev(bus, address)
    , m_state(DeviceState::UNINITIALIZED)
    , m_observedId(0)
{
}

SensorError Hts221::init() {
    m_dev.close();
    m_state = DeviceState::UNINITIALIZED;
    m_error.clear();
    m_observedId = 0;
    m_cal = Hts221Calibration();

    m_state = DeviceState::CONNECTING;
    if (!m_dev.open()) {
        m_error.set("Failed to connect to HTS221 0x%02X on %s",
                    m_dev.getAddress(), m_dev.getBusName());
        return fault(SensorError::ERR_CONNECTION);
    }

    m_state = DeviceState::VERIFYING_IDENTITY;
    uint8_t id = 0;
    if (!m_dev.readRegister(hts221_reg::kWhoAmI, id)) {
        m_error.set("Failed to read HTS221 id");
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }
    m_observedId = id;
    if (id != kHts221WhoAmI) {
        m_error.set("Incorrect HTS221 id 0x%02X (expected 0x%02X)", id, kHts221WhoAmI);
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }

    m_state = DeviceState::CONFIGURING;
    if (!m_dev.writeRegister(hts221_reg::kCtrlReg1, kCtrl1Value)) {
        m_error.set("Failed to set HTS221 CTRL_REG1 (0x%02X)", hts221_reg::kCtrlReg1);
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }
    if (!m_dev.writeRegister(hts221_reg::kAvConf, kAvConfValue)) {
        m_error.set("Failed to set HTS221 AV_CONF (0x%02X)", hts221_reg::kAvConf);
        return fault(SensorError::ERR_CONFIGURATION_WRITE);
    }

    Hts221Calibration cal;
    SensorError err = readCalibration(cal);
    if (err != SensorError::OK) {
        return fault(err);
    }

    m_cal = cal;
    m_state = DeviceState::READY;
    DBG_PRINT("[HTS221] Ready on %s (0x%02X)\n", m_dev.getBusName(), m_dev.getAddress());
    return SensorError::OK;
}

SensorError Hts221::fault(SensorError err) {
    m_state = DeviceState::FAULTED;
    m_dev.close();
    DBG_ERROR("[HTS221] %s: %s\n", sensorErrorName(err), m_error.c_str());
    return err;
}

bool Hts221::readInt16(uint8_t reg, int16_t& value) {
    uint8_t raw[2];
    if (!m_dev.readBurst(reg, raw, sizeof(raw))) {
        return false;
    }
    value = static_cast<int16_t>(static_cast<uint16_t>(raw[0]) |
                                 (static_cast<uint16_t>(raw[1]) << 8));
    return true;
}

SensorError Hts221::readCalibration(Hts221Calibration& cal) {
    uint8_t h0x2 = 0;
    uint8_t h1x2 = 0;
    uint8_t t0x8 = 0;
    uint8_t t1x8 = 0;
    uint8_t tMsb = 0;
    int16_t h0Out = 0;
    int16_t h1Out = 0;
    int16_t t0Out = 0;
    int16_t t1Out = 0;

    if (!m_dev.readRegister(hts221_reg::kH0rHx2, h0x2) ||
        !m_dev.readRegister(hts221_reg::kH1rHx2, h1x2) ||
        !m_dev.readRegister(hts221_reg::kT0degCx8, t0x8) ||
        !m_dev.readRegister(hts221_reg::kT1degCx8, t1x8) ||
        !m_dev.readRegister(hts221_reg::kT1T0Msb, tMsb) ||
        !readInt16(hts221_reg::kH0T0Out, h0Out) ||
        !readInt16(hts221_reg::kH1T0Out, h1Out) ||
        !readInt16(hts221_reg::kT0Out, t0Out) ||
        !readInt16(hts221_reg::kT1Out, t1Out)) {
        m_error.set("Failed to read HTS221 calibration");
        return SensorError::ERR_READ;
    }

    if (h1Out == h0Out || t1Out == t0Out) {
        m_error.set("Degenerate HTS221 calibration (H %d/%d, T %d/%d)",
                    h0Out, h1Out, t0Out, t1Out);
        return SensorError::ERR_CONFIGURATION;
    }

    // Humidity points are stored x2, temperature points x8 with two
    // extra MSBs each in T1/T0 msb
    const float h0 = static_cast<float>(h0x2) / 2.0F;
    const float h1 = static_cast<float>(h1x2) / 2.0F;
    const float t0 = static_cast<float>(((tMsb & 0x03U) << 8) | t0x8) / 8.0F;
    const float t1 = static_cast<float>(((tMsb & 0x0CU) << 6) | t1x8) / 8.0F;

    cal.humidity_m = (h1 - h0) / static_cast<float>(h1Out - h0Out);
    cal.humidity_c = h0 - cal.humidity_m * static_cast<float>(h0Out);
    cal.temperature_m = (t1 - t0) / static_cast<float>(t1Out - t0Out);
    cal.temperature_c = t0 - cal.temperature_m * static_cast<float>(t0Out);
    return SensorError::OK;
}

bool Hts221::getCalibration(Hts221Calibration& out) const {
    if (m_state != DeviceState::READY) {
        return false;
    }
    out = m_cal;
    return true;
}

SensorError Hts221::update(bool& newSample) {
    newSample = false;

    if (m_state != DeviceState::READY) {
        return SensorError::ERR_NOT_INITIATED;
    }

    uint8_t status = 0;
    if (!m_dev.readRegister(hts221_reg::kStatusReg, status)) {
        m_error.set("Failed to read HTS221 status");
        return SensorError::ERR_READ;
    }

    if ((status & (kStatusHumidityReady | kStatusTempReady)) == 0) {
        return SensorError::OK;
    }

    SensorReading reading;

    if ((status & kStatusHumidityReady) != 0) {
        int16_t counts = 0;
        if (!readInt16(hts221_reg::kHumidityOutL, counts)) {
            m_error.set("Failed to read HTS221 humidity");
            return SensorError::ERR_READ;
        }
        reading.humidity_rh = m_cal.humidity_m * static_cast<float>(counts) + m_cal.humidity_c;
        reading.humidity_valid = true;
    }

    if ((status & kStatusTempReady) != 0) {
        int16_t counts = 0;
        if (!readInt16(hts221_reg::kTempOutL, counts)) {
            m_error.set("Failed to read HTS221 temperature");
            return SensorError::ERR_READ;
        }
        reading.temperature_c = m_cal.temperature_m * static_cast<float>(counts) + m_cal.temperature_c;
        reading.temperature_valid = true;
    }

    reading.timestamp_us = Timing::micros();
    m_reading = reading;
    newSample = true;
    return SensorError::OK;
}

} // namespace drivers
} // namespace sensehub
