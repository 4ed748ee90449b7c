// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file lps25h.cpp
 * @brief LPS25H barometric pressure sensor driver implementation
 *
 * Runs in continuous mode at 25 Hz with block data update, so a burst read
 * never mixes bytes from two conversions.
 */

#include "lps25h.h"
#include "hal/Timing.h"
#include "debug.h"

namespace sensehub {
namespace drivers {

using hal::Timing;

// ============================================================================
// Register Definitions
// ============================================================================

namespace lps25h_reg {
    constexpr uint8_t kResConf      = 0x10;
    constexpr uint8_t kWhoAmI       = 0x0F;
    constexpr uint8_t kCtrlReg1     = 0x20;
    constexpr uint8_t kCtrlReg2     = 0x21;
    constexpr uint8_t kStatusReg    = 0x27;
    constexpr uint8_t kPressOutXL   = 0x28;
    constexpr uint8_t kTempOutL     = 0x2B;
    constexpr uint8_t kFifoCtrl     = 0x2E;
} // namespace lps25h_reg

// CTRL_REG1: power on, ODR 25 Hz, block data update
constexpr uint8_t kCtrl1Value    = 0xC4;
// RES_CONF: 32 pressure / 16 temperature internal averages
constexpr uint8_t kResConfValue  = 0x05;
// FIFO_CTRL: FIFO mean mode, 2-sample moving average
constexpr uint8_t kFifoCtrlValue = 0xC0;
// CTRL_REG2: FIFO enable
constexpr uint8_t kCtrl2Value    = 0x40;

// STATUS_REG
constexpr uint8_t kStatusTempReady  = (1U << 0);
constexpr uint8_t kStatusPressReady = (1U << 1);

constexpr float kPressureLsbPerHpa = 4096.0F;
constexpr float kTempLsbPerDegC    = 480.0F;
constexpr float kTempOffsetDegC    = 42.5F;

// ============================================================================
// Lps25h class implementation
// ============================================================================

Lps25h::Lps25h(hal::BusChannel* bus, uint8_t address)
    : m_dev(bus, address)
    , m_state(DeviceState::UNINITIALIZED)
    , m_observedId(0)
{
}

SensorError Lps25h::init() {
    m_dev.close();
    m_state = DeviceState::UNINITIALIZED;
    m_error.clear();
    m_observedId = 0;

    m_state = DeviceState::CONNECTING;
    if (!m_dev.open()) {
        m_error.set("Failed to connect to LPS25H 0x%02X on %s",
                    m_dev.getAddress(), m_dev.getBusName());
        return fault(SensorError::ERR_CONNECTION);
    }

    m_state = DeviceState::VERIFYING_IDENTITY;
    uint8_t id = 0;
    if (!m_dev.readRegister(lps25h_reg::kWhoAmI, id)) {
        m_error.set("Failed to read LPS25H id");
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }
    m_observedId = id;
    if (id != kLps25hWhoAmI) {
        m_error.set("Incorrect LPS25H id 0x%02X (expected 0x%02X)", id, kLps25hWhoAmI);
        return fault(SensorError::ERR_IDENTITY_MISMATCH);
    }

    m_state = DeviceState::CONFIGURING;
    struct ConfigWrite {
        uint8_t reg;
        uint8_t value;
        const char* name;
    };
    static const ConfigWrite kSequence[] = {
        {lps25h_reg::kCtrlReg1, kCtrl1Value,    "CTRL_REG1"},
        {lps25h_reg::kResConf,  kResConfValue,  "RES_CONF"},
        {lps25h_reg::kFifoCtrl, kFifoCtrlValue, "FIFO_CTRL"},
        {lps25h_reg::kCtrlReg2, kCtrl2Value,    "CTRL_REG2"},
    };

    for (const ConfigWrite& w : kSequence) {
        if (!m_dev.writeRegister(w.reg, w.value)) {
            m_error.set("Failed to set LPS25H %s (0x%02X)", w.name, w.reg);
            return fault(SensorError::ERR_CONFIGURATION_WRITE);
        }
    }

    m_state = DeviceState::READY;
    DBG_PRINT("[LPS25H] Ready on %s (0x%02X)\n", m_dev.getBusName(), m_dev.getAddress());
    return SensorError::OK;
}

SensorError Lps25h::fault(SensorError err) {
    m_state = DeviceState::FAULTED;
    m_dev.close();
    DBG_ERROR("[LPS25H] %s: %s\n", sensorErrorName(err), m_error.c_str());
    return err;
}

SensorError Lps25h::update(bool& newSample) {
    newSample = false;

    if (m_state != DeviceState::READY) {
        return SensorError::ERR_NOT_INITIATED;
    }

    uint8_t status = 0;
    if (!m_dev.readRegister(lps25h_reg::kStatusReg, status)) {
        m_error.set("Failed to read LPS25H status");
        return SensorError::ERR_READ;
    }

    if ((status & (kStatusPressReady | kStatusTempReady)) == 0) {
        return SensorError::OK;
    }

    SensorReading reading;

    if ((status & kStatusPressReady) != 0) {
        uint8_t raw[3];
        if (!m_dev.readBurst(lps25h_reg::kPressOutXL, raw, sizeof(raw))) {
            m_error.set("Failed to read LPS25H pressure");
            return SensorError::ERR_READ;
        }
        const uint32_t counts = static_cast<uint32_t>(raw[0]) |
                                (static_cast<uint32_t>(raw[1]) << 8) |
                                (static_cast<uint32_t>(raw[2]) << 16);
        reading.pressure_hpa = static_cast<float>(counts) / kPressureLsbPerHpa;
        reading.pressure_valid = true;
    }

    if ((status & kStatusTempReady) != 0) {
        uint8_t raw[2];
        if (!m_dev.readBurst(lps25h_reg::kTempOutL, raw, sizeof(raw))) {
            m_error.set("Failed to read LPS25H temperature");
            return SensorError::ERR_READ;
        }
        const int16_t counts = static_cast<int16_t>(static_cast<uint16_t>(raw[0]) |
                                                    (static_cast<uint16_t>(raw[1]) << 8));
        reading.temperature_c = kTempOffsetDegC + static_cast<float>(counts) / kTempLsbPerDegC;
        reading.temperature_valid = true;
    }

    reading.timestamp_us = Timing::micros();
    m_reading = reading;
    newSample = true;
    return SensorError::OK;
}

} // namespace drivers
} // namespace sensehub
