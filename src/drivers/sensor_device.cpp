// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file sensor_device.cpp
 * @brief Result code names and error text formatting
 */

#include "sensor_device.h"

#include <cstdarg>
#include <cstdio>

namespace sensehub {
namespace drivers {

const char* sensorErrorName(SensorError err) {
    switch (err) {
        case SensorError::OK:                      return "OK";
        case SensorError::ERR_CONFIGURATION:       return "ERR_CONFIGURATION";
        case SensorError::ERR_CONNECTION:          return "ERR_CONNECTION";
        case SensorError::ERR_BOOT:                return "ERR_BOOT";
        case SensorError::ERR_IDENTITY_MISMATCH:   return "ERR_IDENTITY_MISMATCH";
        case SensorError::ERR_CONFIGURATION_WRITE: return "ERR_CONFIGURATION_WRITE";
        case SensorError::ERR_READ:                return "ERR_READ";
        case SensorError::ERR_NOT_INITIATED:       return "ERR_NOT_INITIATED";
    }
    return "UNKNOWN";
}

const char* deviceStateName(DeviceState state) {
    switch (state) {
        case DeviceState::UNINITIALIZED:      return "UNINITIALIZED";
        case DeviceState::CONNECTING:         return "CONNECTING";
        case DeviceState::BOOTING:            return "BOOTING";
        case DeviceState::VERIFYING_IDENTITY: return "VERIFYING_IDENTITY";
        case DeviceState::CONFIGURING:        return "CONFIGURING";
        case DeviceState::READY:              return "READY";
        case DeviceState::FAULTED:            return "FAULTED";
    }
    return "UNKNOWN";
}

void ErrorText::set(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(m_text, sizeof(m_text), fmt, args);
    va_end(args);

    if (n < 0) {
        // Encoding error: keep something non-empty so the failure still shows
        snprintf(m_text, sizeof(m_text), "%s", "unformattable error");
    }
}

} // namespace drivers
} // namespace sensehub
