// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file sensor_device.h
 * @brief Common driver capability, result codes and reading type
 *
 * Every chip driver implements SensorDevice. The polling supervisor only
 * ever holds SensorDevice pointers, so adding a chip never touches the
 * polling loop.
 */

#ifndef SENSEHUB_DRIVERS_SENSOR_DEVICE_H
#define SENSEHUB_DRIVERS_SENSOR_DEVICE_H

#include <cstddef>
#include <cstdint>

#include "math/vec3.h"

namespace sensehub {
namespace drivers {

// ============================================================================
// Result Codes
// ============================================================================

/**
 * @brief Driver operation result
 *
 * Everything except ERR_READ and ERR_NOT_INITIATED is an init-time failure
 * that leaves the driver FAULTED.
 */
enum class SensorError : uint8_t {
    OK = 0,
    ERR_CONFIGURATION,        ///< Illegal profile selection
    ERR_CONNECTION,           ///< Bus or sub-address handle unavailable
    ERR_BOOT,                 ///< Reset write rejected
    ERR_IDENTITY_MISMATCH,    ///< WHO_AM_I wrong or unreadable
    ERR_CONFIGURATION_WRITE,  ///< Control register write rejected
    ERR_READ,                 ///< Steady-state bus read failed
    ERR_NOT_INITIATED,        ///< update() called before READY
};

/**
 * @brief Short name for a result code (e.g. "ERR_READ")
 */
const char* sensorErrorName(SensorError err);

/**
 * @brief Driver lifecycle
 *
 * UNINITIALIZED -> CONNECTING -> BOOTING -> VERIFYING_IDENTITY ->
 * CONFIGURING -> READY. Any failure goes to FAULTED, which is terminal
 * until init() is called again.
 */
enum class DeviceState : uint8_t {
    UNINITIALIZED = 0,
    CONNECTING,
    BOOTING,
    VERIFYING_IDENTITY,
    CONFIGURING,
    READY,
    FAULTED,
};

const char* deviceStateName(DeviceState state);

// ============================================================================
// Reading
// ============================================================================

/**
 * @brief One timestamped sample
 *
 * Each driver fills only the quantities it measures and marks them valid.
 * A reading is replaced as a whole by the next one, never merged.
 */
struct SensorReading {
    uint64_t timestamp_us = 0;    ///< Monotonic, from hal::Timing::micros()

    Vec3 gyro;                    ///< rad/s
    Vec3 accel;                   ///< g
    Vec3 mag;                     ///< uT

    float pressure_hpa = 0.0f;
    float temperature_c = 0.0f;
    float humidity_rh = 0.0f;     ///< Relative humidity, %

    bool gyro_valid = false;
    bool accel_valid = false;
    bool mag_valid = false;
    bool pressure_valid = false;
    bool temperature_valid = false;
    bool humidity_valid = false;
};

// ============================================================================
// Error Text
// ============================================================================

/**
 * @brief Fixed-size, printf-formatted error message
 *
 * Drivers keep the text of their most recent failure here. No heap use, so
 * formatting an error can never itself fail.
 */
class ErrorText {
public:
    static constexpr size_t kCapacity = 96;

    void set(const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    void clear() { m_text[0] = '\0'; }

    const char* c_str() const { return m_text; }
    bool empty() const { return m_text[0] == '\0'; }

private:
    char m_text[kCapacity] = {};
};

// ============================================================================
// Driver Capability
// ============================================================================

/**
 * @brief Capability shared by all chip drivers
 *
 * Not thread-safe. A driver is driven by exactly one thread (the polling
 * supervisor's worker) for its whole life.
 */
class SensorDevice {
public:
    virtual ~SensorDevice() = default;

    /**
     * @brief Run the initialization state machine
     * @return OK once READY, otherwise the failure (driver is FAULTED and
     *         lastError() describes it)
     */
    virtual SensorError init() = 0;

    /**
     * @brief Poll for a new sample
     * @param newSample Set true if readings() was replaced
     * @return OK (with or without a new sample), ERR_READ on a bus failure,
     *         ERR_NOT_INITIATED if not READY
     */
    virtual SensorError update(bool& newSample) = 0;

    /**
     * @brief Most recent reading (all flags false before the first sample)
     */
    virtual const SensorReading& readings() const = 0;

    /**
     * @brief true once init() has reached READY
     */
    virtual bool initiated() const = 0;

    virtual const char* getName() const = 0;

    /**
     * @brief Text of the most recent failure, empty if none
     */
    virtual const char* lastError() const = 0;

protected:
    SensorDevice() = default;

private:
    // Non-copyable
    SensorDevice(const SensorDevice&) = delete;
    SensorDevice& operator=(const SensorDevice&) = delete;
};

} // namespace drivers
} // namespace sensehub

#endif // SENSEHUB_DRIVERS_SENSOR_DEVICE_H
