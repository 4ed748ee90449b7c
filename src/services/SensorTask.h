// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file SensorTask.h
 * @brief Multi-sensor polling task
 *
 * Owns a set of drivers and runs them from one worker thread: a one-shot
 * init phase (every driver attempted, in order) followed by a continuous
 * polling loop. Per-device sample counts are rolled into per-window rates
 * and everything readers can see is published as a snapshot under one
 * mutex per tick.
 *
 * @note Part of SenseHub Services Layer
 */

#ifndef SENSEHUB_SERVICES_SENSOR_TASK_H
#define SENSEHUB_SERVICES_SENSOR_TASK_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "drivers/sensor_device.h"
#include "hal/Timing.h"

namespace sensehub {
namespace services {

/**
 * @brief Externally visible state of one device
 *
 * Plain value type: copying it out of the task never touches a driver.
 */
struct SensorSnapshot {
    const char* name = "";
    bool initiated = false;
    char errorMessage[drivers::ErrorText::kCapacity] = {};  ///< Empty if none
    drivers::SensorReading reading;                         ///< Last good sample
    uint32_t sampleRate = 0;     ///< Samples in the last completed window
    uint32_t readCount = 0;      ///< Total samples since start
    uint32_t errorCount = 0;     ///< Total failed update() calls
};

/**
 * @brief SensorTask statistics for monitoring
 */
struct SensorTaskStats {
    uint32_t loop_count;     ///< Completed polling ticks
    uint32_t read_errors;    ///< Failed update() calls, all devices
    uint32_t init_failures;  ///< Devices that did not reach READY
};

/**
 * @brief SensorTask configuration
 */
struct SensorTaskConfig {
    uint32_t tick_delay_us = 2000;    ///< Sleep between ticks (CPU bound, not timing)
    uint32_t window_us = 1000000;     ///< Sample-rate window
    uint64_t (*clock_us)() = nullptr; ///< Rate-window clock, nullptr = Timing::micros
};

class SensorTask {
public:
    using DeviceList = std::vector<std::unique_ptr<drivers::SensorDevice>>;

    /**
     * @brief Take ownership of the drivers and start the worker
     *
     * Drivers are initialized and polled in list order. Any BusChannel the
     * drivers use must outlive the task.
     */
    explicit SensorTask(DeviceList devices, const SensorTaskConfig& config = SensorTaskConfig());

    /**
     * @brief Stops the worker before the drivers are released
     */
    ~SensorTask();

    /**
     * @brief Request stop and wait for the worker to exit (idempotent)
     *
     * After return no further bus access happens.
     */
    void stop();

    /**
     * @brief true once every driver's init attempt has finished
     */
    bool isInitComplete() const { return m_initComplete.load(std::memory_order_acquire); }

    size_t getDeviceCount() const { return m_snapshots.size(); }

    /**
     * @brief Copy the latest published state of one device (thread-safe)
     * @return false if index is out of range
     */
    bool getSnapshot(size_t index, SensorSnapshot& out) const;

    SensorTaskStats getStats() const;

    /**
     * @brief Print all snapshots to stdout
     */
    void printStatus() const;

private:
    // Worker-owned per-device state, never touched by readers
    struct DeviceSlot {
        std::unique_ptr<drivers::SensorDevice> device;
        hal::SampleRateWindow window;
        drivers::ErrorText error;
        drivers::SensorReading reading;
        uint32_t readCount = 0;
        uint32_t errorCount = 0;

        DeviceSlot(std::unique_ptr<drivers::SensorDevice> dev, uint32_t window_us)
            : device(std::move(dev)), window(window_us) {}
    };

    void run();
    void initDevices();
    void pollDevices();
    void publish();

    SensorTaskConfig m_config;
    uint64_t (*m_clock)();

    std::vector<DeviceSlot> m_slots;

    mutable std::mutex m_snapshotMutex;
    std::vector<SensorSnapshot> m_snapshots;  // Guarded by m_snapshotMutex

    std::atomic<bool> m_stopRequested;
    std::atomic<bool> m_initComplete;
    std::atomic<uint32_t> m_loopCount;
    std::atomic<uint32_t> m_readErrors;
    std::atomic<uint32_t> m_initFailures;

    std::mutex m_lifecycleMutex;
    std::thread m_worker;

    SensorTask(const SensorTask&) = delete;
    SensorTask& operator=(const SensorTask&) = delete;
};

} // namespace services
} // namespace sensehub

#endif // SENSEHUB_SERVICES_SENSOR_TASK_H
