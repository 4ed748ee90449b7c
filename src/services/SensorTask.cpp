// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file SensorTask.cpp
 * @brief Multi-sensor polling task implementation
 *
 * Threading: the worker is the only thread that calls into a driver and
 * the only writer of m_snapshots. Readers copy snapshots under
 * m_snapshotMutex; the mutex is never held across bus I/O.
 */

#include "SensorTask.h"
#include "debug.h"

#include <cstdio>

namespace sensehub {
namespace services {

using drivers::SensorError;
using hal::Timing;

// ============================================================================
// Lifecycle
// ============================================================================

SensorTask::SensorTask(DeviceList devices, const SensorTaskConfig& config)
    : m_config(config)
    , m_clock(config.clock_us != nullptr ? config.clock_us : &Timing::micros)
    , m_stopRequested(false)
    , m_initComplete(false)
    , m_loopCount(0)
    , m_readErrors(0)
    , m_initFailures(0)
{
    m_slots.reserve(devices.size());
    for (auto& device : devices) {
        if (device != nullptr) {
            m_slots.emplace_back(std::move(device), m_config.window_us);
        }
    }

    m_snapshots.resize(m_slots.size());
    for (size_t i = 0; i < m_slots.size(); i++) {
        m_snapshots[i].name = m_slots[i].device->getName();
    }

    m_worker = std::thread(&SensorTask::run, this);
}

SensorTask::~SensorTask() {
    stop();
}

void SensorTask::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycleMutex);
    m_stopRequested.store(true, std::memory_order_release);
    if (m_worker.joinable()) {
        m_worker.join();
        DBG_PRINT("[SensorTask] Stopped after %lu ticks\n",
                  static_cast<unsigned long>(m_loopCount.load(std::memory_order_relaxed)));
    }
}

// ============================================================================
// Worker
// ============================================================================

void SensorTask::run() {
    initDevices();
    publish();
    m_initComplete.store(true, std::memory_order_release);

    const uint64_t start = m_clock();
    for (DeviceSlot& slot : m_slots) {
        slot.window.start(start);
    }

    while (!m_stopRequested.load(std::memory_order_acquire)) {
        pollDevices();

        const uint64_t now = m_clock();
        for (DeviceSlot& slot : m_slots) {
            slot.window.roll(now);
        }

        publish();
        m_loopCount.fetch_add(1, std::memory_order_relaxed);

        if (m_config.tick_delay_us > 0) {
            Timing::delayMicros(m_config.tick_delay_us);
        }
    }
}

void SensorTask::initDevices() {
    for (DeviceSlot& slot : m_slots) {
        if (m_stopRequested.load(std::memory_order_acquire)) {
            slot.error.set("Stopped before init");
            m_initFailures.fetch_add(1, std::memory_order_relaxed);
            continue;
        }

        SensorError err = slot.device->init();
        if (err == SensorError::OK) {
            slot.error.clear();
            DBG_PRINT("[SensorTask] %s initialized\n", slot.device->getName());
        } else {
            slot.error.set("%s", slot.device->lastError());
            m_initFailures.fetch_add(1, std::memory_order_relaxed);
            DBG_WARN("[SensorTask] %s init failed (%s): %s\n", slot.device->getName(),
                     drivers::sensorErrorName(err), slot.error.c_str());
        }
    }
}

void SensorTask::pollDevices() {
    for (DeviceSlot& slot : m_slots) {
        // Init failures stay visible; nothing to poll
        if (!slot.device->initiated()) {
            continue;
        }

        bool newSample = false;
        SensorError err = slot.device->update(newSample);
        if (err == SensorError::OK) {
            slot.error.clear();
            if (newSample) {
                slot.reading = slot.device->readings();
                slot.window.count();
                slot.readCount++;
            }
        } else {
            slot.error.set("%s", slot.device->lastError());
            slot.errorCount++;
            m_readErrors.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

void SensorTask::publish() {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    for (size_t i = 0; i < m_slots.size(); i++) {
        const DeviceSlot& slot = m_slots[i];
        SensorSnapshot& snap = m_snapshots[i];

        snap.initiated = slot.device->initiated();
        snprintf(snap.errorMessage, sizeof(snap.errorMessage), "%s", slot.error.c_str());
        snap.reading = slot.reading;
        snap.sampleRate = slot.window.getRate();
        snap.readCount = slot.readCount;
        snap.errorCount = slot.errorCount;
    }
}

// ============================================================================
// Reader API
// ============================================================================

bool SensorTask::getSnapshot(size_t index, SensorSnapshot& out) const {
    std::lock_guard<std::mutex> lock(m_snapshotMutex);
    if (index >= m_snapshots.size()) {
        return false;
    }
    out = m_snapshots[index];
    return true;
}

SensorTaskStats SensorTask::getStats() const {
    SensorTaskStats stats;
    stats.loop_count = m_loopCount.load(std::memory_order_relaxed);
    stats.read_errors = m_readErrors.load(std::memory_order_relaxed);
    stats.init_failures = m_initFailures.load(std::memory_order_relaxed);
    return stats;
}

void SensorTask::printStatus() const {
    SensorTaskStats stats = getStats();

    printf("\n[SensorTask] Status (%s):\n", isInitComplete() ? "running" : "initializing");
    printf("  Ticks: %lu, read errors: %lu, init failures: %lu\n",
           static_cast<unsigned long>(stats.loop_count),
           static_cast<unsigned long>(stats.read_errors),
           static_cast<unsigned long>(stats.init_failures));

    for (size_t i = 0; i < getDeviceCount(); i++) {
        SensorSnapshot snap;
        if (!getSnapshot(i, snap)) {
            continue;
        }

        printf("  %-8s %s  %3lu Hz  samples: %lu (errors: %lu)\n", snap.name,
               snap.initiated ? "OK  " : "FAIL",
               static_cast<unsigned long>(snap.sampleRate),
               static_cast<unsigned long>(snap.readCount),
               static_cast<unsigned long>(snap.errorCount));
        if (snap.errorMessage[0] != '\0') {
            printf("           error: %s\n", snap.errorMessage);
        }

        const drivers::SensorReading& r = snap.reading;
        if (r.gyro_valid) {
            printf("           Gyro:  [%+7.3f, %+7.3f, %+7.3f] rad/s\n", r.gyro.x, r.gyro.y, r.gyro.z);
        }
        if (r.accel_valid) {
            printf("           Accel: [%+7.3f, %+7.3f, %+7.3f] g (|a| %.3f)\n",
                   r.accel.x, r.accel.y, r.accel.z, r.accel.norm());
        }
        if (r.mag_valid) {
            printf("           Mag:   [%+7.2f, %+7.2f, %+7.2f] uT\n", r.mag.x, r.mag.y, r.mag.z);
        }
        if (r.pressure_valid) {
            printf("           Pressure: %.2f hPa\n", r.pressure_hpa);
        }
        if (r.humidity_valid) {
            printf("           Humidity: %.1f %%rH\n", r.humidity_rh);
        }
        if (r.temperature_valid) {
            printf("           Temp: %.2f C\n", r.temperature_c);
        }
    }
    printf("\n");
}

} // namespace services
} // namespace sensehub
