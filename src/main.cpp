// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file main.cpp
 * @brief SenseHub demo entry point
 *
 * Polls the Sense HAT sensor set (LSM9DS1, LPS25H, HTS221) on one I2C bus
 * and prints the published snapshots once per second until SIGINT/SIGTERM.
 *
 * Usage: sensehub_demo [bus-device]   (default /dev/i2c-1)
 */

#include "sensehub/config.h"
#include "hal/Bus.h"
#include "hal/Timing.h"
#include "drivers/lsm9ds1.h"
#include "drivers/lps25h.h"
#include "drivers/hts221.h"
#include "services/SensorTask.h"
#include "debug.h"

#include <atomic>
#include <csignal>
#include <memory>
#include <utility>
#include <stdio.h>

using namespace sensehub;

// ============================================================================
// Shutdown Signal
// ============================================================================

static std::atomic<bool> g_running{true};

static void onSignal(int /*signum*/) {
    g_running.store(false, std::memory_order_relaxed);
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    const char* busDevice = (argc > 1) ? argv[1] : board::kDefaultBusDevice;

    printf("SenseHub v%s\n", kVersionString);
    printf("Bus: %s\n", busDevice);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    // Bus must outlive the task (drivers borrow it)
    hal::LinuxI2CBus bus(busDevice);

    services::SensorTask::DeviceList devices;
#if SENSEHUB_FEATURE_IMU
    devices.push_back(std::make_unique<drivers::Lsm9ds1>(
        &bus, board::kAddrLsm9ds1AccelGyro, board::kAddrLsm9ds1Mag));
#endif
#if SENSEHUB_FEATURE_PRESSURE
    devices.push_back(std::make_unique<drivers::Lps25h>(&bus, board::kAddrLps25h));
#endif
#if SENSEHUB_FEATURE_HUMIDITY
    devices.push_back(std::make_unique<drivers::Hts221>(&bus, board::kAddrHts221));
#endif

    services::SensorTask task(std::move(devices));

    uint64_t lastPrintMs = hal::Timing::millis();
    while (g_running.load(std::memory_order_relaxed)) {
        hal::Timing::delayMs(50);

        const uint64_t nowMs = hal::Timing::millis();
        if (task.isInitComplete() && nowMs - lastPrintMs >= board::kStatusPrintIntervalMs) {
            lastPrintMs = nowMs;
            task.printStatus();
        }
    }

    DBG_PRINT("[main] Shutting down\n");
    task.stop();

    // Non-zero exit when no device reached READY
    services::SensorTaskStats stats = task.getStats();
    return (stats.init_failures == task.getDeviceCount()) ? 1 : 0;
}
