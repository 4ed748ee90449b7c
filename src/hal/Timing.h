// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file Timing.h
 * @brief Time, delay and rate utilities
 *
 * Monotonic timestamps are measured from the first call into Timing, so
 * they start near zero and never jump with wall-clock adjustments.
 *
 * @note Part of SenseHub HAL - Hardware Abstraction Layer
 */

#ifndef SENSEHUB_HAL_TIMING_H
#define SENSEHUB_HAL_TIMING_H

#include <cstdint>

namespace sensehub {
namespace hal {

/**
 * @brief Timing utilities
 */
class Timing {
public:
    /**
     * @brief Get current time in microseconds
     * @return Microseconds since first use (monotonic)
     */
    static uint64_t micros();

    /**
     * @brief Get current time in milliseconds
     */
    static uint64_t millis();

    /**
     * @brief Sleep the calling thread for at least us microseconds
     */
    static void delayMicros(uint32_t us);

    /**
     * @brief Sleep the calling thread for at least ms milliseconds
     */
    static void delayMs(uint32_t ms);

    /**
     * @brief Microseconds elapsed since start_us (from micros())
     */
    static uint64_t elapsedMicros(uint64_t start_us);

private:
    Timing() = delete;  // Static-only class
};


/**
 * @brief Rolling sample-rate counter
 *
 * Counts events inside a fixed window. When the window elapses the count
 * becomes the published rate and a new window starts at that instant, so
 * getRate() always reports the previous completed window and never a
 * partially filled one.
 *
 * Time is passed in by the caller, which keeps the window testable with a
 * synthetic clock.
 *
 * @code
 * SampleRateWindow window(1000000);  // 1 s
 * window.start(Timing::micros());
 *
 * while (running) {
 *     if (readSensor()) {
 *         window.count();
 *     }
 *     window.roll(Timing::micros());
 *     printf("%lu Hz\n", (unsigned long)window.getRate());
 * }
 * @endcode
 */
class SampleRateWindow {
public:
    explicit SampleRateWindow(uint32_t window_us = 1000000);

    /**
     * @brief Begin the first window at now_us, discarding any count
     */
    void start(uint64_t now_us);

    /**
     * @brief Record one event in the current window
     */
    void count() { m_pending++; }

    /**
     * @brief Close the window if it has elapsed
     * @return true if a window boundary was crossed
     */
    bool roll(uint64_t now_us);

    /**
     * @brief Events counted in the last completed window
     */
    uint32_t getRate() const { return m_rate; }

    /**
     * @brief Events counted so far in the open window
     */
    uint32_t getPending() const { return m_pending; }

    uint32_t getWindow() const { return m_window_us; }

private:
    uint32_t m_window_us;
    uint64_t m_start_us;
    uint32_t m_pending;
    uint32_t m_rate;
};

} // namespace hal
} // namespace sensehub

#endif // SENSEHUB_HAL_TIMING_H
