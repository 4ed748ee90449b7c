// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file Timing.cpp
 * @brief Time, delay and rate utilities implementation
 *
 * @note Part of SenseHub HAL - Hardware Abstraction Layer
 */

#include "Timing.h"

#include <chrono>
#include <thread>

namespace sensehub {
namespace hal {

// ============================================================================
// Timing class implementation
// ============================================================================

static std::chrono::steady_clock::time_point epoch() {
    static const std::chrono::steady_clock::time_point start =
        std::chrono::steady_clock::now();
    return start;
}

uint64_t Timing::micros() {
    auto elapsed = std::chrono::steady_clock::now() - epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

uint64_t Timing::millis() {
    return micros() / 1000ULL;
}

void Timing::delayMicros(uint32_t us) {
    std::this_thread::sleep_for(std::chrono::microseconds(us));
}

void Timing::delayMs(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

uint64_t Timing::elapsedMicros(uint64_t start_us) {
    uint64_t now = micros();
    return (now >= start_us) ? (now - start_us) : 0;
}

// ============================================================================
// SampleRateWindow class implementation
// ============================================================================

SampleRateWindow::SampleRateWindow(uint32_t window_us)
    : m_window_us(window_us)
    , m_start_us(0)
    , m_pending(0)
    , m_rate(0)
{
}

void SampleRateWindow::start(uint64_t now_us) {
    m_start_us = now_us;
    m_pending = 0;
}

bool SampleRateWindow::roll(uint64_t now_us) {
    if (now_us < m_start_us || (now_us - m_start_us) < m_window_us) {
        return false;
    }

    m_rate = m_pending;
    m_pending = 0;
    m_start_us = now_us;
    return true;
}

} // namespace hal
} // namespace sensehub
