// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
#ifndef SENSEHUB_TEST_FAKE_BUS_H
#define SENSEHUB_TEST_FAKE_BUS_H

// FakeBus: scripted in-memory BusChannel for driver tests.
// Each address has its own 256-byte register file. Reads with the
// auto-increment bit walk consecutive registers; reads without it return the
// same register repeatedly, as a real ST part would. Every transfer is
// logged in order so tests can check sequencing.

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "hal/Bus.h"

namespace sensehub {
namespace test {

struct Transfer {
    bool is_write;
    uint8_t address;
    uint8_t reg;      ///< As sent on the bus (auto-increment bit included)
    uint8_t value;    ///< Writes only
    size_t length;    ///< Reads only
};

class FakeBus : public hal::BusChannel {
public:
    FakeBus() = default;

    // --- Scripting ---

    void setPresent(bool present) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_present = present;
    }

    void refuseAddress(uint8_t address) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_refused.insert(address);
    }

    void setRegister(uint8_t address, uint8_t reg, uint8_t value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_regs[address][reg] = value;
    }

    void setRegisters(uint8_t address, uint8_t firstReg, const std::vector<uint8_t>& values) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < values.size(); i++) {
            m_regs[address][static_cast<uint8_t>(firstReg + i)] = values[i];
        }
    }

    void setInt16(uint8_t address, uint8_t lowReg, int16_t value) {
        const uint16_t u = static_cast<uint16_t>(value);
        setRegisters(address, lowReg, {static_cast<uint8_t>(u & 0xFF), static_cast<uint8_t>(u >> 8)});
    }

    // Fail writes to one register (reg without auto-increment bit)
    void failWrite(uint8_t address, uint8_t reg) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failWrites.insert(std::make_pair(address, reg));
    }

    // Fail reads starting at one register (reg without auto-increment bit)
    void failRead(uint8_t address, uint8_t reg) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failReads.insert(std::make_pair(address, reg));
    }

    void clearFailures() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_failWrites.clear();
        m_failReads.clear();
    }

    // --- Inspection ---

    std::vector<Transfer> transfers() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_transfers;
    }

    std::vector<Transfer> writes() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Transfer> out;
        for (const Transfer& t : m_transfers) {
            if (t.is_write) {
                out.push_back(t);
            }
        }
        return out;
    }

    size_t countReads(uint8_t address, uint8_t reg) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const Transfer& t : m_transfers) {
            if (!t.is_write && t.address == address && t.reg == reg) {
                n++;
            }
        }
        return n;
    }

    bool isAttached(uint8_t address) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_attached.count(address) != 0;
    }

    void clearLog() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfers.clear();
    }

    // --- BusChannel ---

    bool begin() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_present;
    }

    bool attach(uint8_t address) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_present || m_refused.count(address) != 0) {
            return false;
        }
        m_attached.insert(address);
        return true;
    }

    void detach(uint8_t address) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attached.erase(address);
    }

    bool write(uint8_t address, uint8_t reg, uint8_t value) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfers.push_back({true, address, reg, value, 0});
        if (m_attached.count(address) == 0 ||
            m_failWrites.count(std::make_pair(address, reg)) != 0) {
            return false;
        }
        m_regs[address][reg] = value;
        return true;
    }

    bool read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_transfers.push_back({false, address, reg, 0, length});

        const uint8_t base = static_cast<uint8_t>(reg & ~hal::kAutoIncrementBit);
        const bool increment = (reg & hal::kAutoIncrementBit) != 0;

        if (m_attached.count(address) == 0 ||
            m_failReads.count(std::make_pair(address, base)) != 0) {
            return false;
        }

        std::map<uint8_t, uint8_t>& file = m_regs[address];
        for (size_t i = 0; i < length; i++) {
            const uint8_t r = increment ? static_cast<uint8_t>(base + i) : base;
            auto it = file.find(r);
            buffer[i] = (it != file.end()) ? it->second : 0;
        }
        return true;
    }

    const char* getName() const override { return "fake-i2c"; }

private:
    mutable std::mutex m_mutex;
    bool m_present = true;
    std::set<uint8_t> m_refused;
    std::set<uint8_t> m_attached;
    std::map<uint8_t, std::map<uint8_t, uint8_t>> m_regs;
    std::set<std::pair<uint8_t, uint8_t>> m_failWrites;
    std::set<std::pair<uint8_t, uint8_t>> m_failReads;
    std::vector<Transfer> m_transfers;
};

} // namespace test
} // namespace sensehub

#endif // SENSEHUB_TEST_FAKE_BUS_H
