// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file Bus.cpp
 * @brief Bus handles and Linux i2c-dev transport
 *
 * @note Part of SenseHub HAL - Hardware Abstraction Layer
 */

#include "Bus.h"
#include "debug.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <linux/i2c.h>
#include <linux/i2c-dev.h>

#include <cerrno>
#include <cstring>

namespace sensehub {
namespace hal {

// Valid 7-bit addresses (0x00-0x07 and 0x78-0x7F are reserved by the I2C standard)
constexpr uint8_t kI2cAddrFirst = 0x08;
constexpr uint8_t kI2cAddrLast  = 0x77;

// Largest single read the i2c-dev message length field accepts
constexpr size_t kMaxReadLength = 0xFFFF;

// ============================================================================
// BusDevice class implementation
// ============================================================================

BusDevice::BusDevice(BusChannel* bus, uint8_t address)
    : m_bus(bus)
    , m_address(address)
    , m_open(false)
{
}

BusDevice::~BusDevice() {
    close();
}

bool BusDevice::open() {
    if (m_open) {
        return true;
    }
    if (m_bus == nullptr) {
        return false;
    }

    if (!m_bus->begin()) {
        return false;
    }
    if (!m_bus->attach(m_address)) {
        return false;
    }

    m_open = true;
    return true;
}

void BusDevice::close() {
    if (!m_open) {
        return;
    }
    m_bus->detach(m_address);
    m_open = false;
}

bool BusDevice::writeRegister(uint8_t reg, uint8_t value) {
    if (!m_open) {
        return false;
    }
    return m_bus->write(m_address, reg, value);
}

bool BusDevice::readRegister(uint8_t reg, uint8_t& value) {
    if (!m_open) {
        return false;
    }
    return m_bus->read(m_address, reg, &value, 1);
}

bool BusDevice::readBurst(uint8_t reg, uint8_t* buffer, size_t length) {
    if (!m_open || buffer == nullptr || length == 0) {
        return false;
    }
    return m_bus->read(m_address, static_cast<uint8_t>(reg | kAutoIncrementBit),
                       buffer, length);
}

const char* BusDevice::getBusName() const {
    return (m_bus != nullptr) ? m_bus->getName() : "none";
}

// ============================================================================
// LinuxI2CBus class implementation
// ============================================================================

LinuxI2CBus::LinuxI2CBus(const char* device)
    : m_device(device != nullptr ? device : "")
    , m_available(false)
{
}

LinuxI2CBus::~LinuxI2CBus() {
    for (const auto& entry : m_handles) {
        ::close(entry.second);
    }
    m_handles.clear();
}

bool LinuxI2CBus::begin() {
    if (m_available) {
        return true;
    }

    // Opening the adapter once confirms the node exists and we have access
    int fd = ::open(m_device.c_str(), O_RDWR);
    if (fd < 0) {
        DBG_ERROR("[Bus] Cannot open %s: %s\n", m_device.c_str(), strerror(errno));
        return false;
    }
    ::close(fd);

    m_available = true;
    return true;
}

bool LinuxI2CBus::attach(uint8_t address) {
    if (!m_available) {
        return false;
    }
    if (address < kI2cAddrFirst || address > kI2cAddrLast) {
        DBG_ERROR("[Bus] Address 0x%02X outside 7-bit range\n", address);
        return false;
    }
    if (m_handles.count(address) != 0) {
        return true;
    }

    int fd = ::open(m_device.c_str(), O_RDWR);
    if (fd < 0) {
        DBG_ERROR("[Bus] Cannot open %s for 0x%02X: %s\n",
                  m_device.c_str(), address, strerror(errno));
        return false;
    }

    if (ioctl(fd, I2C_SLAVE, static_cast<unsigned long>(address)) < 0) {
        DBG_ERROR("[Bus] I2C_SLAVE 0x%02X failed: %s\n", address, strerror(errno));
        ::close(fd);
        return false;
    }

    m_handles[address] = fd;
    return true;
}

void LinuxI2CBus::detach(uint8_t address) {
    auto it = m_handles.find(address);
    if (it == m_handles.end()) {
        return;
    }
    ::close(it->second);
    m_handles.erase(it);
}

bool LinuxI2CBus::write(uint8_t address, uint8_t reg, uint8_t value) {
    int fd = handleFor(address);
    if (fd < 0) {
        return false;
    }

    uint8_t buf[2] = {reg, value};
    return ::write(fd, buf, sizeof(buf)) == static_cast<ssize_t>(sizeof(buf));
}

bool LinuxI2CBus::read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) {
    int fd = handleFor(address);
    if (fd < 0 || buffer == nullptr || length == 0 || length > kMaxReadLength) {
        return false;
    }

    // Register pointer write and data read in one transfer (repeated start),
    // so no other master can move the pointer in between
    struct i2c_msg msgs[2];
    msgs[0].addr = address;
    msgs[0].flags = 0;
    msgs[0].len = 1;
    msgs[0].buf = &reg;
    msgs[1].addr = address;
    msgs[1].flags = I2C_M_RD;
    msgs[1].len = static_cast<uint16_t>(length);
    msgs[1].buf = buffer;

    struct i2c_rdwr_ioctl_data transfer;
    transfer.msgs = msgs;
    transfer.nmsgs = 2;

    return ioctl(fd, I2C_RDWR, &transfer) == 2;
}

int LinuxI2CBus::handleFor(uint8_t address) const {
    auto it = m_handles.find(address);
    return (it != m_handles.end()) ? it->second : -1;
}

} // namespace hal
} // namespace sensehub
