// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (c) 2025-2026 SenseHub Project
/**
 * @file Bus.h
 * @brief Shared sensor bus interface and per-device handles
 *
 * Several sensor dies sit on one physical I2C bus. The bus itself is a
 * BusChannel shared by every driver; each driver owns one BusDevice per
 * sub-address it talks to. Drivers never see the transport, so the same
 * driver code runs against /dev/i2c-N or a scripted bus in the unit tests.
 *
 * @note Part of SenseHub HAL - Hardware Abstraction Layer
 */

#ifndef SENSEHUB_HAL_BUS_H
#define SENSEHUB_HAL_BUS_H

#include <cstdint>
#include <cstddef>
#include <map>
#include <string>

namespace sensehub {
namespace hal {

/**
 * @brief Register address bit requesting address auto-increment
 *
 * ST sensors increment the register pointer on multi-byte reads when the
 * MSB of the sub-address is set.
 */
constexpr uint8_t kAutoIncrementBit = 0x80;

/**
 * @brief Abstract shared bus
 *
 * Every call either completes or reports failure within the call; there is
 * no timeout beyond what the transport itself enforces. Not safe for
 * concurrent use: exactly one thread may drive a BusChannel.
 *
 * @code
 * LinuxI2CBus bus("/dev/i2c-1");
 * BusDevice imu(&bus, 0x6A);
 * if (imu.open()) {
 *     uint8_t whoAmI = 0;
 *     imu.readRegister(0x0F, whoAmI);
 * }
 * @endcode
 */
class BusChannel {
public:
    virtual ~BusChannel() = default;

    /**
     * @brief Locate and open the bus
     * @return true if the bus is available (idempotent)
     */
    virtual bool begin() = 0;

    /**
     * @brief Acquire a handle for one device address
     * @param address 7-bit device address
     * @return true if the address can be talked to
     */
    virtual bool attach(uint8_t address) = 0;

    /**
     * @brief Release a handle acquired with attach()
     */
    virtual void detach(uint8_t address) = 0;

    /**
     * @brief Write one register
     * @return true if the device acknowledged the write
     */
    virtual bool write(uint8_t address, uint8_t reg, uint8_t value) = 0;

    /**
     * @brief Read one or more registers starting at reg
     *
     * Multi-byte reads need kAutoIncrementBit set in reg for devices that
     * do not auto-increment by default.
     *
     * @return true if all length bytes were read
     */
    virtual bool read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) = 0;

    /**
     * @brief Descriptive bus name (e.g., "/dev/i2c-1")
     */
    virtual const char* getName() const = 0;

protected:
    BusChannel() = default;

private:
    // Non-copyable
    BusChannel(const BusChannel&) = delete;
    BusChannel& operator=(const BusChannel&) = delete;
};


/**
 * @brief One sub-address on a shared BusChannel
 *
 * Owned by exactly one driver. The channel is borrowed and must outlive the
 * handle. Closing (or destroying) the handle releases the address.
 */
class BusDevice {
public:
    BusDevice(BusChannel* bus, uint8_t address);
    ~BusDevice();

    /**
     * @brief Open the shared bus and acquire this address
     * @return true on success
     */
    bool open();

    /**
     * @brief Release the address (safe to call when not open)
     */
    void close();

    bool isOpen() const { return m_open; }

    bool writeRegister(uint8_t reg, uint8_t value);
    bool readRegister(uint8_t reg, uint8_t& value);

    /**
     * @brief Read consecutive registers with auto-increment
     * @param reg First register (auto-increment bit is added here)
     */
    bool readBurst(uint8_t reg, uint8_t* buffer, size_t length);

    uint8_t getAddress() const { return m_address; }
    const char* getBusName() const;

private:
    BusDevice(const BusDevice&) = delete;
    BusDevice& operator=(const BusDevice&) = delete;

    BusChannel* m_bus;
    uint8_t m_address;
    bool m_open;
};


/**
 * @brief BusChannel over the Linux i2c-dev interface
 *
 * Keeps one file descriptor per attached address, each bound with
 * ioctl(I2C_SLAVE), so several drivers can share the adapter without
 * re-binding the slave address on every transfer.
 */
class LinuxI2CBus : public BusChannel {
public:
    /**
     * @param device Adapter node, e.g. "/dev/i2c-1"
     */
    explicit LinuxI2CBus(const char* device);
    ~LinuxI2CBus() override;

    bool begin() override;
    bool attach(uint8_t address) override;
    void detach(uint8_t address) override;
    bool write(uint8_t address, uint8_t reg, uint8_t value) override;
    bool read(uint8_t address, uint8_t reg, uint8_t* buffer, size_t length) override;
    const char* getName() const override { return m_device.c_str(); }

private:
    int handleFor(uint8_t address) const;

    std::string m_device;
    bool m_available;
    std::map<uint8_t, int> m_handles;  // address -> fd
};

} // namespace hal
} // namespace sensehub

#endif // SENSEHUB_HAL_BUS_H
