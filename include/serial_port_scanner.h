// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief A serial interface currently present on the host
 */
struct SerialPortInfo {
    std::string device;        ///< Device node, e.g. "/dev/ttyACM0"
    std::string name;          ///< Kernel name, e.g. "ttyACM0"
    std::string serial_number; ///< USB iSerial string, empty if none
    std::string manufacturer;  ///< USB iManufacturer string
    std::string product;       ///< USB iProduct string
    std::string description;   ///< Product, or name when no product string
    std::string location;      ///< USB topology path, e.g. "1-1.3"
    uint16_t vid = 0;
    uint16_t pid = 0;
};

/**
 * @brief Abstract serial port enumeration backend
 *
 * Concrete implementations:
 * - SerialPortScannerLinux: sysfs (/sys/class/tty)
 * - MockSerialPortScanner (tests): fixed port list
 */
class SerialPortScanner {
  public:
    virtual ~SerialPortScanner() = default;

    /// Enumerate hardware-backed serial ports
    virtual std::vector<SerialPortInfo> scan() = 0;

    /**
     * @brief Find the device node whose USB serial number equals @p serial_number
     *
     * @param ports Result of a previous scan()
     * @return Device node path, or std::nullopt if no port matches
     */
    static std::optional<std::string> find_by_serial_number(const std::vector<SerialPortInfo>& ports,
                                                            const std::string& serial_number);

    /**
     * @brief Create appropriate backend for current platform
     *
     * @return Scanner instance, nullptr on platforms without support
     */
    static std::unique_ptr<SerialPortScanner> create();
};

#if defined(__linux__)

/**
 * @brief sysfs based enumeration
 *
 * For every /sys/class/tty/<name> with a "device" link, resolves the link
 * and walks up to the USB device directory (the first ancestor holding
 * idVendor) to read serial, manufacturer, product and IDs. Virtual
 * terminals have no device link and are skipped.
 */
class SerialPortScannerLinux : public SerialPortScanner {
  public:
    /**
     * @param sysfs_root Root of sysfs (overridable for tests)
     * @param dev_root Directory holding device nodes
     */
    explicit SerialPortScannerLinux(std::string sysfs_root = "/sys",
                                    std::string dev_root = "/dev");

    std::vector<SerialPortInfo> scan() override;

  private:
    std::optional<SerialPortInfo> read_port(const std::string& tty_name);

    std::string sysfs_root_;
    std::string dev_root_;
};

#endif // __linux__

} // namespace hil
