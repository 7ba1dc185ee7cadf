// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file mock_serial_port_scanner.h
 * @brief Serial port scanner returning a configured port list
 */

#include "serial_port_scanner.h"

#include <string>
#include <vector>

using namespace hil;

class MockSerialPortScanner : public SerialPortScanner {
  public:
    MockSerialPortScanner() = default;
    ~MockSerialPortScanner() override = default;

    std::vector<SerialPortInfo> scan() override {
        scan_count_++;
        return ports_;
    }

    /// Add a USB serial port with the given device node and serial number
    void add_port(const std::string& device, const std::string& serial_number,
                  const std::string& product = "KitProg3 CMSIS-DAP") {
        SerialPortInfo info;
        info.device = device;
        info.name = device.substr(device.rfind('/') + 1);
        info.serial_number = serial_number;
        info.product = product;
        info.description = product;
        ports_.push_back(info);
    }

    void clear_ports() {
        ports_.clear();
    }

    int scan_count() const {
        return scan_count_;
    }

  private:
    std::vector<SerialPortInfo> ports_;
    int scan_count_ = 0;
};
