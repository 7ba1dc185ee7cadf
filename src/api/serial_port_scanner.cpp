// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "serial_port_scanner.h"

#include <spdlog/spdlog.h>

namespace hil {

std::optional<std::string>
SerialPortScanner::find_by_serial_number(const std::vector<SerialPortInfo>& ports,
                                         const std::string& serial_number) {
    if (serial_number.empty()) {
        return std::nullopt;
    }

    for (const auto& port : ports) {
        if (port.serial_number == serial_number) {
            return port.device;
        }
    }
    return std::nullopt;
}

std::unique_ptr<SerialPortScanner> SerialPortScanner::create() {
#if defined(__linux__)
    spdlog::debug("[SerialPortScanner] Linux platform detected - using sysfs backend");
    return std::make_unique<SerialPortScannerLinux>();
#else
    spdlog::info("[SerialPortScanner] Platform does not support serial enumeration");
    return nullptr;
#endif
}

} // namespace hil
