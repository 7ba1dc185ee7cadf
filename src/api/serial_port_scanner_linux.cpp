// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#if defined(__linux__)

#include "serial_port_scanner.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <dirent.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace hil {

namespace {

/// First line of a sysfs attribute, trailing whitespace stripped
std::string read_attribute(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }

    std::string value;
    std::getline(file, value);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }
    return value;
}

uint16_t read_hex_attribute(const fs::path& path) {
    std::string value = read_attribute(path);
    if (value.empty()) {
        return 0;
    }
    try {
        return static_cast<uint16_t>(std::stoul(value, nullptr, 16));
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

SerialPortScannerLinux::SerialPortScannerLinux(std::string sysfs_root, std::string dev_root)
    : sysfs_root_(std::move(sysfs_root)), dev_root_(std::move(dev_root)) {}

std::vector<SerialPortInfo> SerialPortScannerLinux::scan() {
    std::vector<SerialPortInfo> ports;
    std::string tty_class = sysfs_root_ + "/class/tty";

    // RAII guard: unique_ptr with custom deleter ensures closedir() is always called
    auto dir_deleter = [](DIR* d) {
        if (d)
            closedir(d);
    };
    std::unique_ptr<DIR, decltype(dir_deleter)> dir(opendir(tty_class.c_str()), dir_deleter);

    if (!dir) {
        spdlog::warn("[SerialPortScanner] Cannot open {}", tty_class);
        return ports;
    }

    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
        if (entry->d_name[0] == '.') {
            continue;
        }
        if (auto port = read_port(entry->d_name)) {
            ports.push_back(std::move(*port));
        }
    }

    std::sort(ports.begin(), ports.end(),
              [](const SerialPortInfo& a, const SerialPortInfo& b) { return a.device < b.device; });

    spdlog::debug("[SerialPortScanner] Found {} serial ports", ports.size());
    return ports;
}

std::optional<SerialPortInfo> SerialPortScannerLinux::read_port(const std::string& tty_name) {
    fs::path device_link = fs::path(sysfs_root_) / "class" / "tty" / tty_name / "device";

    std::error_code ec;
    if (!fs::exists(device_link, ec)) {
        return std::nullopt; // virtual terminal, no backing hardware
    }

    fs::path device_path = fs::canonical(device_link, ec);
    if (ec) {
        spdlog::trace("[SerialPortScanner] Cannot resolve {}: {}", device_link.string(),
                      ec.message());
        return std::nullopt;
    }

    SerialPortInfo info;
    info.name = tty_name;
    info.device = dev_root_ + "/" + tty_name;
    info.description = tty_name;

    // ttyACM: device -> interface; ttyUSB: device -> port -> interface.
    // The USB device directory is the first ancestor carrying idVendor.
    fs::path usb_device;
    fs::path probe = device_path;
    for (int depth = 0; depth < 4 && !probe.empty() && probe != probe.root_path(); ++depth) {
        if (fs::exists(probe / "idVendor", ec)) {
            usb_device = probe;
            break;
        }
        probe = probe.parent_path();
    }

    if (usb_device.empty()) {
        // Platform UART (ttyS*, ttyAMA*): keep it, it simply has no USB identity
        spdlog::trace("[SerialPortScanner] {} is not a USB serial device", tty_name);
        return info;
    }

    info.serial_number = read_attribute(usb_device / "serial");
    info.manufacturer = read_attribute(usb_device / "manufacturer");
    info.product = read_attribute(usb_device / "product");
    info.vid = read_hex_attribute(usb_device / "idVendor");
    info.pid = read_hex_attribute(usb_device / "idProduct");
    info.location = usb_device.filename().string();
    if (!info.product.empty()) {
        info.description = info.product;
    }

    spdlog::trace("[SerialPortScanner] {} serial={} location={}", info.device, info.serial_number,
                  info.location);
    return info;
}

} // namespace hil

#endif // __linux__
