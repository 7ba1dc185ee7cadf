// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_registry.h"

#include <spdlog/spdlog.h>

namespace hil {

DeviceRegistry::DeviceRegistry(SerialPortScanner& scanner, PowerController& power)
    : scanner_(scanner), power_(power) {}

std::vector<Device> DeviceRegistry::load(const std::string& registry_path) {
    return bind(read_entries(registry_path));
}

std::vector<Device> DeviceRegistry::bind(const std::vector<DeviceEntry>& entries) {
    std::vector<Device> devices;
    devices.reserve(entries.size());

    // One serial enumeration per load, matched against every uid
    std::vector<SerialPortInfo> ports = scanner_.scan();

    for (const auto& entry : entries) {
        Device device;
        device.name = entry.name;
        device.uid = entry.uid;
        device.features = entry.features;

        if (auto node = SerialPortScanner::find_by_serial_number(ports, entry.uid)) {
            device.access = SerialAccess{*node};
        }

        device.power_switch = DeviceSwitch::locate(power_, entry.uid);

        spdlog::debug("[DeviceRegistry] {} ({}): access={} switch={}", device.name, device.uid,
                      device.access ? device.access->address : "none",
                      device.power_switch ? device.power_switch->hub : "none");
        devices.push_back(std::move(device));
    }

    return devices;
}

std::vector<DeviceEntry> DeviceRegistry::read_entries(const std::string& registry_path) {
    return parse_entries(load_yaml_list(registry_path), registry_path);
}

std::vector<DeviceEntry> DeviceRegistry::parse_entries(const YAML::Node& root,
                                                       const std::string& origin) {
    std::vector<DeviceEntry> entries;

    for (const auto& node : root) {
        if (!node.IsMap()) {
            throw DocumentError(origin, "device entries must be maps");
        }

        DeviceEntry entry;
        try {
            if (node["name"]) {
                entry.name = node["name"].as<std::string>();
            }
            if (node["uid"]) {
                entry.uid = node["uid"].as<std::string>();
            }
        } catch (const YAML::Exception& e) {
            throw DocumentError(origin, std::string("invalid device entry: ") + e.what());
        }

        for (auto& feature : scalar_or_list(node["features"], origin, "features")) {
            entry.features.insert(std::move(feature));
        }

        entries.push_back(std::move(entry));
    }

    spdlog::debug("[DeviceRegistry] {} declared devices in {}", entries.size(), origin);
    return entries;
}

} // namespace hil
