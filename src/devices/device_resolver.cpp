// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_resolver.h"

#include <spdlog/spdlog.h>

namespace hil {

HilDeviceResolver::HilDeviceResolver(DeviceRegistry& registry, std::string registry_path,
                                     std::string board)
    : registry_(registry), registry_path_(std::move(registry_path)), board_(std::move(board)) {}

std::vector<Device>
HilDeviceResolver::matching_devices(const std::vector<Device>& devices,
                                    const std::vector<DeviceRequirement>& requirements) {
    std::vector<Device> matches;
    for (const auto& requirement : requirements) {
        for (const auto& device : devices) {
            if (device.name != requirement.board) {
                continue;
            }
            if (!requirement.version || device.has_feature(*requirement.version)) {
                matches.push_back(device);
            }
        }
    }
    return matches;
}

ResolvedDevices HilDeviceResolver::resolve(const TestCase& test) {
    ResolvedDevices resolved;

    std::vector<DeviceRequirement> dut_requirements =
        test.supported_devices(DeviceRole::DUT, board_);
    if (dut_requirements.empty()) {
        spdlog::debug("[HilDeviceResolver] {} does not run on {}", test.name, board_);
        return resolved;
    }

    // Fresh registry view per test: hardware may have changed since the last one
    std::vector<Device> devices = registry_.load(registry_path_);

    for (auto& device : matching_devices(devices, dut_requirements)) {
        if (device.is_connected()) {
            resolved.dut = std::move(device);
            break;
        }
    }
    if (!resolved.dut.is_connected()) {
        spdlog::debug("[HilDeviceResolver] No connected {} for {}", board_, test.name);
        return resolved;
    }

    if (test.requires_multiple_devices()) {
        std::vector<DeviceRequirement> stub_requirements =
            test.supported_devices(DeviceRole::STUB, board_);
        for (auto& device : matching_devices(devices, stub_requirements)) {
            if (device.is_connected() && device.address() != resolved.dut.address()) {
                resolved.stub = std::move(device);
                break;
            }
        }
        if (!resolved.stub.is_connected()) {
            spdlog::debug("[HilDeviceResolver] No second {} for {}", board_, test.name);
        }
    }

    return resolved;
}

StaticPortDeviceResolver::StaticPortDeviceResolver(std::string dut_port, std::string stub_port)
    : dut_port_(std::move(dut_port)), stub_port_(std::move(stub_port)) {}

ResolvedDevices StaticPortDeviceResolver::resolve(const TestCase& /*test*/) {
    ResolvedDevices resolved;
    if (!dut_port_.empty()) {
        resolved.dut.access = SerialAccess{dut_port_};
    }
    if (!stub_port_.empty()) {
        resolved.stub.access = SerialAccess{stub_port_};
    }
    return resolved;
}

} // namespace hil
