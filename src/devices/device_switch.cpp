// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device.h"

#include <spdlog/spdlog.h>

namespace hil {

DeviceSwitch::DeviceSwitch(PowerController& controller, SwitchRef ref)
    : controller_(controller), ref_(std::move(ref)) {}

void DeviceSwitch::on() {
    controller_.run_action(PowerAction::ON, ref_.hub, ref_.port);
}

void DeviceSwitch::off() {
    controller_.run_action(PowerAction::OFF, ref_.hub, ref_.port);
}

void DeviceSwitch::reset() {
    controller_.run_action(PowerAction::CYCLE, ref_.hub, ref_.port);
}

PortStatus DeviceSwitch::status() {
    if (!ref_.port) {
        return PortStatus::UNKNOWN;
    }
    return controller_.get_status(ref_.hub, *ref_.port);
}

std::optional<SwitchRef> DeviceSwitch::locate(PowerController& controller,
                                              const std::string& uid) {
    if (uid.empty()) {
        return std::nullopt;
    }

    auto hub_port = controller.get_hub_port_by_desc(uid);
    if (!hub_port) {
        return std::nullopt;
    }
    return SwitchRef{hub_port->hub, hub_port->port};
}

std::vector<SwitchRef> DeviceSwitch::scan(PowerController& controller) {
    std::vector<SwitchRef> refs;
    for (const auto& hub_port : controller.scan_hubs_ports()) {
        refs.push_back({hub_port.hub, hub_port.port});
    }
    return refs;
}

void DeviceSwitch::reset_all(PowerController& controller) {
    std::set<std::string> hubs;
    for (const auto& hub_port : controller.scan_hubs_ports()) {
        hubs.insert(hub_port.hub);
    }

    spdlog::info("[DeviceSwitch] Power cycling {} hubs", hubs.size());
    for (const auto& hub : hubs) {
        controller.run_action(PowerAction::CYCLE, hub, std::nullopt);
    }
}

} // namespace hil
