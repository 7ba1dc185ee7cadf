// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_query.h"

namespace hil {

namespace {

constexpr DeviceField ALL_FIELDS[] = {DeviceField::NAME, DeviceField::UID, DeviceField::ADDRESS,
                                      DeviceField::HUB, DeviceField::PORT};

std::optional<std::string> non_empty(const std::string& value) {
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

const char* device_field_name(DeviceField field) {
    switch (field) {
    case DeviceField::NAME:
        return "name";
    case DeviceField::UID:
        return "uid";
    case DeviceField::ADDRESS:
        return "address";
    case DeviceField::HUB:
        return "hub";
    case DeviceField::PORT:
        return "port";
    }
    return "unknown";
}

std::optional<DeviceField> parse_device_field(const std::string& name) {
    for (DeviceField field : ALL_FIELDS) {
        if (name == device_field_name(field)) {
            return field;
        }
    }
    return std::nullopt;
}

std::vector<std::string> device_field_names() {
    std::vector<std::string> names;
    for (DeviceField field : ALL_FIELDS) {
        names.emplace_back(device_field_name(field));
    }
    return names;
}

std::optional<std::string> query_field(const Device& device, DeviceField field) {
    switch (field) {
    case DeviceField::NAME:
        return non_empty(device.name);
    case DeviceField::UID:
        return non_empty(device.uid);
    case DeviceField::ADDRESS:
        if (!device.access) {
            return std::nullopt;
        }
        return non_empty(device.access->address);
    case DeviceField::HUB:
        if (!device.power_switch) {
            return std::nullopt;
        }
        return non_empty(device.power_switch->hub);
    case DeviceField::PORT:
        if (!device.power_switch || !device.power_switch->port) {
            return std::nullopt;
        }
        return std::to_string(*device.power_switch->port);
    }
    return std::nullopt;
}

bool FieldFilter::matches(const Device& device) const {
    auto actual = query_field(device, field);
    if (!actual) {
        return false;
    }
    if (exact) {
        return *actual == value;
    }
    return actual->find(value) != std::string::npos;
}

std::optional<FieldFilter> parse_field_filter(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        return std::nullopt;
    }

    FieldFilter filter;
    std::string key = text.substr(0, eq);
    if (key.back() == '~') {
        filter.exact = false;
        key.pop_back();
    }

    auto field = parse_device_field(key);
    if (!field) {
        return std::nullopt;
    }
    filter.field = *field;
    filter.value = text.substr(eq + 1);
    return filter;
}

std::vector<std::string> query_devices(const std::vector<Device>& devices, DeviceField field,
                                       const std::vector<FieldFilter>& filters) {
    std::vector<std::string> values;
    for (const auto& device : devices) {
        auto value = query_field(device, field);
        if (!value) {
            continue;
        }

        bool accepted = true;
        for (const auto& filter : filters) {
            if (!filter.matches(device)) {
                accepted = false;
                break;
            }
        }
        if (accepted) {
            values.push_back(std::move(*value));
        }
    }
    return values;
}

std::vector<Device> devices_from_serial_ports(const std::vector<SerialPortInfo>& ports) {
    std::vector<Device> devices;
    devices.reserve(ports.size());
    for (const auto& port : ports) {
        Device device;
        device.name = port.product;
        device.uid = port.serial_number;
        device.access = SerialAccess{port.device};
        devices.push_back(std::move(device));
    }
    return devices;
}

} // namespace hil
