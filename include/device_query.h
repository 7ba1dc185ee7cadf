// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file device_query.h
 * @brief Field lookup and filtering over device records
 *
 * Backs the hil-devs-query tool, e.g. "all serial addresses of connected
 * CY8CKIT-062S2-AI boards":
 *
 *     hil-devs-query address -f name=CY8CKIT-062S2-AI -y devs.yml
 */

#include "device.h"
#include "serial_port_scanner.h"

#include <optional>
#include <string>
#include <vector>

namespace hil {

/// Queryable device fields
enum class DeviceField { NAME, UID, ADDRESS, HUB, PORT };

const char* device_field_name(DeviceField field);
std::optional<DeviceField> parse_device_field(const std::string& name);

/// Every field name accepted by parse_device_field(), for help text
std::vector<std::string> device_field_names();

/**
 * @brief Value of @p field for @p device
 *
 * std::nullopt when the device has no value for it: empty name/uid, no
 * serial access for ADDRESS, no switch for HUB, whole-hub switch for PORT.
 */
std::optional<std::string> query_field(const Device& device, DeviceField field);

struct FieldFilter {
    DeviceField field = DeviceField::NAME;
    std::string value;
    bool exact = true; ///< false: substring match

    bool matches(const Device& device) const;
};

/**
 * @brief Parse "field=value" (exact) or "field~=value" (substring)
 *
 * @return std::nullopt for a missing '=', an unknown field or an empty field name
 */
std::optional<FieldFilter> parse_field_filter(const std::string& text);

/// Values of @p field for every device passing all @p filters and having the field
std::vector<std::string> query_devices(const std::vector<Device>& devices, DeviceField field,
                                       const std::vector<FieldFilter>& filters);

/**
 * @brief Device records for the serial ports currently present
 *
 * Only access and uid (the port's serial number) are known; the name is the
 * USB product string.
 */
std::vector<Device> devices_from_serial_ports(const std::vector<SerialPortInfo>& ports);

} // namespace hil
