// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file device.h
 * @brief HIL device records and their power switch handle
 */

#include "power_controller.h"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief Serial endpoint a device is reachable through
 */
struct SerialAccess {
    std::string address; ///< e.g. "/dev/ttyACM0"
};

/**
 * @brief Power switch location of a device
 *
 * port == std::nullopt addresses every port of the hub.
 */
struct SwitchRef {
    std::string hub;
    std::optional<int> port;

    bool operator==(const SwitchRef& other) const {
        return hub == other.hub && port == other.port;
    }
};

/**
 * @brief A declared board and whatever could be bound to it right now
 *
 * A device with neither access nor power_switch is "not connected" but is
 * still a valid record.
 */
struct Device {
    std::string name;               ///< Board name, e.g. "CY8CKIT-062S2-AI"
    std::string uid;                ///< Hardware serial number (identity key)
    std::set<std::string> features; ///< Free-form tags, also used as version tags
    std::optional<SerialAccess> access;
    std::optional<SwitchRef> power_switch;

    bool is_connected() const {
        return access.has_value();
    }

    bool has_feature(const std::string& feature) const {
        return features.count(feature) > 0;
    }

    /// Serial address, or empty string when not accessible
    std::string address() const {
        return access ? access->address : std::string();
    }
};

/**
 * @brief Power switch operations for one hub/port
 *
 * Thin handle binding a SwitchRef to the controller that drives it. The
 * controller must outlive the handle.
 */
class DeviceSwitch {
  public:
    DeviceSwitch(PowerController& controller, SwitchRef ref);

    void on();
    void off();
    void reset(); ///< Power cycle

    /// Port power status; UNKNOWN for whole-hub references
    PortStatus status();

    const SwitchRef& ref() const {
        return ref_;
    }

    /// Find the switch for the device whose description contains @p uid
    static std::optional<SwitchRef> locate(PowerController& controller, const std::string& uid);

    /// Every hub/port the power tool reports (duplicates preserved)
    static std::vector<SwitchRef> scan(PowerController& controller);

    /**
     * @brief Power cycle every port of every hub
     *
     * Each distinct hub is cycled once. With USB 3.0 hubs the same physical
     * ports are also listed under a second hub location, so those ports may
     * be cycled twice.
     */
    static void reset_all(PowerController& controller);

  private:
    PowerController& controller_;
    SwitchRef ref_;
};

} // namespace hil
