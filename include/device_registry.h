// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file device_registry.h
 * @brief Declared HIL devices bound to live hardware
 *
 * The registry document lists every board the test bench knows about:
 *
 * ```yaml
 * - name: CY8CKIT-062S2-AI
 *   uid: 1106035A012D2400
 *   features: [psoc6, ble]
 * ```
 *
 * Each load binds the declared devices to what is plugged in at that moment:
 * the serial port whose USB serial number equals uid, and the power switch
 * port whose uhubctl description contains uid. Nothing is cached; every call
 * re-reads the document and re-probes the hardware.
 */

#include "device.h"
#include "serial_port_scanner.h"
#include "yaml_document.h"

#include <set>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief One registry record before hardware binding
 */
struct DeviceEntry {
    std::string name;
    std::string uid;
    std::set<std::string> features;
};

class DeviceRegistry {
  public:
    /**
     * @param scanner Serial enumeration backend (must outlive the registry)
     * @param power Power controller used for switch lookup (must outlive the registry)
     */
    DeviceRegistry(SerialPortScanner& scanner, PowerController& power);

    /**
     * @brief Load the registry file and bind every record
     *
     * @return One Device per record, in document order
     * @throws DocumentError if the file is missing or malformed
     */
    std::vector<Device> load(const std::string& registry_path);

    /// Bind already-parsed records to the hardware present right now
    std::vector<Device> bind(const std::vector<DeviceEntry>& entries);

    /**
     * @brief Read registry records without touching hardware
     *
     * @throws DocumentError if the file is missing or malformed
     */
    static std::vector<DeviceEntry> read_entries(const std::string& registry_path);

    /// Parse records from an already loaded YAML list
    static std::vector<DeviceEntry> parse_entries(const YAML::Node& root,
                                                  const std::string& origin);

  private:
    SerialPortScanner& scanner_;
    PowerController& power_;
};

} // namespace hil
