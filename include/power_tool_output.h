// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file power_tool_output.h
 * @brief Parser for uhubctl's line-oriented status output
 *
 * uhubctl prints one header line per hub followed by one line per port:
 *
 * ```
 * Current status for hub 2-1 [0bda:0411 Generic USB3.2 Hub, USB 3.20, 4 ports, ppps]
 *   Port 3: 0263 power 5gbps U3 enable connect [0bda:0411 Generic USB3.2 Hub ...]
 * Current status for hub 1-1.3 [0bda:5411 Generic USB2.1 Hub, USB 2.10, 4 ports, ppps]
 *   Port 1: 0100 off
 *   Port 3: 0103 power enable connect [04b4:f155 Cypress ... KitProg3 CMSIS-DAP 0D170C5A012D2400]
 * ```
 *
 * All functions here are pure: they take the captured text and return what
 * it describes. A port line belongs to the most recent hub header; port
 * lines seen before any header are ignored.
 *
 * @note USB 3.0 hubs show up twice (one SuperSpeed and one USB 2.0 hub for
 *       the same physical ports). Duplicated observations are returned as-is.
 */

#include <optional>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief Power state of a single hub port
 */
enum class PortStatus {
    OFF,          ///< Port power disabled
    ON,           ///< Port powered, nothing enumerated
    ON_CONNECTED, ///< Port powered and a device is connected
    UNKNOWN       ///< Port not found or line not recognized
};

const char* port_status_name(PortStatus status);

/**
 * @brief Hub location plus port number
 */
struct HubPort {
    std::string hub;
    int port = 0;

    bool operator==(const HubPort& other) const {
        return hub == other.hub && port == other.port;
    }
};

/**
 * @brief One classified port line
 */
struct PortObservation {
    std::string hub;
    int port = 0;
    PortStatus status = PortStatus::UNKNOWN;
};

/// Hub token from a "Current status for hub <hub> [...]" line
std::optional<std::string> parse_hub_header(const std::string& line);

/// Port number from a "Port <n>: ..." line
std::optional<int> parse_port_number(const std::string& line);

/// Status vocabulary for a single port line (see PortStatus)
PortStatus classify_port_line(const std::string& line);

/// Every port line of the output, in order, with its owning hub
std::vector<PortObservation> parse_topology(const std::string& output);

/// All (hub, port) pairs, duplicates preserved
std::vector<HubPort> list_hub_ports(const std::string& output);

/// Status of the first line matching hub/port, UNKNOWN if none
PortStatus find_port_status(const std::string& output, const std::string& hub, int port);

/**
 * @brief First port whose line contains @p match
 *
 * Used to find where a device with a given serial number is plugged in;
 * uhubctl prints the device's USB description on its port line.
 *
 * @return hub/port of the first matching port line, std::nullopt if none
 */
std::optional<HubPort> find_hub_port_by_description(const std::string& output,
                                                    const std::string& match);

} // namespace hil
