// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "power_tool_output.h"

#include <cctype>
#include <sstream>

namespace hil {

namespace {

constexpr const char* HUB_HEADER_PREFIX = "Current status for hub";
constexpr const char* PORT_PREFIX = "Port";

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

/**
 * @brief Walk the output tracking the current hub section
 *
 * Calls @p on_port for each port line that belongs to a hub. Stops early
 * when the callback returns false.
 */
template <typename Fn> void for_each_port_line(const std::string& output, Fn on_port) {
    std::istringstream stream(output);
    std::string raw;
    std::optional<std::string> current_hub;

    while (std::getline(stream, raw)) {
        std::string line = trim(raw);
        if (line.empty()) {
            continue;
        }

        if (auto hub = parse_hub_header(line)) {
            current_hub = std::move(hub);
            continue;
        }

        auto port = parse_port_number(line);
        if (!current_hub || !port) {
            continue;
        }

        if (!on_port(*current_hub, *port, line)) {
            return;
        }
    }
}

} // namespace

const char* port_status_name(PortStatus status) {
    switch (status) {
    case PortStatus::OFF:
        return "off";
    case PortStatus::ON:
        return "on";
    case PortStatus::ON_CONNECTED:
        return "on connected";
    case PortStatus::UNKNOWN:
        return "unknown";
    }
    return "unknown";
}

std::optional<std::string> parse_hub_header(const std::string& line) {
    if (!starts_with(line, HUB_HEADER_PREFIX)) {
        return std::nullopt;
    }

    // Token right after the first "hub " that is followed by a non-space run
    size_t pos = 0;
    while ((pos = line.find("hub ", pos)) != std::string::npos) {
        size_t start = pos + 4;
        size_t end = start;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
            ++end;
        }
        if (end > start) {
            return line.substr(start, end - start);
        }
        pos = start;
    }
    return std::nullopt;
}

std::optional<int> parse_port_number(const std::string& line) {
    if (!starts_with(line, PORT_PREFIX)) {
        return std::nullopt;
    }

    // "Port <digits>:" somewhere on the line (normally at the very start)
    size_t pos = 0;
    while ((pos = line.find("Port ", pos)) != std::string::npos) {
        size_t start = pos + 5;
        size_t end = start;
        while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) {
            ++end;
        }
        if (end > start && end < line.size() && line[end] == ':') {
            try {
                return std::stoi(line.substr(start, end - start));
            } catch (const std::out_of_range&) {
                return std::nullopt;
            }
        }
        pos = start;
    }
    return std::nullopt;
}

PortStatus classify_port_line(const std::string& line) {
    if (line.find(" off") != std::string::npos) {
        return PortStatus::OFF;
    }
    if (line.find(" power") != std::string::npos) {
        if (line.find("enable connect") != std::string::npos) {
            return PortStatus::ON_CONNECTED;
        }
        return PortStatus::ON;
    }
    return PortStatus::UNKNOWN;
}

std::vector<PortObservation> parse_topology(const std::string& output) {
    std::vector<PortObservation> observations;
    for_each_port_line(output, [&](const std::string& hub, int port, const std::string& line) {
        observations.push_back({hub, port, classify_port_line(line)});
        return true;
    });
    return observations;
}

std::vector<HubPort> list_hub_ports(const std::string& output) {
    std::vector<HubPort> hub_ports;
    for_each_port_line(output, [&](const std::string& hub, int port, const std::string&) {
        hub_ports.push_back({hub, port});
        return true;
    });
    return hub_ports;
}

PortStatus find_port_status(const std::string& output, const std::string& hub, int port) {
    PortStatus status = PortStatus::UNKNOWN;
    for_each_port_line(output, [&](const std::string& line_hub, int line_port,
                                   const std::string& line) {
        if (line_hub == hub && line_port == port) {
            status = classify_port_line(line);
            return false;
        }
        return true;
    });
    return status;
}

std::optional<HubPort> find_hub_port_by_description(const std::string& output,
                                                    const std::string& match) {
    std::optional<HubPort> found;
    for_each_port_line(output, [&](const std::string& hub, int port, const std::string& line) {
        if (line.find(match) != std::string::npos) {
            found = HubPort{hub, port};
            return false;
        }
        return true;
    });
    return found;
}

} // namespace hil
