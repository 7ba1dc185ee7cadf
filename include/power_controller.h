// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file power_controller.h
 * @brief Wrapper around the uhubctl USB hub power-control tool
 *
 * uhubctl is the only sensor available for switchable devices: port power
 * state and the identity of whatever is plugged into a port are both read
 * from its text output (see power_tool_output.h).
 *
 * Failure policy: the tool boundary never throws. "No compatible devices
 * detected!" on stderr is the normal answer when no switchable hub is
 * attached, so it is treated as empty output without an error log. Any other
 * failure is logged and also yields empty output, so downstream queries
 * resolve to UNKNOWN / not found.
 *
 * @note Not reentrant. Each invocation overwrites the controller's single
 *       last-output buffer, and each query method parses that buffer right
 *       after its own invocation. Use one controller per logical user, or
 *       serialize invoke+query pairs externally.
 */

#include "power_tool_output.h"
#include "process_runner.h"

#include <optional>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief Power actions understood by uhubctl --action
 */
enum class PowerAction { ON, OFF, CYCLE, TOGGLE };

const char* power_action_name(PowerAction action);

/// Parse "on" / "off" / "cycle" / "toggle"
std::optional<PowerAction> parse_power_action(const std::string& name);

class PowerController {
  public:
    static constexpr const char* DEFAULT_EXECUTABLE = "uhubctl";
    static constexpr const char* NO_DEVICES_MESSAGE = "No compatible devices detected!";

    /**
     * @param runner Process backend (must outlive the controller)
     * @param executable Power tool executable name or path
     */
    explicit PowerController(ProcessRunner& runner,
                             std::string executable = DEFAULT_EXECUTABLE);

    PowerController(const PowerController&) = delete;
    PowerController& operator=(const PowerController&) = delete;

    /**
     * @brief Apply a power action
     *
     * Omitting @p hub applies the action to matching ports of all hubs,
     * omitting @p port applies it to every port of @p hub. A call with
     * neither is refused with a warning.
     */
    void run_action(PowerAction action, const std::optional<std::string>& hub,
                    std::optional<int> port);

    /// Query and classify the power state of one port
    PortStatus get_status(const std::string& hub, int port);

    /// Full scan of every hub/port uhubctl can see, in output order
    std::vector<HubPort> scan_hubs_ports();

    /// Locate the port whose connected device description contains @p match
    std::optional<HubPort> get_hub_port_by_desc(const std::string& match);

    /// Raw stdout of the most recent invocation (empty after a failure)
    const std::string& last_output() const {
        return last_output_;
    }

  private:
    /// Run the tool with @p args, store and return its stdout
    const std::string& invoke(const std::vector<std::string>& args);

    ProcessRunner& runner_;
    std::string executable_;
    std::string last_output_;
};

} // namespace hil
