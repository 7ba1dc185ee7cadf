// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "power_controller.h"

#include <spdlog/spdlog.h>

namespace hil {

const char* power_action_name(PowerAction action) {
    switch (action) {
    case PowerAction::ON:
        return "on";
    case PowerAction::OFF:
        return "off";
    case PowerAction::CYCLE:
        return "cycle";
    case PowerAction::TOGGLE:
        return "toggle";
    }
    return "unknown";
}

std::optional<PowerAction> parse_power_action(const std::string& name) {
    if (name == "on")
        return PowerAction::ON;
    if (name == "off")
        return PowerAction::OFF;
    if (name == "cycle")
        return PowerAction::CYCLE;
    if (name == "toggle")
        return PowerAction::TOGGLE;
    return std::nullopt;
}

PowerController::PowerController(ProcessRunner& runner, std::string executable)
    : runner_(runner), executable_(std::move(executable)) {}

void PowerController::run_action(PowerAction action, const std::optional<std::string>& hub,
                                 std::optional<int> port) {
    if (!hub && !port) {
        spdlog::warn("[PowerController] Refusing '{}' without hub or port",
                     power_action_name(action));
        return;
    }

    std::vector<std::string> args = {"--action", power_action_name(action)};
    if (hub) {
        args.push_back("--location");
        args.push_back(*hub);
    }
    if (port) {
        args.push_back("--port");
        args.push_back(std::to_string(*port));
    }

    spdlog::debug("[PowerController] {} hub={} port={}", power_action_name(action),
                  hub.value_or("*"), port ? std::to_string(*port) : "*");
    invoke(args);
}

PortStatus PowerController::get_status(const std::string& hub, int port) {
    const std::string& output = invoke({"--location", hub, "--port", std::to_string(port)});
    PortStatus status = find_port_status(output, hub, port);
    spdlog::trace("[PowerController] status {}:{} = {}", hub, port, port_status_name(status));
    return status;
}

std::vector<HubPort> PowerController::scan_hubs_ports() {
    return list_hub_ports(invoke({}));
}

std::optional<HubPort> PowerController::get_hub_port_by_desc(const std::string& match) {
    const std::string& output = invoke({"--search", match});
    return find_hub_port_by_description(output, match);
}

const std::string& PowerController::invoke(const std::vector<std::string>& args) {
    ProcessRequest request;
    request.argv.reserve(args.size() + 1);
    request.argv.push_back(executable_);
    request.argv.insert(request.argv.end(), args.begin(), args.end());
    request.capture_output = true;

    ProcessResult result = runner_.run(request);

    if (result.launch_failed) {
        spdlog::error("[PowerController] Failed to launch '{}': {}", executable_,
                      result.error_message);
        last_output_.clear();
        return last_output_;
    }

    if (result.exit_code != 0) {
        last_output_.clear();
        if (result.std_err.find(NO_DEVICES_MESSAGE) != std::string::npos) {
            spdlog::debug("[PowerController] No compatible hubs detected");
        } else {
            spdlog::error("[PowerController] '{}' failed (exit code {}): {}",
                          format_command_line(request.argv), result.exit_code, result.std_err);
        }
        return last_output_;
    }

    last_output_ = std::move(result.std_out);
    return last_output_;
}

} // namespace hil
