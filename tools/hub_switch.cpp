// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file hub_switch.cpp
 * @brief hil-switch: manual USB port power control
 *
 * Usage: hil-switch <command> [arguments]
 * Examples:
 *   hil-switch scan
 *   hil-switch status 1-1 2
 *   hil-switch cycle 1-1 2
 *   hil-switch locate 1106035A012D2400
 *   hil-switch reset-all
 */

#include "app_setup.h"
#include "cli_args.h"
#include "config.h"
#include "device.h"
#include "power_controller.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace hil;

int main(int argc, char** argv) {
    SwitchCliArgs args;
    if (!parse_switch_cli_args(argc, argv, args)) {
        return args.common.help_requested ? 0 : 2;
    }

    if (!init_logging_and_config(args.common, spdlog::level::warn)) {
        return 1;
    }

    std::unique_ptr<ProcessRunner> process_runner = ProcessRunner::create();
    PowerController power(*process_runner, Config::get_instance()->get(
                                               "/power_tool/executable",
                                               PowerController::DEFAULT_EXECUTABLE));

    switch (args.command) {
    case SwitchCommand::SCAN:
        for (const auto& ref : DeviceSwitch::scan(power)) {
            std::cout << ref.hub << " " << (ref.port ? std::to_string(*ref.port) : "-") << "\n";
        }
        return 0;

    case SwitchCommand::STATUS: {
        DeviceSwitch device_switch(power, SwitchRef{args.hub, args.port});
        std::cout << port_status_name(device_switch.status()) << "\n";
        return 0;
    }

    case SwitchCommand::ACTION:
        power.run_action(args.action, args.hub, args.port);
        std::cout << power.last_output();
        return 0;

    case SwitchCommand::LOCATE: {
        auto ref = DeviceSwitch::locate(power, args.uid);
        if (!ref) {
            spdlog::error("[Switch] No switchable port found for {}", args.uid);
            return 1;
        }
        std::cout << ref->hub << " " << (ref->port ? std::to_string(*ref->port) : "-") << "\n";
        return 0;
    }

    case SwitchCommand::RESET_ALL:
        DeviceSwitch::reset_all(power);
        return 0;
    }
    return 2;
}
