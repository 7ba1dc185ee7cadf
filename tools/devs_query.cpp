// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file devs_query.cpp
 * @brief hil-devs-query: print device fields for shell scripts
 *
 * Usage: hil-devs-query <field> [-f field=value...] [-y devs.yml] [--not-connected]
 * Example: hil-devs-query address -f name=CY8CKIT-062S2-AI -y devs.yml
 *
 * Without -y the devices are the serial ports currently present. With -y
 * they come from the registry, limited to connected boards unless
 * --not-connected is given.
 */

#include "app_setup.h"
#include "cli_args.h"
#include "config.h"
#include "device_query.h"
#include "device_registry.h"
#include "power_controller.h"
#include "serial_port_scanner.h"
#include "yaml_document.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

using namespace hil;

int main(int argc, char** argv) {
    DevsQueryCliArgs args;
    if (!parse_devs_query_cli_args(argc, argv, args)) {
        return args.common.help_requested ? 0 : 2;
    }

    // stdout carries the result; keep the console quiet unless asked
    if (!init_logging_and_config(args.common, spdlog::level::warn)) {
        return 1;
    }

    std::unique_ptr<SerialPortScanner> scanner = SerialPortScanner::create();
    if (!scanner) {
        spdlog::error("[DevsQuery] Serial port enumeration is not supported on this platform");
        return 1;
    }

    std::vector<Device> devices;
    if (args.devs_yml) {
        std::unique_ptr<ProcessRunner> process_runner = ProcessRunner::create();
        PowerController power(*process_runner,
                              Config::get_instance()->get("/power_tool/executable",
                                                          PowerController::DEFAULT_EXECUTABLE));
        DeviceRegistry registry(*scanner, power);
        try {
            devices = registry.load(*args.devs_yml);
        } catch (const DocumentError& e) {
            spdlog::error("[DevsQuery] {}", e.what());
            return 1;
        }

        if (!args.include_not_connected) {
            std::vector<Device> connected;
            for (auto& device : devices) {
                if (device.is_connected()) {
                    connected.push_back(std::move(device));
                }
            }
            devices = std::move(connected);
        }
    } else {
        devices = devices_from_serial_ports(scanner->scan());
    }

    std::vector<std::string> values = query_devices(devices, args.field, args.filters);

    for (size_t i = 0; i < values.size(); i++) {
        std::cout << (i ? " " : "") << values[i];
    }
    std::cout << "\n";
    return 0;
}
