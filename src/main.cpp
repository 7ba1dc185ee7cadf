// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief hil-run-test-plan: run a MicroPython test plan on attached boards
 *
 * Examples:
 *   hil-run-test-plan --hil-devs devs.yml -b CY8CKIT-062S2-AI --max-retries 1
 *   hil-run-test-plan -d /dev/ttyACM0 -s /dev/ttyACM1 network_ble
 */

#include "app_setup.h"
#include "cli_args.h"
#include "config.h"
#include "device_registry.h"
#include "device_resolver.h"
#include "plan_report.h"
#include "plan_runner.h"
#include "power_controller.h"
#include "serial_port_scanner.h"
#include "test_catalog.h"
#include "test_invoker.h"
#include "yaml_document.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

using namespace hil;

namespace {

ResetSettings reset_settings_from_config(Config& config) {
    ResetSettings reset;
    reset.poll_attempts = config.get<int>("/reset/poll_attempts", reset.poll_attempts);
    reset.poll_interval = std::chrono::milliseconds(
        config.get<int>("/reset/poll_interval_ms", static_cast<int>(reset.poll_interval.count())));
    reset.settle_delay = std::chrono::milliseconds(
        config.get<int>("/reset/settle_ms", static_cast<int>(reset.settle_delay.count())));
    return reset;
}

int run_plan(const RunnerCliArgs& args, Config& config) {
    std::vector<TestCase> tests = TestCatalog::select(TestCatalog::load(args.test_plan),
                                                      args.test_names);

    std::unique_ptr<ProcessRunner> process_runner = ProcessRunner::create();
    PowerController power(*process_runner,
                          config.get("/power_tool/executable", PowerController::DEFAULT_EXECUTABLE));

    std::unique_ptr<SerialPortScanner> scanner;
    std::unique_ptr<DeviceRegistry> registry;
    std::unique_ptr<DeviceResolver> resolver;

    if (args.hil_mode()) {
        // Surface registry problems before the first test runs
        size_t declared = DeviceRegistry::read_entries(*args.hil_devs).size();
        spdlog::debug("[Main] {} devices declared in {}", declared, *args.hil_devs);

        scanner = SerialPortScanner::create();
        if (!scanner) {
            spdlog::error("[Main] Serial port enumeration is not supported on this platform");
            return 1;
        }
        registry = std::make_unique<DeviceRegistry>(*scanner, power);
        resolver = std::make_unique<HilDeviceResolver>(*registry, *args.hil_devs, *args.board);
    } else {
        std::string dut_port =
            args.dut_port ? *args.dut_port : config.get("/runner/default_dut_port", "/dev/ttyACM0");
        std::string stub_port = args.stub_port
                                    ? *args.stub_port
                                    : config.get("/runner/default_stub_port", "/dev/ttyACM1");
        resolver = std::make_unique<StaticPortDeviceResolver>(dut_port, stub_port);
    }

    InvokerSettings invoker_settings;
    invoker_settings.python = config.get("/runner/python", "python");
    invoker_settings.mpy_test_dir = (std::filesystem::path(args.mpy_root_dir) / "tests").string();
    TestInvoker invoker(*process_runner, invoker_settings);

    PlanReport report;
    report.plan_info(args.test_plan, args.hil_devs, args.board);

    PlanRunner runner(*resolver, invoker, power, reset_settings_from_config(config));
    PlanResult result = runner.run(tests, args.max_retries);

    spdlog::debug("[Main] Finished after {} passes", result.passes);
    return result.exit_code();
}

} // namespace

int main(int argc, char** argv) {
    RunnerCliArgs args;
    if (!parse_runner_cli_args(argc, argv, args, executable_dir(argv[0]))) {
        return args.common.help_requested ? 0 : 2;
    }

    // Progress and summary are info messages, so info is the floor here
    if (!init_logging_and_config(args.common, spdlog::level::info)) {
        return 1;
    }

    try {
        return run_plan(args, *Config::get_instance());
    } catch (const DocumentError& e) {
        spdlog::error("[Main] {}", e.what());
        return 1;
    }
}
