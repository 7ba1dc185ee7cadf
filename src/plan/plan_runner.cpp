// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "plan_runner.h"

#include <spdlog/spdlog.h>

namespace hil {

PlanRunner::PlanRunner(DeviceResolver& resolver, TestExecutor& executor, PowerController& power,
                       ResetSettings reset, SleepFunction sleep)
    : resolver_(resolver), executor_(executor), power_(power), reset_(reset),
      sleep_(std::move(sleep)) {}

PlanResult PlanRunner::run(const std::vector<TestCase>& tests, int max_retries) {
    ResultTracker tracker(max_retries);
    std::vector<TestCase> active = tests;
    PlanResult result;

    while (!active.empty()) {
        ++result.passes;
        spdlog::debug("[PlanRunner] Pass {} over {} tests", result.passes, active.size());

        for (const auto& test : active) {
            ResolvedDevices devices = resolver_.resolve(test);

            bool available = devices.dut.is_connected() &&
                             (!test.requires_multiple_devices() || devices.stub.is_connected());
            if (!available) {
                tracker.register_skip(test.name);
                report_.test_skipped(test.name);
                continue;
            }

            reset_device(devices.dut);
            reset_device(devices.stub);

            std::optional<std::string> stub_port;
            if (devices.stub.is_connected()) {
                stub_port = devices.stub.address();
            }

            report_.test_started(test.name, devices.dut.address(), stub_port);
            int rc = executor_.run(test, devices.dut.address(), stub_port);

            if (rc != 0) {
                tracker.register_fail(test.name);
                report_.test_failed(test.name);
            } else {
                tracker.register_pass(test.name);
                report_.test_passed(test.name);
            }
        }
        report_.pass_finished();

        active = tracker.filter_retries(active);
        report_.retries(active);
    }

    report_.summary(tracker.passed(), tracker.failed(), tracker.skipped());

    result.passed = tracker.passed();
    result.failed = tracker.failed();
    result.skipped = tracker.skipped();
    return result;
}

void PlanRunner::reset_device(const Device& device) {
    if (!device.power_switch) {
        return;
    }

    report_.power_cycle(device.name, device.power_switch->hub);

    DeviceSwitch device_switch(power_, *device.power_switch);
    device_switch.reset();

    int attempts = 0;
    bool connected = device_switch.status() == PortStatus::ON_CONNECTED;
    while (!connected && attempts < reset_.poll_attempts) {
        sleep_(reset_.poll_interval);
        ++attempts;
        connected = device_switch.status() == PortStatus::ON_CONNECTED;
    }
    if (!connected) {
        spdlog::warn("[PlanRunner] {} not reported connected after {} polls, continuing",
                     device.name, attempts);
    }

    // Boot time for the firmware, applied whether or not the poll converged
    sleep_(reset_.settle_delay);
}

} // namespace hil
