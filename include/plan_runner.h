// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file plan_runner.h
 * @brief Executes a test plan with device resolution, power resets and retries
 *
 * One pass over the active tests:
 * 1. resolve DUT and stub through the DeviceResolver
 * 2. skip the test (for good) when a required device has no serial access
 * 3. power cycle every resolved device that sits behind a switch, poll its
 *    port until "on connected" (bounded) and wait the settle delay
 * 4. run the test and record pass or fail
 *
 * Passes repeat over the failed tests that still have retries left.
 * Strictly sequential; the PowerController is used by one call at a time.
 */

#include "device_resolver.h"
#include "plan_report.h"
#include "power_controller.h"
#include "result_tracker.h"
#include "sleep_function.h"
#include "test_invoker.h"

#include <chrono>
#include <string>
#include <vector>

namespace hil {

struct ResetSettings {
    int poll_attempts = 5;
    std::chrono::milliseconds poll_interval{1000};
    std::chrono::milliseconds settle_delay{2000};
};

struct PlanResult {
    std::vector<std::string> passed;
    std::vector<std::string> failed;
    std::vector<std::string> skipped;
    int passes = 0; ///< Number of passes over the (shrinking) test list

    /// 0 when nothing stayed failed, 1 otherwise
    int exit_code() const {
        return failed.empty() ? 0 : 1;
    }
};

class PlanRunner {
  public:
    PlanRunner(DeviceResolver& resolver, TestExecutor& executor, PowerController& power,
               ResetSettings reset = {}, SleepFunction sleep = real_sleep());

    PlanRunner(const PlanRunner&) = delete;
    PlanRunner& operator=(const PlanRunner&) = delete;

    /**
     * @brief Run @p tests until no failed test has retries left
     *
     * @param max_retries Extra passes a failing test gets (negative counts as 0)
     * @throws DocumentError if device resolution cannot read the registry
     */
    PlanResult run(const std::vector<TestCase>& tests, int max_retries);

    /**
     * @brief Power cycle @p device and wait for it to come back
     *
     * No-op for devices without a switch. The poll is bounded; a device that
     * never reports "on connected" still gets the settle delay and the test
     * proceeds.
     */
    void reset_device(const Device& device);

  private:
    DeviceResolver& resolver_;
    TestExecutor& executor_;
    PowerController& power_;
    ResetSettings reset_;
    SleepFunction sleep_;
    PlanReport report_;
};

} // namespace hil
