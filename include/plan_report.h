// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file plan_report.h
 * @brief Human-readable progress and summary of a test plan run
 *
 * All output goes through spdlog at info level (warn/error for skips and
 * failures) so it follows the configured sinks.
 */

#include "test_catalog.h"

#include <optional>
#include <string>
#include <vector>

namespace hil {

class PlanReport {
  public:
    void plan_info(const std::string& plan_path, const std::optional<std::string>& registry_path,
                   const std::optional<std::string>& board) const;

    void test_started(const std::string& test_name, const std::string& dut_port,
                      const std::optional<std::string>& stub_port) const;
    void test_passed(const std::string& test_name) const;
    void test_failed(const std::string& test_name) const;
    void test_skipped(const std::string& test_name) const;
    void power_cycle(const std::string& device_name, const std::string& hub) const;
    void pass_finished() const;
    void retries(const std::vector<TestCase>& tests) const;

    void summary(const std::vector<std::string>& passed, const std::vector<std::string>& failed,
                 const std::vector<std::string>& skipped) const;

    /**
     * @brief Summary text, one entry per output line
     *
     * - nothing failed or skipped: "all N tests passed"
     * - otherwise "only P out of T test passed" when something passed, or
     *   "all F tests failed" when nothing passed nor was skipped, followed by
     *   the passed, skipped and failed name lists (each only when non-empty)
     */
    static std::vector<std::string> summary_lines(const std::vector<std::string>& passed,
                                                  const std::vector<std::string>& failed,
                                                  const std::vector<std::string>& skipped);
};

} // namespace hil
