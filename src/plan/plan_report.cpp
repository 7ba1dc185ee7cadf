// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "plan_report.h"

#include <spdlog/spdlog.h>

namespace hil {

namespace {

constexpr size_t RULE_WIDTH = 41;

std::string join_names(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ' ';
        }
        joined += name;
    }
    return joined;
}

} // namespace

void PlanReport::plan_info(const std::string& plan_path,
                           const std::optional<std::string>& registry_path,
                           const std::optional<std::string>& board) const {
    spdlog::info(std::string(RULE_WIDTH, '#'));
    if (board) {
        spdlog::info("> board        : {}", *board);
    }
    spdlog::info("test plan file : {}", plan_path);
    if (registry_path) {
        spdlog::info("hil devs file  : {}", *registry_path);
    }
    spdlog::info(std::string(RULE_WIDTH, '#'));
}

void PlanReport::test_started(const std::string& test_name, const std::string& dut_port,
                              const std::optional<std::string>& stub_port) const {
    spdlog::info(std::string(RULE_WIDTH, '-'));
    spdlog::info("> running test : {}", test_name);
    spdlog::info("dut port       : {}", dut_port);
    if (stub_port) {
        spdlog::info("stub port      : {}", *stub_port);
    }
}

void PlanReport::test_passed(const std::string& test_name) const {
    spdlog::info("> passed test  : {}", test_name);
}

void PlanReport::test_failed(const std::string& test_name) const {
    spdlog::error("> failed test  : {}", test_name);
}

void PlanReport::test_skipped(const std::string& test_name) const {
    spdlog::info(std::string(RULE_WIDTH, '-'));
    spdlog::warn("> skipped test : {}", test_name);
}

void PlanReport::power_cycle(const std::string& device_name, const std::string& hub) const {
    spdlog::info("Power cycling {} on hub {}", device_name.empty() ? "device" : device_name, hub);
}

void PlanReport::pass_finished() const {
    spdlog::info(std::string(RULE_WIDTH, '-'));
}

void PlanReport::retries(const std::vector<TestCase>& tests) const {
    if (tests.empty()) {
        return;
    }
    std::vector<std::string> names;
    names.reserve(tests.size());
    for (const auto& test : tests) {
        names.push_back(test.name);
    }
    spdlog::info(std::string(RULE_WIDTH, '#'));
    spdlog::warn("> retry tests  : {}", join_names(names));
    spdlog::info(std::string(RULE_WIDTH, '#'));
}

void PlanReport::summary(const std::vector<std::string>& passed,
                         const std::vector<std::string>& failed,
                         const std::vector<std::string>& skipped) const {
    spdlog::info(std::string(RULE_WIDTH, '#'));
    for (const auto& line : summary_lines(passed, failed, skipped)) {
        spdlog::info("{}", line);
    }
    spdlog::info(std::string(RULE_WIDTH, '#'));
}

std::vector<std::string> PlanReport::summary_lines(const std::vector<std::string>& passed,
                                                   const std::vector<std::string>& failed,
                                                   const std::vector<std::string>& skipped) {
    std::vector<std::string> lines;
    size_t total = passed.size() + failed.size() + skipped.size();

    if (failed.empty() && skipped.empty()) {
        lines.push_back(fmt::format("> test summary : all {} tests passed", passed.size()));
        return lines;
    }

    if (!passed.empty()) {
        lines.push_back(
            fmt::format("> test summary : only {} out of {} test passed", passed.size(), total));
    } else if (skipped.empty()) {
        lines.push_back(fmt::format("> test summary : all {} tests failed", failed.size()));
    } else {
        lines.push_back("> test summary :");
    }

    if (!passed.empty()) {
        lines.push_back(" - passed      : " + join_names(passed));
    }
    if (!skipped.empty()) {
        lines.push_back(" - skipped     : " + join_names(skipped));
    }
    if (!failed.empty()) {
        lines.push_back(" - failed      : " + join_names(failed));
    }
    return lines;
}

} // namespace hil
