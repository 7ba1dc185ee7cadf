// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the hil-runner executables
 *
 * Each parser returns false when the program should exit without doing any
 * work: either help was printed (help_requested is set, exit 0) or the
 * arguments were invalid (message printed, exit 2).
 */

#include "device_query.h"
#include "power_controller.h"

#include <optional>
#include <string>
#include <vector>

namespace hil {

/// Options shared by all executables
struct CommonCliArgs {
    std::string config_path; ///< --config, empty = HIL_RUNNER_CONFIG or none
    int verbosity = 0;       ///< Number of -v
    std::string log_dest;    ///< --log-dest, empty = auto
    std::string log_file;    ///< --log-file
    bool help_requested = false;
};

/**
 * @brief hil-run-test-plan arguments
 *
 * Two modes:
 * - HIL mode (--hil-devs + --board): devices come from the registry
 * - port mode (default): --dut-port / --stub-port, no power switching
 */
struct RunnerCliArgs {
    CommonCliArgs common;
    std::vector<std::string> test_names; ///< Positional; empty = whole plan
    std::string test_plan;               ///< Absolute path
    std::optional<std::string> hil_devs; ///< Absolute path
    std::optional<std::string> board;
    std::optional<std::string> dut_port;  ///< Port mode only; unset = configured default
    std::optional<std::string> stub_port; ///< Port mode only; unset = configured default
    int max_retries = 0;
    std::string mpy_root_dir; ///< Absolute path of the MicroPython checkout

    bool hil_mode() const {
        return hil_devs.has_value();
    }
};

/**
 * @brief Parse hil-run-test-plan arguments
 *
 * @param exe_dir Directory of the running executable; the default test plan
 *        is exe_dir/test-plan.yml and the default MicroPython root is two
 *        levels above exe_dir
 */
bool parse_runner_cli_args(int argc, char** argv, RunnerCliArgs& args, const std::string& exe_dir);

/// hil-devs-query arguments
struct DevsQueryCliArgs {
    CommonCliArgs common;
    DeviceField field = DeviceField::NAME;
    std::vector<FieldFilter> filters;
    std::optional<std::string> devs_yml;
    bool include_not_connected = false;
};

bool parse_devs_query_cli_args(int argc, char** argv, DevsQueryCliArgs& args);

enum class SwitchCommand { SCAN, STATUS, ACTION, LOCATE, RESET_ALL };

/// hil-switch arguments
struct SwitchCliArgs {
    CommonCliArgs common;
    SwitchCommand command = SwitchCommand::SCAN;
    PowerAction action = PowerAction::CYCLE; ///< For SwitchCommand::ACTION
    std::string hub;
    std::optional<int> port;
    std::string uid; ///< For SwitchCommand::LOCATE
};

bool parse_switch_cli_args(int argc, char** argv, SwitchCliArgs& args);

/**
 * @brief Directory containing the running executable
 *
 * Resolved through /proc/self/exe, falling back to the directory of
 * @p argv0.
 */
std::string executable_dir(const char* argv0);

} // namespace hil
