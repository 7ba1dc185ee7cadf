// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file process_runner.h
 * @brief Blocking subprocess execution for external tools
 *
 * Every external collaborator (the USB hub power tool, the MicroPython test
 * runners, custom scripts) is launched through this interface. Commands are
 * executed directly via exec, never through a shell, so arguments such as
 * port names or search strings are passed verbatim.
 */

#include <memory>
#include <string>
#include <vector>

namespace hil {

/**
 * @brief Description of a single process launch
 */
struct ProcessRequest {
    std::vector<std::string> argv; ///< argv[0] is the executable (PATH lookup applies)
    std::string working_dir;       ///< Empty = inherit current directory
    bool capture_output = false;   ///< true = collect stdout/stderr, false = inherit terminal
};

/**
 * @brief Outcome of a process launch
 */
struct ProcessResult {
    int exit_code = -1;         ///< Child exit status, -1 if terminated by a signal
    std::string std_out;        ///< Captured stdout (only when capture_output)
    std::string std_err;        ///< Captured stderr (only when capture_output)
    bool launch_failed = false; ///< fork/pipe failed, child never ran
    std::string error_message;  ///< Set when launch_failed

    bool success() const {
        return !launch_failed && exit_code == 0;
    }
};

/**
 * @brief Abstract process execution backend
 *
 * run() blocks until the child exits. Implementations must not throw.
 */
class ProcessRunner {
  public:
    virtual ~ProcessRunner() = default;

    virtual ProcessResult run(const ProcessRequest& request) = 0;

    /**
     * @brief Create the process runner for the current platform
     */
    static std::unique_ptr<ProcessRunner> create();
};

/**
 * @brief fork/execvp based runner
 *
 * Exit code 127 from the child indicates that exec itself failed
 * (executable not found or not executable).
 */
class PosixProcessRunner : public ProcessRunner {
  public:
    PosixProcessRunner() = default;
    ~PosixProcessRunner() override = default;

    ProcessResult run(const ProcessRequest& request) override;
};

/// Render an argv vector as a single line for logging
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace hil
