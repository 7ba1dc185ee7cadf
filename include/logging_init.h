// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace hil {
namespace logging {

/// Where log output goes in addition to the console
enum class LogTarget {
    Auto,   ///< Console only for interactive runs, syslog when stdout is not a tty
    Syslog, ///< syslog(3)
    File,   ///< Rotating log file
    Console ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    std::string file_path; ///< Used by LogTarget::File; empty = default location
};

/**
 * @brief Install the default "hil" logger
 *
 * Safe to call more than once; the last call wins.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" as alias of "warn")
 *
 * Case sensitive; empty or unknown names return @p default_level.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// "auto", "syslog", "file", "console"; anything else maps to Auto
LogTarget parse_log_target(const std::string& str);
const char* log_target_name(LogTarget target);

/**
 * @brief Map a -v count to a log level
 *
 * 0 = @p base_level, 1 = info, 2 = debug, 3+ = trace. Never raises the
 * threshold above @p base_level.
 */
spdlog::level::level_enum verbosity_to_level(int verbosity,
                                             spdlog::level::level_enum base_level);

} // namespace logging
} // namespace hil
