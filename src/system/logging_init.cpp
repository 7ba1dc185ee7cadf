// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace hil {
namespace logging {

namespace {

/// Get XDG_STATE_HOME or default ~/.local/state
std::string get_xdg_state_home() {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/state";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string user_dir = get_xdg_state_home() + "/hil-runner";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/hil-runner.log";
}

/// CI jobs pipe our output; keep a syslog copy there, console alone otherwise
LogTarget detect_best_target() {
#ifdef __linux__
    if (!isatty(STDOUT_FILENO)) {
        return LogTarget::Syslog;
    }
#endif
    return LogTarget::Console;
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("hil-runner", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            // Console still works; report once the logger exists
            std::fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(),
                         e.what());
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
#ifndef __linux__
    default:
        break;
#endif
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("hil", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}", log_target_name(effective_target),
                  config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum verbosity_to_level(int verbosity,
                                             spdlog::level::level_enum base_level) {
    spdlog::level::level_enum requested = base_level;
    if (verbosity >= 3) {
        requested = spdlog::level::trace;
    } else if (verbosity == 2) {
        requested = spdlog::level::debug;
    } else if (verbosity == 1) {
        requested = spdlog::level::info;
    }
    // Lower enum value = more verbose
    return std::min(requested, base_level);
}

} // namespace logging
} // namespace hil
