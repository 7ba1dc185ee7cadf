// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "cli_args.h"

#include <spdlog/spdlog.h>

namespace hil {

/**
 * @brief Logging and configuration startup shared by all executables
 *
 * Installs the logger (level from -v, else /log/level from the config file,
 * else @p base_level), then loads the config file named by --config or
 * HIL_RUNNER_CONFIG.
 *
 * @return false if a named config file could not be loaded
 */
bool init_logging_and_config(const CommonCliArgs& common, spdlog::level::level_enum base_level);

} // namespace hil
