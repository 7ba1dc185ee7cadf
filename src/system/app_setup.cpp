// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_setup.h"

#include "config.h"
#include "logging_init.h"

namespace hil {

bool init_logging_and_config(const CommonCliArgs& common, spdlog::level::level_enum base_level) {
    logging::LogConfig log_config;
    log_config.level = logging::verbosity_to_level(common.verbosity, base_level);
    log_config.target = logging::parse_log_target(common.log_dest);
    log_config.file_path = common.log_file;
    logging::init(log_config);

    Config* config = Config::get_instance();
    std::string config_path = Config::resolve_path(common.config_path);
    if (!config->init(config_path)) {
        return false;
    }
    if (config->get_path().empty()) {
        spdlog::debug("[Config] No config file, using defaults");
    } else {
        spdlog::debug("[Config] Using {}", config->get_path());
    }

    // Config level applies only when -v was not given
    if (common.verbosity == 0 && config->contains("/log/level")) {
        std::string level_name = config->get("/log/level", "");
        spdlog::level::level_enum level =
            logging::parse_level(level_name, spdlog::level::n_levels);
        if (level == spdlog::level::n_levels) {
            spdlog::warn("[Config] Unknown /log/level '{}'", level_name);
        } else {
            spdlog::set_level(level);
        }
    }

    return true;
}

} // namespace hil
