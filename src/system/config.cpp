// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

namespace hil {

Config* Config::instance{NULL};

Config::Config() : data(json::object()) {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

bool Config::init(const std::string& config_path) {
    if (config_path.empty()) {
        spdlog::debug("[Config] No config file, using defaults");
        return true;
    }

    struct stat buffer;
    if (stat(config_path.c_str(), &buffer) != 0) {
        spdlog::error("[Config] Config file {} does not exist", config_path);
        return false;
    }

    std::ifstream file(config_path);
    if (!file) {
        spdlog::error("[Config] Cannot open {}", config_path);
        return false;
    }

    json loaded;
    try {
        loaded = json::parse(file);
    } catch (const json::exception& e) {
        spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        return false;
    }

    if (!loaded.is_object()) {
        spdlog::error("[Config] {} must contain a JSON object", config_path);
        return false;
    }

    spdlog::info("[Config] Loaded config from {}", config_path);
    data = std::move(loaded);
    path = config_path;
    return true;
}

bool Config::contains(const std::string& json_ptr) const {
    return data.contains(json::json_pointer(json_ptr));
}

const std::string& Config::get_path() const {
    return path;
}

std::string Config::resolve_path(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    const char* env_path = std::getenv(ENV_CONFIG_PATH);
    return env_path ? std::string(env_path) : std::string();
}

} // namespace hil
