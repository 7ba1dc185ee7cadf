// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

#include <nlohmann/json.hpp>

namespace hil {

using json = nlohmann::json;

/**
 * @brief Runner configuration (singleton)
 *
 * Optional JSON file with tool locations and timing overrides. Values are
 * read with JSON pointer syntax (RFC 6901) and fall back to built-in
 * defaults, so running without a config file is the normal case.
 *
 * Known keys:
 * | Pointer                    | Default        |
 * |----------------------------|----------------|
 * | /power_tool/executable     | "uhubctl"      |
 * | /reset/poll_attempts       | 5              |
 * | /reset/poll_interval_ms    | 1000           |
 * | /reset/settle_ms           | 2000           |
 * | /runner/python             | "python"       |
 * | /runner/default_dut_port   | "/dev/ttyACM0" |
 * | /runner/default_stub_port  | "/dev/ttyACM1" |
 * | /log/level                 | (unset)        |
 *
 * Thread safety: Not thread-safe. Initialize once at startup.
 *
 * ```cpp
 * Config* cfg = Config::get_instance();
 * if (!cfg->init("/etc/hil-runner.json")) { ... }
 * int attempts = cfg->get<int>("/reset/poll_attempts", 5);
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    static constexpr const char* ENV_CONFIG_PATH = "HIL_RUNNER_CONFIG";

    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load configuration from file
     *
     * An empty path keeps the built-in defaults and succeeds.
     *
     * @param config_path Path to JSON configuration file
     * @return false if the file is missing, unreadable, not valid JSON or not
     *         a JSON object (defaults stay in effect)
     */
    bool init(const std::string& config_path);

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value when the path is absent or holds a value of a
     * different type (the latter is logged).
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Ignoring {} in {}: {}", json_ptr, path, e.what());
            return default_value;
        }
    };

    /// String overload so that literals can be passed as defaults
    std::string get(const std::string& json_ptr, const char* default_value) {
        return get<std::string>(json_ptr, std::string(default_value));
    }

    /// Whether a value is present at @p json_ptr
    bool contains(const std::string& json_ptr) const;

    /**
     * @brief Set configuration value at JSON pointer path (in memory only)
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Path of the loaded file, empty when running on defaults
     */
    const std::string& get_path() const;

    /**
     * @brief Config path from the command line, else from HIL_RUNNER_CONFIG
     */
    static std::string resolve_path(const std::string& cli_path);

    static Config* get_instance();
};

} // namespace hil
