// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __KIOSK_CONFIG_H__
#define __KIOSK_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace kiosk {

/**
 * @brief Daemon configuration manager (singleton)
 *
 * Loads the supervisor configuration from a JSON file. Uses JSON pointer
 * syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialized once at startup and read from
 * the main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/kiosk-supervisor.json");
 *
 * // Get with default fallback
 * int grace = cfg->get<int>("/supervisor/reboot_grace_sec", 60);
 *
 * // Set and save
 * cfg->set<std::string>("/supervisor/reboot_blocking_users", "ssh");
 * cfg->save();
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
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails
     * to parse is moved aside to <path>.corrupt and replaced by defaults.
     * Missing keys are filled in from the defaults and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found or wrong type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::type_error& e) {
            spdlog::warn("[Config] {} has wrong type ({}), using default", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. Changes are in-memory
     * only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        data[json::json_pointer(json_ptr)] = v;
        return v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written to a temp file and renamed over the original, so a power cut
     * never leaves a half-written config.
     *
     * @return true on success
     */
    bool save();

    std::string get_path();

    /**
     * @brief Built-in defaults, also used to fill keys missing from the file
     */
    static json get_default_config();

    static Config* get_instance();
};

} // namespace kiosk

#endif // __KIOSK_CONFIG_H__
