// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

/// Copy keys present in @p defaults but missing from @p target (recursive)
bool merge_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing(target[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config* Config::instance{nullptr};

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"log_level", "warn"},
            {"log_target", "auto"},
            {"log_file", ""},
            {"supervisor",
             {{"reboot_blocking_users", "any"},
              {"default_timeout_sec", 60},
              {"user_poll_interval_sec", 10},
              {"reboot_grace_sec", 60},
              {"boot_console", true}}},
            {"startup_commands", json::array()},
            {"background_commands", json::array()}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "top level is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config: {}", strerror(errno));
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing(data, get_default_config())) {
            spdlog::debug("[Config] Added missing default keys");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with in-memory config, {} not updated", config_path);
    }

    spdlog::debug("[Config] initialized: blocking_users={}, grace={}s",
                  get<std::string>("/supervisor/reboot_blocking_users", "any"),
                  get<int>("/supervisor/reboot_grace_sec", 60));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string tmp_path = path + ".tmp";
    try {
        fs::path config_dir = fs::path(path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
        }

        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open {} for writing: {}", tmp_path, strerror(errno));
            return false;
        }

        o << std::setw(2) << data << std::endl;
        o.close();

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Failed to replace {}: {}", path, strerror(errno));
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace kiosk
