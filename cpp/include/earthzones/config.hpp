#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "earthzones/error.hpp"
#include "earthzones/logging.hpp"
#include "earthzones/types.hpp"

namespace earthzones {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        {
            std::lock_guard<std::mutex> lock(mutex_);

            load_from_env();

            if (!config_file.empty()) {
                if (std::filesystem::exists(config_file)) {
                    load_from_file(config_file);
                } else {
                    LOG_WARN("Config file not found: ", config_file);
                }
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) != 0;
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

    /**
     * Zone tiling from zone.east_boundary
     * @throws ConfigError if the boundary is not a finite number
     */
    ZoneScheme zone_scheme() const {
        const std::string raw = get<std::string>("zone.east_boundary");
        if (raw.empty()) {
            return ZoneScheme{};
        }
        double boundary = 0.0;
        if (!parse_boundary(raw, boundary)) {
            throw ConfigError("Invalid zone.east_boundary '" + raw + "'", __func__,
                              "Set EZ_ZONE9_EAST_BOUNDARY to a longitude in degrees, e.g. 116.7");
        }
        return ZoneScheme{boundary};
    }

    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO("Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO("  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void load_from_env() {
        // Zone tiling
        set_if_env("zone.east_boundary", "EZ_ZONE9_EAST_BOUNDARY", std::to_string(DEFAULT_ZONE9_EAST_BOUNDARY));

        // Display
        set_if_env("display.digits", "EZ_DISPLAY_DIGITS", "4");
        set_if_env("display.range_digits", "EZ_RANGE_DIGITS", "6");

        // Logging
        set_if_env("log.level", "EZ_LOG_LEVEL", "warn");
        set_if_env("log.file", "EZ_LOG_FILE", "");

        // Offline geocoder
        set_if_env("geocoder.records", "EZ_GEOCODER_RECORDS", "");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), [](int ch) { return !std::isspace(ch); }));
                key.erase(std::find_if(key.rbegin(), key.rend(), [](int ch) { return !std::isspace(ch); }).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](int ch) { return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](int ch) { return !std::isspace(ch); }).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    static bool parse_boundary(const std::string& raw, double& out) {
        try {
            size_t used = 0;
            double value = std::stod(raw, &used);
            if (used != raw.size() || !std::isfinite(value)) {
                return false;
            }
            out = value;
            return true;
        } catch (const std::exception&) {
            return false;
        }
    }

    bool validate() {
        bool valid = true;

        double boundary = 0.0;
        const std::string raw_boundary = get<std::string>("zone.east_boundary");
        if (!parse_boundary(raw_boundary, boundary)) {
            LOG_ERROR("Invalid zone.east_boundary: '", raw_boundary, "'");
            valid = false;
        }

        if (get<int>("display.digits", -1) < 0 || get<int>("display.range_digits", -1) < 0) {
            LOG_ERROR("Display digit counts must be non-negative integers");
            valid = false;
        }

        std::string log_level = get<std::string>("log.level");
        if (!parse_log_level(log_level)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'warn'");
            set("log.level", "warn");
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (auto level = parse_log_level(config.get<std::string>("log.level"))) {
        set_log_level(*level);
    }

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR("Could not open log file: ", log_file);
        }
    }

    LOG_INFO("Configuration loaded successfully");
    return true;
}

} // namespace earthzones
