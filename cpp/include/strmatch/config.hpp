#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <filesystem>
#include <fstream>
#include <mutex>
#include "logging.hpp"
#include "types.hpp"

namespace strmatch {

class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file.
    // Returns false if the resulting configuration is unusable.
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        errors_.clear();
        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Drops every value; used by tests to start from a clean slate.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
        errors_.clear();
    }

    std::vector<std::string> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
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

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        const std::string& raw = it->second;
        size_t used = 0;
        try {
            if constexpr (std::is_same_v<T, int>) {
                int value = std::stoi(raw, &used);
                if (used == raw.size()) return value;
            } else if constexpr (std::is_same_v<T, long long>) {
                long long value = std::stoll(raw, &used);
                if (used == raw.size()) return value;
            } else if constexpr (std::is_same_v<T, uint64_t>) {
                if (!raw.empty() && raw.front() != '-') {
                    uint64_t value = std::stoull(raw, &used);
                    if (used == raw.size()) return value;
                }
            } else if constexpr (std::is_same_v<T, double>) {
                double value = std::stod(raw, &used);
                if (used == raw.size()) return value;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = raw;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return raw;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Failed to parse config value '", raw, "' for key '", key, "' (", e.what(), "), using default");
            return default_value;
        }
        LOG_WARN("Config value '", raw, "' for key '", key, "' is not a valid number, using default");
        return default_value;
    }

    void load_from_env() {
        // Rabin-Karp hashing
        set_if_env("rk.base", "SM_RK_BASE", "256");
        set_if_env("rk.modulus", "SM_RK_MODULUS", "101");

        // Execution
        set_if_env("run.parallel", "SM_PARALLEL", "false");

        // Report
        set_if_env("report.max_detail_steps", "SM_MAX_DETAIL_STEPS", "60");

        // Logging
        set_if_env("log.level", "SM_LOG_LEVEL", "info");
        set_if_env("log.file", "SM_LOG_FILE", "");
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

        auto not_space = [](int ch) { return !std::isspace(ch); };

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);

                key.erase(key.begin(), std::find_if(key.begin(), key.end(), not_space));
                key.erase(std::find_if(key.rbegin(), key.rend(), not_space).base(), key.end());

                value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
                value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    // Caller holds mutex_.
    bool validate() {
        bool valid = true;

        uint64_t modulus = get_unlocked<uint64_t>("rk.modulus", 0);
        if (modulus < 2 || modulus > MAX_RK_MODULUS) {
            errors_.push_back("rk.modulus must be in [2, 2^31], got '" + values_["rk.modulus"] + "'");
            valid = false;
        }

        if (get_unlocked<uint64_t>("rk.base", 0) == 0) {
            errors_.push_back("rk.base must be a positive integer, got '" + values_["rk.base"] + "'");
            valid = false;
        }

        if (get_unlocked<int>("report.max_detail_steps", -1) < 0) {
            errors_.push_back("report.max_detail_steps must be non-negative");
            valid = false;
        }

        for (const auto& error : errors_) {
            LOG_ERROR(error);
        }

        LogLevel parsed;
        std::string log_level = get_unlocked<std::string>("log.level", "info");
        if (!parse_log_level(log_level, parsed)) {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> errors_;
};

// Load configuration and apply the logging settings it names.
inline bool init_config(const std::string& config_file = "strmatch.env") {
    Config& config = Config::getInstance();

    // Set log level from environment before loading so load() itself is filtered
    LogLevel level;
    const char* log_level_env = std::getenv("SM_LOG_LEVEL");
    if (log_level_env && parse_log_level(log_level_env, level)) {
        set_log_level(level);
    }

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    if (parse_log_level(config.get<std::string>("log.level", "info"), level)) {
        set_log_level(level);
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

    LOG_DEBUG("Configuration loaded successfully");
    return true;
}

} // namespace strmatch
