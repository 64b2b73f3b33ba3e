#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to engine, transport and logging settings.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace downlink::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - "key=value" overrides (command line)
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file, merged over the defaults
     * @param path Path to config file
     * @return true if loaded successfully
     */
    bool load(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                return false;
            }

            m_config.merge_patch(json::parse(file));
            m_configPath = path;
            return true;

        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Merge a JSON document given as text over the current values
     * @param text JSON object text
     * @return false if the text is not a JSON object
     */
    bool loadFromString(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json parsed = json::parse(text);
            if (!parsed.is_object()) {
                return false;
            }
            m_config.merge_patch(parsed);
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path) {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::string savePath = path.empty() ? m_configPath : path;
        if (savePath.empty()) {
            return false;
        }

        try {
            auto parent = std::filesystem::path(savePath).parent_path();
            if (!parent.empty()) {
                std::filesystem::create_directories(parent);
            }

            std::ofstream file(savePath);
            if (!file.is_open()) {
                return false;
            }

            file << m_config.dump(4);
            return file.good();

        } catch (const std::exception&) {
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"version", "1.0.0"},
            {"engine", {
                {"namespace", "downlink.default"},
                {"concurrentLimit", 1},
                {"globalNetworkType", "global_off"},
                {"progressReportingIntervalMs", 2000},
                {"networkCheckIntervalMs", 5000},
                {"autoRetryMaxAttempts", 0},
                {"catalogDirectory", ""},
                {"compactThreshold", 1000}
            }},
            {"transport", {
                {"timeoutMs", 30000},
                {"connectTimeoutMs", 10000},
                {"userAgent", "Downlink/1.0"},
                {"segments", 1}
            }},
            {"logging", {
                {"enabled", true},
                {"level", "info"},
                {"directory", ""}
            }}
        };
        m_configPath.clear();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "engine.concurrentLimit")
     * @param defaultValue Default value if key not found or of another type
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key is not a valid path
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            m_config[toJsonPointer(key)] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Apply "key=value" overrides. The value is parsed as JSON when it is
     * valid JSON ("4", "true", "\"x\"") and stored as a string otherwise.
     * @param assignments Override list
     * @return Assignments that could not be applied
     */
    std::vector<std::string> applyOverrides(const std::vector<std::string>& assignments) {
        std::vector<std::string> rejected;

        for (const auto& assignment : assignments) {
            auto pos = assignment.find('=');
            if (pos == std::string::npos || pos == 0) {
                rejected.push_back(assignment);
                continue;
            }

            std::string key = assignment.substr(0, pos);
            std::string raw = assignment.substr(pos + 1);

            json value;
            try {
                value = json::parse(raw);
            } catch (const json::exception&) {
                value = raw;
            }

            if (!set(key, value)) {
                rejected.push_back(assignment);
            }
        }

        return rejected;
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Get entire configuration as JSON
     * @return JSON configuration object
     */
    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            pointer += (c == '.') ? '/' : c;
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace downlink::core
