#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include "../utils/PathUtils.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace trackdl::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Manages application settings with:
 * - Type-safe getters with defaults
 * - JSON persistence
 * - Environment variable overrides
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
     * Load configuration from file. Keys missing from the file keep
     * their default values.
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
        } catch (const std::filesystem::filesystem_error&) {
            return false;
        }
    }

    /**
     * Save configuration to file
     * @param path Path to config file (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool save(const std::string& path = "") {
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
            m_configPath = savePath;
            return true;

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
            {"downloads", {
                {"folder", (utils::PathUtils::getMusicPath() / "TrackDL").string()},
                {"concurrentDownloads", 4},
                {"queueCapacity", 1000},
                {"streamUrlTemplate", ""},
                {"fileExtension", "flac"},
                {"timeout", 60},
                {"connectTimeout", 10}
            }},
            {"logging", {
                {"level", "info"},
                {"directory", ""}
            }}
        };
    }

    /**
     * Apply environment variable overrides on top of the loaded values.
     * CONCURRENT_DOWNLOADS is ignored unless it is a positive integer.
     */
    void applyEnvironment() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (const char* folder = std::getenv("DOWNLOAD_FOLDER"); folder && *folder) {
            m_config["downloads"]["folder"] = folder;
        }
        if (const char* workers = std::getenv("CONCURRENT_DOWNLOADS"); workers && *workers) {
            char* end = nullptr;
            long n = std::strtol(workers, &end, 10);
            if (end && *end == '\0' && n > 0) {
                m_config["downloads"]["concurrentDownloads"] = static_cast<int>(n);
            }
        }
        if (const char* tmpl = std::getenv("STREAM_URL_TEMPLATE"); tmpl && *tmpl) {
            m_config["downloads"]["streamUrlTemplate"] = tmpl;
        }
        if (const char* level = std::getenv("LOG_LEVEL"); level && *level) {
            m_config["logging"]["level"] = level;
        }
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.folder")
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // Wrong type in file, use default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "downloads.concurrentDownloads")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config.contains(toJsonPointer(key));
    }

    json getAll() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_config;
    }

    std::string getPath() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
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
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace trackdl::core
