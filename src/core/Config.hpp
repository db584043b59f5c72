#pragma once

/**
 * Config.hpp
 * 
 * Configuration store backed by JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace lockerfetch::core {

using json = nlohmann::json;

/**
 * Configuration store
 * 
 * Keys use dot notation ("engine.maxRetries"). The process-wide instance
 * is only read by the CLI layer; the engine receives an EngineConfig
 * snapshot built from it.
 */
class Config {
public:
    Config() {
        setDefaults();
    }
    
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    
    /**
     * Get process-wide instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }
    
    /**
     * Load configuration from file and merge it over the defaults
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
            
            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                return false;
            }
            m_config.merge_patch(loaded);
            m_configPath = path;
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
    bool save(const std::string& path = "") const {
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
            {"engine", {
                {"maxConcurrentDownloads", 3},
                {"minDelay", 1.0},
                {"maxDelay", 3.0},
                {"maxRetries", 10},
                {"respectRobots", false},
                {"proxy", ""},
                {"downloadDir", "downloads"},
                {"smoothingWeight", 0.3}
            }},
            {"retry", {
                {"baseDelay", 2.0},
                {"delayIncrement", 0.5}
            }},
            {"scheduler", {
                {"admissionDelay", 1.5},
                {"reductionPause", 3.0},
                {"errorThreshold", 3},
                {"sequentialMinPause", 0.5},
                {"sequentialMaxPause", 1.0}
            }},
            {"transfer", {
                {"probeSize", 256 * 1024},
                {"chunkRecalcInterval", 10},
                {"memoryCheckInterval", 50},
                {"memoryWarningPercent", 80.0},
                {"largeFileThreshold", 100 * 1024 * 1024},
                {"maintenanceUrls", json::array({"https://bnkr.b-cdn.net/maintenance.mp4"})}
            }},
            {"http", {
                {"timeout", 30},
                {"connectTimeout", 10},
                {"maxRedirects", 5},
                {"verifySSL", true},
                {"referer", "https://bunkr.sk/"},
                {"userAgents", json::array({
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/132.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Safari/537.36",
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:126.0) Gecko/20100101 Firefox/126.0",
                    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:126.0) Gecko/20100101 Firefox/126.0",
                    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/17.0 Safari/605.1.15",
                    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Safari/537.36 Edg/133.0.0.0",
                    "Mozilla/5.0 (Linux; Android 13) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/133.0.0.0 Mobile Safari/537.36"
                })}
            }},
            {"sites", {
                {"bunkrApi", "https://bunkr.cr/api/vs"},
                {"allowedDomains", json::array({
                    "bunkr.sk", "bunkr.is", "bunkr.la", "bunkr.cr",
                    "cyberdrop.me", "cyberdrop.cc"
                })}
            }},
            {"logging", {
                {"level", "info"},
                {"fileSink", true}
            }}
        };
    }
    
    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "engine.maxRetries")
     * @param defaultValue Default value if key not found or of the wrong type
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
            // Fall through to default
        }
        
        return defaultValue;
    }
    
    /**
     * Set configuration value with dot notation
     * @param key Key path
     * @param value Value to set
     * @return false if the key path is unusable
     */
    template<typename T>
    bool set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            json::json_pointer ptr = toJsonPointer(key);
            m_config[ptr] = value;
            return true;
        } catch (const json::exception&) {
            return false;
        }
    }
    
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        
        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }
    
private:
    /**
     * Convert dot notation to JSON pointer
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

} // namespace lockerfetch::core
