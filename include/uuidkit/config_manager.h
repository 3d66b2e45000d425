/**
 * @file config_manager.h
 * @brief Centralized configuration for uuidkit
 *
 * Values come from explicit set() calls or from environment variables.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Validated generator configuration
 * - Thread-safe singleton pattern
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace uuidkit {

/**
 * @brief Tunables of a UuidGenerator
 */
struct GeneratorConfig {
    size_t randomPoolBufferSize = 4096;  ///< Bytes per pooled random buffer
    size_t randomPoolMaxIdle = 64;       ///< Idle pooled buffers retained
};

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value (default on parse failure)
     */
    long long getInt(const std::string& key, long long defaultValue = 0) const;

    /**
     * @brief Get boolean configuration value (true/false, 1/0, yes/no, on/off)
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Check if configuration key exists
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set configuration value (overrides environment)
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value
     */
    void unset(const std::string& key);

    /**
     * @brief Load known keys from environment
     */
    void loadFromEnvironment();

    /**
     * @brief Build validated generator configuration
     * @throws ConfigException if a value is out of range
     */
    GeneratorConfig generatorConfig() const;

    // Configuration keys
    static constexpr const char* RANDOM_POOL_BUFFER_SIZE = "UUIDKIT_RANDOM_POOL_BUFFER_SIZE";
    static constexpr const char* RANDOM_POOL_MAX_IDLE = "UUIDKIT_RANDOM_POOL_MAX_IDLE";
    static constexpr const char* LOG_LEVEL = "UUIDKIT_LOG_LEVEL";
};

} // namespace uuidkit
