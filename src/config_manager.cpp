/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "uuidkit/config_manager.h"
#include "uuidkit/exceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace uuidkit {

namespace {

constexpr size_t MIN_POOL_BUFFER_SIZE = 16;
constexpr long long MAX_POOL_BUFFER_SIZE = 16 * 1024 * 1024;
constexpr long long MAX_POOL_MAX_IDLE = 4096;

} // anonymous namespace

std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

long long ConfigManager::getInt(const std::string& key, long long defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    try {
        size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            spdlog::warn("Trailing characters in integer config '{}': {} (using default: {})",
                         key, value, defaultValue);
            return defaultValue;
        }
        return parsed;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse integer config '{}': {} (using default: {})",
                     key, e.what(), defaultValue);
        return defaultValue;
    }
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    std::string lowerValue = value;
    std::transform(lowerValue.begin(), lowerValue.end(), lowerValue.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowerValue == "true" || lowerValue == "1" || lowerValue == "yes" || lowerValue == "on") {
        return true;
    } else if (lowerValue == "false" || lowerValue == "0" || lowerValue == "no" || lowerValue == "off") {
        return false;
    }

    spdlog::warn("Invalid boolean config '{}': {} (using default: {})",
                 key, value, defaultValue);
    return defaultValue;
}

bool ConfigManager::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.find(key) != config_.end() || std::getenv(key.c_str()) != nullptr;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    for (const char* key : {RANDOM_POOL_BUFFER_SIZE, RANDOM_POOL_MAX_IDLE, LOG_LEVEL}) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }
    spdlog::debug("uuidkit configuration loaded from environment");
}

GeneratorConfig ConfigManager::generatorConfig() const {
    GeneratorConfig config;

    long long bufferSize = getInt(RANDOM_POOL_BUFFER_SIZE,
                                  static_cast<long long>(config.randomPoolBufferSize));
    if (bufferSize < static_cast<long long>(MIN_POOL_BUFFER_SIZE) || bufferSize > MAX_POOL_BUFFER_SIZE) {
        throw ConfigException(std::string(RANDOM_POOL_BUFFER_SIZE) + " out of range: " +
                              std::to_string(bufferSize));
    }

    long long maxIdle = getInt(RANDOM_POOL_MAX_IDLE, static_cast<long long>(config.randomPoolMaxIdle));
    if (maxIdle < 1 || maxIdle > MAX_POOL_MAX_IDLE) {
        throw ConfigException(std::string(RANDOM_POOL_MAX_IDLE) + " out of range [1, " +
                              std::to_string(MAX_POOL_MAX_IDLE) + "]: " + std::to_string(maxIdle));
    }

    config.randomPoolBufferSize = static_cast<size_t>(bufferSize);
    config.randomPoolMaxIdle = static_cast<size_t>(maxIdle);

    spdlog::info("Generator config: poolBufferSize={}, poolMaxIdle={}",
                 config.randomPoolBufferSize, config.randomPoolMaxIdle);
    return config;
}

} // namespace uuidkit
