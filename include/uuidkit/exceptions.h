/**
 * @file exceptions.h
 * @brief Exception hierarchy for uuidkit
 *
 * Generation calls never return a failure indicator. The only failures are a
 * malfunctioning entropy source or digest backend, and invalid configuration.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace uuidkit {

/**
 * @brief Base exception for all uuidkit errors
 */
class UuidKitException : public std::runtime_error {
public:
    explicit UuidKitException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Secure random source failed or returned short data
 *
 * Unrecoverable: no identifier is produced after this is raised.
 */
class RandomSourceException : public UuidKitException {
public:
    explicit RandomSourceException(const std::string& message)
        : UuidKitException("Random source error: " + message) {}
};

/**
 * @brief OpenSSL digest operation failed
 */
class DigestException : public UuidKitException {
public:
    explicit DigestException(const std::string& message)
        : UuidKitException("Digest error: " + message) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public UuidKitException {
public:
    explicit ConfigException(const std::string& message)
        : UuidKitException("Configuration error: " + message) {}
};

} // namespace uuidkit
