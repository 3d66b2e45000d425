/**
 * @file name_hasher.h
 * @brief Name-based identifiers (v3 MD5, v5 SHA-1)
 *
 * RFC 9562 Section 5.3 / 5.5. Pure function of (namespace, name, algorithm):
 * identical inputs give identical output in every process on every platform.
 */

#pragma once

#include "uuidkit/uuid.h"

#include <string>
#include <string_view>

namespace uuidkit {

/// @brief Digest used for a name-based identifier
enum class HashAlgorithm {
    MD5,   ///< Version 3
    SHA1   ///< Version 5 (preferred for new applications)
};

/// @brief Version number stamped for an algorithm (3 or 5)
inline uint8_t versionForAlgorithm(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::MD5 ? 3 : 5;
}

/// @brief Convert HashAlgorithm to string
inline std::string hashAlgorithmToString(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::MD5:  return "MD5";
        case HashAlgorithm::SHA1: return "SHA-1";
    }
    return "UNKNOWN";
}

/**
 * @brief Hash namespace bytes followed by name bytes into an identifier
 *
 * @param ns Namespace identifier (e.g. namespaces::DNS)
 * @param name Name, hashed as raw bytes; may be empty
 * @param algorithm MD5 (v3) or SHA-1 (v5)
 * @return First 16 digest bytes with version and variant stamped
 * @throws DigestException if OpenSSL fails to compute the digest
 */
Uuid nameBasedId(const Uuid& ns, std::string_view name, HashAlgorithm algorithm);

} // namespace uuidkit
