/**
 * @file name_hasher.cpp
 * @brief Name-based identifier hashing via OpenSSL EVP
 */

#include "uuidkit/name_hasher.h"
#include "uuidkit/exceptions.h"

#include <cstring>
#include <openssl/evp.h>
#include <openssl/err.h>
#include <spdlog/spdlog.h>

namespace uuidkit {

Uuid nameBasedId(const Uuid& ns, std::string_view name, HashAlgorithm algorithm) {
    const EVP_MD* md = (algorithm == HashAlgorithm::MD5) ? EVP_md5() : EVP_sha1();
    if (!md) {
        throw DigestException(hashAlgorithmToString(algorithm) + " is not available");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw DigestException("Failed to create EVP_MD_CTX");
    }

    if (EVP_DigestInit_ex(ctx, md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx, ns.data(), UUID_SIZE) != 1 ||
        EVP_DigestUpdate(ctx, name.data(), name.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        ERR_clear_error();
        spdlog::critical("{} digest failed", hashAlgorithmToString(algorithm));
        throw DigestException("Failed to calculate " + hashAlgorithmToString(algorithm) + " hash");
    }
    EVP_MD_CTX_free(ctx);

    if (hashLen < UUID_SIZE) {
        throw DigestException("Digest shorter than 16 bytes");
    }

    Uuid id;
    std::memcpy(id.data(), hash, UUID_SIZE);
    id.stamp(versionForAlgorithm(algorithm));
    return id;
}

} // namespace uuidkit
