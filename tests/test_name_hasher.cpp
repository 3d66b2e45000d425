/**
 * @file test_name_hasher.cpp
 * @brief Unit tests for name-based identifiers (v3, v5)
 */

#include <gtest/gtest.h>
#include <uuidkit/name_hasher.h>
#include "test_helpers.h"

#include <string>

using namespace uuidkit;
using test_helpers::hasLayout;

// ============================================================================
// Known vectors
// ============================================================================

TEST(NameHasherTest, NilNamespaceEmptyName) {
    EXPECT_EQ(nameBasedId(Uuid::nil(), "", HashAlgorithm::MD5).toString(),
              "4ae71336-e44b-39bf-b9d2-752e234818a5");
    EXPECT_EQ(nameBasedId(Uuid::nil(), "", HashAlgorithm::SHA1).toString(),
              "e129f27c-5103-5c5c-844b-cdf0a15e160d");
}

TEST(NameHasherTest, DnsNamespace) {
    EXPECT_EQ(nameBasedId(namespaces::DNS, "www.example.com", HashAlgorithm::MD5).toString(),
              "5df41881-3aed-3515-88a7-2f4a814cf09e");
    EXPECT_EQ(nameBasedId(namespaces::DNS, "www.example.com", HashAlgorithm::SHA1).toString(),
              "2ed6657d-e927-568b-95e1-2665a8aea6a2");
    EXPECT_EQ(nameBasedId(namespaces::DNS, "python.org", HashAlgorithm::SHA1).toString(),
              "886313e1-3b8a-5372-9b90-0c9aee199e5d");
}

TEST(NameHasherTest, UrlAndOidNamespaces) {
    EXPECT_EQ(nameBasedId(namespaces::URL, "https://example.com/", HashAlgorithm::SHA1).toString(),
              "dd2c1780-811a-5296-81c5-178a0ef488bc");
    EXPECT_EQ(nameBasedId(namespaces::OID, "1.3.6.1", HashAlgorithm::MD5).toString(),
              "dd1a1cef-13d5-368a-ad82-eca71acd4cd1");
}

// ============================================================================
// Properties
// ============================================================================

TEST(NameHasherTest, Deterministic) {
    Uuid a = nameBasedId(namespaces::URL, "urn:example:thing", HashAlgorithm::SHA1);
    Uuid b = nameBasedId(namespaces::URL, "urn:example:thing", HashAlgorithm::SHA1);
    EXPECT_EQ(a, b);
}

TEST(NameHasherTest, AlgorithmsDiffer) {
    Uuid md5 = nameBasedId(namespaces::DNS, "example.org", HashAlgorithm::MD5);
    Uuid sha1 = nameBasedId(namespaces::DNS, "example.org", HashAlgorithm::SHA1);
    EXPECT_NE(md5, sha1);
    EXPECT_TRUE(hasLayout(md5, 3));
    EXPECT_TRUE(hasLayout(sha1, 5));
}

TEST(NameHasherTest, NamespaceMatters) {
    EXPECT_NE(nameBasedId(namespaces::DNS, "x", HashAlgorithm::SHA1),
              nameBasedId(namespaces::URL, "x", HashAlgorithm::SHA1));
}

TEST(NameHasherTest, NameIsHashedAsRawBytes) {
    std::string withNul("a\0b", 3);
    Uuid full = nameBasedId(namespaces::DNS, withNul, HashAlgorithm::MD5);
    Uuid truncated = nameBasedId(namespaces::DNS, "a", HashAlgorithm::MD5);
    EXPECT_NE(full, truncated);
}

TEST(NameHasherTest, LongName) {
    std::string name(1 << 16, 'z');
    Uuid id = nameBasedId(namespaces::X500, name, HashAlgorithm::SHA1);
    EXPECT_TRUE(hasLayout(id, 5));
    EXPECT_EQ(id, nameBasedId(namespaces::X500, name, HashAlgorithm::SHA1));
}

TEST(NameHasherTest, AlgorithmHelpers) {
    EXPECT_EQ(versionForAlgorithm(HashAlgorithm::MD5), 3);
    EXPECT_EQ(versionForAlgorithm(HashAlgorithm::SHA1), 5);
    EXPECT_EQ(hashAlgorithmToString(HashAlgorithm::MD5), "MD5");
    EXPECT_EQ(hashAlgorithmToString(HashAlgorithm::SHA1), "SHA-1");
}
