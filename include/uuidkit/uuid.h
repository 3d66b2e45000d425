/**
 * @file uuid.h
 * @brief 128-bit identifier value type and binary codec
 *
 * RFC 4122 / RFC 9562 field positions:
 *   - version: high nibble of byte 6 (values 1-7)
 *   - variant: top two bits of byte 8, always binary 10
 *
 * Bytes are stored big-endian in the order they appear in the canonical
 * text form, so byte-wise comparison equals text comparison.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace uuidkit {

/// @brief Length of the binary form in bytes
constexpr size_t UUID_SIZE = 16;

/// @brief Length of the canonical text form (8-4-4-4-12)
constexpr size_t UUID_STRING_LENGTH = 36;

/**
 * @brief Overwrite version nibble and variant bits of a 16-byte buffer in place
 *
 * @param bytes 16-byte buffer (non-owning)
 * @param version Version number 1-7 (only the low 4 bits are used)
 */
void stampVersion(uint8_t* bytes, uint8_t version);

/**
 * @brief Render 16 bytes as canonical lowercase hyphenated hex
 *
 * Writes exactly 36 characters, no terminator.
 *
 * @param bytes 16-byte buffer (non-owning)
 * @param out Destination with room for UUID_STRING_LENGTH characters
 */
void toCanonicalString(const uint8_t* bytes, char* out);

/**
 * @brief Universally unique identifier (RFC 4122 / RFC 9562)
 */
class Uuid {
public:
    using Bytes = std::array<uint8_t, UUID_SIZE>;

    /// @brief Constructs the nil value
    constexpr Uuid() : bytes_{} {}

    constexpr explicit Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// @brief All 128 bits zero
    static constexpr Uuid nil() { return Uuid(); }

    /// @brief All 128 bits one (RFC 9562 Section 5.10)
    static constexpr Uuid max() {
        return Uuid(Bytes{0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
                          0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF});
    }

    const Bytes& bytes() const { return bytes_; }
    Bytes& bytes() { return bytes_; }

    const uint8_t* data() const { return bytes_.data(); }
    uint8_t* data() { return bytes_.data(); }

    uint8_t operator[](size_t i) const { return bytes_[i]; }

    /**
     * @brief Set version nibble and RFC variant bits
     * @return *this
     */
    Uuid& stamp(uint8_t version) {
        stampVersion(bytes_.data(), version);
        return *this;
    }

    /// @brief Version nibble (high nibble of byte 6)
    uint8_t version() const { return bytes_[6] >> 4; }

    /// @brief Top two bits of byte 8 (0b10 for every generated value)
    uint8_t variant() const { return bytes_[8] >> 6; }

    bool isNil() const { return *this == nil(); }
    bool isMax() const { return *this == max(); }

    /**
     * @brief Canonical text form
     * @return e.g. "123e4567-e89b-12d3-a456-426614174000"
     */
    std::string toString() const;

    friend bool operator==(const Uuid& a, const Uuid& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Uuid& a, const Uuid& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Uuid& a, const Uuid& b) { return a.bytes_ < b.bytes_; }
    friend bool operator>(const Uuid& a, const Uuid& b) { return a.bytes_ > b.bytes_; }
    friend bool operator<=(const Uuid& a, const Uuid& b) { return a.bytes_ <= b.bytes_; }
    friend bool operator>=(const Uuid& a, const Uuid& b) { return a.bytes_ >= b.bytes_; }

private:
    Bytes bytes_;
};

std::ostream& operator<<(std::ostream& out, const Uuid& id);

/// @brief Predefined namespaces from RFC 4122 Appendix C
namespace namespaces {

/// 6ba7b810-9dad-11d1-80b4-00c04fd430c8
constexpr Uuid DNS(Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                               0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});

/// 6ba7b811-9dad-11d1-80b4-00c04fd430c8
constexpr Uuid URL(Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                               0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});

/// 6ba7b812-9dad-11d1-80b4-00c04fd430c8
constexpr Uuid OID(Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                               0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});

/// 6ba7b814-9dad-11d1-80b4-00c04fd430c8
constexpr Uuid X500(Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8});

} // namespace namespaces

} // namespace uuidkit

namespace std {

template <>
struct hash<uuidkit::Uuid> {
    size_t operator()(const uuidkit::Uuid& id) const noexcept {
        // FNV-1a over all 16 bytes
        uint64_t h = 0xcbf29ce484222325ULL;
        for (uint8_t b : id.bytes()) {
            h ^= b;
            h *= 0x100000001b3ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
