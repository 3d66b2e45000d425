/**
 * @file uuid.cpp
 * @brief Binary codec implementation
 */

#include "uuidkit/uuid.h"

namespace uuidkit {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // anonymous namespace

void stampVersion(uint8_t* bytes, uint8_t version) {
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | ((version & 0x0F) << 4));
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
}

void toCanonicalString(const uint8_t* bytes, char* out) {
    size_t pos = 0;
    for (size_t i = 0; i < UUID_SIZE; i++) {
        // Hyphens precede bytes 4, 6, 8 and 10
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out[pos++] = '-';
        }
        out[pos++] = HEX_DIGITS[bytes[i] >> 4];
        out[pos++] = HEX_DIGITS[bytes[i] & 0x0F];
    }
}

std::string Uuid::toString() const {
    std::string result(UUID_STRING_LENGTH, '0');
    toCanonicalString(bytes_.data(), &result[0]);
    return result;
}

std::ostream& operator<<(std::ostream& out, const Uuid& id) {
    char buf[UUID_STRING_LENGTH];
    toCanonicalString(id.data(), buf);
    return out.write(buf, UUID_STRING_LENGTH);
}

} // namespace uuidkit
