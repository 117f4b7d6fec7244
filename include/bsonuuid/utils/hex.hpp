/**
 * @file hex.hpp
 * @brief Conversion between 16-byte UUID buffers and their hex text forms.
 *
 * Accepted text forms (case-insensitive):
 *   xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx   (36 chars, dashes at 8/13/18/23)
 *   xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx       (32 chars)
 * Output is always lower-case.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/utils/export.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace bsonuuid {
namespace utils {

constexpr size_t UUID_BYTE_LENGTH = 16;
constexpr size_t UUID_HEX_LENGTH = 32;
constexpr size_t UUID_DASHED_HEX_LENGTH = 36;

using UuidBytes = std::array<uint8_t, UUID_BYTE_LENGTH>;
using ByteBuffer = std::vector<uint8_t>;

/**
 * @brief Length-and-content comparison of two byte buffers.
 */
BSONUUID_UTILS_API bool byteArraysEqual(const uint8_t* a, size_t aLength,
                                        const uint8_t* b, size_t bLength);

inline bool byteArraysEqual(const ByteBuffer& a, const ByteBuffer& b) {
    return byteArraysEqual(a.data(), a.size(), b.data(), b.size());
}

inline bool byteArraysEqual(const UuidBytes& a, const UuidBytes& b) {
    return byteArraysEqual(a.data(), a.size(), b.data(), b.size());
}

/**
 * @class HexCodec
 * @brief Hex/byte codec used by the UUID type.
 *
 * Implementations must be stateless or internally synchronized; one
 * instance is shared by every UUID created with the same context.
 */
class BSONUUID_UTILS_API HexCodec {
public:
    virtual ~HexCodec() = default;

    /**
     * @brief Render 16 bytes as lower-case hex.
     * @param includeDashes Insert dashes at offsets 8, 13, 18 and 23.
     */
    virtual std::string bytesToHex(const UuidBytes& bytes, bool includeDashes) const = 0;

    /**
     * @brief Parse a 32 or 36 character hex string.
     * @throws std::invalid_argument if validateHexString() rejects @p hex.
     */
    virtual UuidBytes hexToBytes(const std::string& hex) const = 0;

    /**
     * @brief True iff @p hex is one of the two accepted text forms.
     */
    virtual bool validateHexString(const std::string& hex) const = 0;
};

/**
 * @class StandardHexCodec
 * @brief Table-free codec over the canonical 8-4-4-4-12 grouping.
 */
class BSONUUID_UTILS_API StandardHexCodec : public HexCodec {
public:
    std::string bytesToHex(const UuidBytes& bytes, bool includeDashes) const override;
    UuidBytes hexToBytes(const std::string& hex) const override;
    bool validateHexString(const std::string& hex) const override;
};

/**
 * @brief Process-wide StandardHexCodec instance.
 */
BSONUUID_UTILS_API std::shared_ptr<const HexCodec> standardHexCodec();

/**
 * @brief Value of a single hex digit, or -1 if @p c is not one.
 */
inline int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace utils
}  // namespace bsonuuid
