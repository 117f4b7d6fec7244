/**
 * @file binary.hpp
 * @brief BSON binary value: a byte buffer tagged with a subtype.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/core/export.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace bsonuuid {
namespace core {

/**
 * @enum BinarySubtype
 * @brief Subtype byte of a BSON binary element.
 */
enum class BinarySubtype : uint8_t {
    DEFAULT      = 0x00,
    FUNCTION     = 0x01,
    BYTE_ARRAY   = 0x02,  ///< Deprecated
    UUID_OLD     = 0x03,  ///< Deprecated, driver-specific byte order
    UUID         = 0x04,
    MD5          = 0x05,
    ENCRYPTED    = 0x06,
    COLUMN       = 0x07,
    USER_DEFINED = 0x80
};

inline const char* binarySubtypeToString(BinarySubtype subtype) {
    switch (subtype) {
        case BinarySubtype::DEFAULT: return "default";
        case BinarySubtype::FUNCTION: return "function";
        case BinarySubtype::BYTE_ARRAY: return "byte_array";
        case BinarySubtype::UUID_OLD: return "uuid_old";
        case BinarySubtype::UUID: return "uuid";
        case BinarySubtype::MD5: return "md5";
        case BinarySubtype::ENCRYPTED: return "encrypted";
        case BinarySubtype::COLUMN: return "column";
        case BinarySubtype::USER_DEFINED: return "user_defined";
        default: return "unknown";
    }
}

/**
 * @class Binary
 * @brief Owned bytes plus subtype. Value semantics.
 */
class BSONUUID_CORE_API Binary {
public:
    Binary() : subType_(BinarySubtype::DEFAULT) {}

    Binary(std::vector<uint8_t> buffer, BinarySubtype subType)
        : buffer_(std::move(buffer)), subType_(subType) {}

    const std::vector<uint8_t>& buffer() const { return buffer_; }
    BinarySubtype subType() const { return subType_; }
    size_t length() const { return buffer_.size(); }

    bool operator==(const Binary& other) const;
    bool operator!=(const Binary& other) const { return !(*this == other); }

private:
    std::vector<uint8_t> buffer_;
    BinarySubtype subType_;
};

}  // namespace core
}  // namespace bsonuuid
