/**
 * @file hex.cpp
 * @brief StandardHexCodec implementation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#include "bsonuuid/utils/hex.hpp"

#include <cstring>
#include <stdexcept>

namespace bsonuuid {
namespace utils {

namespace {

const char kHexDigits[] = "0123456789abcdef";

const char* const kFormatError =
    "UUID string representations must be a 32 or 36 character hex string "
    "(dashes excluded/included). Format: \"xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx\" "
    "or \"xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx\".";

bool isDashOffset(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // namespace

bool byteArraysEqual(const uint8_t* a, size_t aLength,
                     const uint8_t* b, size_t bLength) {
    if (aLength != bLength) {
        return false;
    }
    return aLength == 0 || std::memcmp(a, b, aLength) == 0;
}

std::string StandardHexCodec::bytesToHex(const UuidBytes& bytes, bool includeDashes) const {
    std::string out;
    out.reserve(includeDashes ? UUID_DASHED_HEX_LENGTH : UUID_HEX_LENGTH);

    for (size_t i = 0; i < bytes.size(); ++i) {
        // Dashes precede bytes 4, 6, 8 and 10 -> offsets 8, 13, 18, 23
        if (includeDashes && (i == 4 || i == 6 || i == 8 || i == 10)) {
            out.push_back('-');
        }
        out.push_back(kHexDigits[bytes[i] >> 4]);
        out.push_back(kHexDigits[bytes[i] & 0x0F]);
    }

    return out;
}

UuidBytes StandardHexCodec::hexToBytes(const std::string& hex) const {
    if (!validateHexString(hex)) {
        throw std::invalid_argument(kFormatError);
    }

    UuidBytes bytes{};
    size_t out = 0;
    int high = -1;

    for (char c : hex) {
        if (c == '-') {
            continue;
        }
        int value = hexDigitValue(c);
        if (high < 0) {
            high = value;
        } else {
            bytes[out++] = static_cast<uint8_t>((high << 4) | value);
            high = -1;
        }
    }

    return bytes;
}

bool StandardHexCodec::validateHexString(const std::string& hex) const {
    if (hex.length() == UUID_HEX_LENGTH) {
        for (char c : hex) {
            if (hexDigitValue(c) < 0) return false;
        }
        return true;
    }

    if (hex.length() == UUID_DASHED_HEX_LENGTH) {
        for (size_t i = 0; i < hex.length(); ++i) {
            if (isDashOffset(i)) {
                if (hex[i] != '-') return false;
            } else if (hexDigitValue(hex[i]) < 0) {
                return false;
            }
        }
        return true;
    }

    return false;
}

std::shared_ptr<const HexCodec> standardHexCodec() {
    static const std::shared_ptr<const HexCodec> codec = std::make_shared<StandardHexCodec>();
    return codec;
}

}  // namespace utils
}  // namespace bsonuuid
