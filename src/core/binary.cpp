/**
 * @file binary.cpp
 * @brief Binary implementation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#include "bsonuuid/core/binary.hpp"
#include "bsonuuid/utils/hex.hpp"

namespace bsonuuid {
namespace core {

bool Binary::operator==(const Binary& other) const {
    return subType_ == other.subType_ &&
           utils::byteArraysEqual(buffer_, other.buffer_);
}

}  // namespace core
}  // namespace bsonuuid
