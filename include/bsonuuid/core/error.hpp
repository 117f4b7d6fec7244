/**
 * @file error.hpp
 * @brief Exception types raised by the BSON value types.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/core/export.hpp"

#include <stdexcept>
#include <string>

namespace bsonuuid {
namespace core {

/**
 * @class InvalidArgument
 * @brief A value was handed input of the wrong shape or length.
 */
class BSONUUID_CORE_API InvalidArgument : public std::invalid_argument {
public:
    explicit InvalidArgument(const std::string& message)
        : std::invalid_argument(message) {}
};

}  // namespace core
}  // namespace bsonuuid
