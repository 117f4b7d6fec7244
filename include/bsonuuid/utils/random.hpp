/**
 * @file random.hpp
 * @brief Random byte sources for UUID generation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#include "bsonuuid/utils/export.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace bsonuuid {
namespace utils {

/**
 * @class RandomSource
 * @brief Supplies random bytes on demand.
 */
class BSONUUID_UTILS_API RandomSource {
public:
    virtual ~RandomSource() = default;

    /**
     * @brief Return exactly @p count random bytes.
     */
    virtual std::vector<uint8_t> randomBytes(size_t count) = 0;
};

/**
 * @class SystemRandomSource
 * @brief Reads the operating system entropy device through std::random_device.
 *
 * No seeded PRNG sits in between, so every byte comes straight from the
 * device. Safe to share across threads.
 */
class BSONUUID_UTILS_API SystemRandomSource : public RandomSource {
public:
    SystemRandomSource();

    std::vector<uint8_t> randomBytes(size_t count) override;

private:
    std::random_device device_;
    std::mutex mutex_;
};

/**
 * @brief Process-wide SystemRandomSource instance.
 */
BSONUUID_UTILS_API std::shared_ptr<RandomSource> systemRandomSource();

}  // namespace utils
}  // namespace bsonuuid
