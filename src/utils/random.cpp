/**
 * @file random.cpp
 * @brief SystemRandomSource implementation.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#include "bsonuuid/utils/random.hpp"
#include "bsonuuid/utils/logger.hpp"

namespace bsonuuid {
namespace utils {

SystemRandomSource::SystemRandomSource() {
    LOG_DEBUG("Random", "System random source ready (entropy estimate: {})", device_.entropy());
}

std::vector<uint8_t> SystemRandomSource::randomBytes(size_t count) {
    std::vector<uint8_t> bytes(count);

    std::lock_guard<std::mutex> lock(mutex_);
    size_t i = 0;
    while (i < count) {
        // random_device yields 32 bits per call
        uint32_t word = device_();
        for (int shift = 0; shift < 32 && i < count; shift += 8) {
            bytes[i++] = static_cast<uint8_t>(word >> shift);
        }
    }

    return bytes;
}

std::shared_ptr<RandomSource> systemRandomSource() {
    static const std::shared_ptr<RandomSource> source = std::make_shared<SystemRandomSource>();
    return source;
}

}  // namespace utils
}  // namespace bsonuuid
