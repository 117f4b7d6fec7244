/**
 * @file export.hpp
 * @brief Symbol visibility macros for bsonuuid_utils shared library.
 *
 * This header provides the BSONUUID_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#if defined(BSONUUID_STATIC)
    // Static build - nothing to export
    #define BSONUUID_UTILS_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(BSONUUID_UTILS_BUILD)
        #define BSONUUID_UTILS_API __declspec(dllexport)
    #else
        #define BSONUUID_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(BSONUUID_UTILS_BUILD)
        #define BSONUUID_UTILS_API __attribute__((visibility("default")))
    #else
        #define BSONUUID_UTILS_API
    #endif
#else
    #define BSONUUID_UTILS_API
#endif
