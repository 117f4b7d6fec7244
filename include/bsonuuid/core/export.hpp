/**
 * @file export.hpp
 * @brief Symbol visibility macros for bsonuuid_core shared library.
 *
 * @copyright Copyright (c) 2024 BsonUuid Contributors
 * @license MIT License
 */

#pragma once

#if defined(BSONUUID_STATIC)
    #define BSONUUID_CORE_API
#elif defined(_WIN32) || defined(_WIN64)
    #if defined(BSONUUID_CORE_BUILD)
        #define BSONUUID_CORE_API __declspec(dllexport)
    #else
        #define BSONUUID_CORE_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(BSONUUID_CORE_BUILD)
        #define BSONUUID_CORE_API __attribute__((visibility("default")))
    #else
        #define BSONUUID_CORE_API
    #endif
#else
    #define BSONUUID_CORE_API
#endif
