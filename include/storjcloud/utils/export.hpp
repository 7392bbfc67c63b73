/**
 * @file export.hpp
 * @brief Symbol visibility macros for storjcloud_utils shared library.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(STORJCLOUD_UTILS_BUILD)
        #define STORJCLOUD_UTILS_API __declspec(dllexport)
    #else
        #define STORJCLOUD_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STORJCLOUD_UTILS_BUILD)
        #define STORJCLOUD_UTILS_API __attribute__((visibility("default")))
    #else
        #define STORJCLOUD_UTILS_API
    #endif
#else
    #define STORJCLOUD_UTILS_API
#endif
