/**
 * @file export.hpp
 * @brief Symbol visibility macros for storjcloud_services shared library.
 *
 * @copyright Copyright (c) 2024 StorjCloud Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(STORJCLOUD_SERVICES_BUILD)
        #define STORJCLOUD_SERVICES_API __declspec(dllexport)
    #else
        #define STORJCLOUD_SERVICES_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(STORJCLOUD_SERVICES_BUILD)
        #define STORJCLOUD_SERVICES_API __attribute__((visibility("default")))
    #else
        #define STORJCLOUD_SERVICES_API
    #endif
#else
    #define STORJCLOUD_SERVICES_API
#endif
