/**
 * @file export.hpp
 * @brief Symbol visibility macros for lanlight_utils.
 *
 * This header provides the LANLIGHT_UTILS_API macro for cross-platform
 * shared library symbol export/import.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LANLIGHT_UTILS_BUILD)
        #define LANLIGHT_UTILS_API __declspec(dllexport)
    #else
        #define LANLIGHT_UTILS_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #define LANLIGHT_UTILS_API __attribute__((visibility("default")))
#else
    #define LANLIGHT_UTILS_API
#endif
