/**
 * @file export.hpp
 * @brief Symbol visibility macros for lanlight_services.
 *
 * @copyright Copyright (c) 2024 LanLight Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(LANLIGHT_SERVICES_BUILD)
        #define LANLIGHT_SERVICES_API __declspec(dllexport)
    #else
        #define LANLIGHT_SERVICES_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(LANLIGHT_SERVICES_BUILD)
        #define LANLIGHT_SERVICES_API __attribute__((visibility("default")))
    #else
        #define LANLIGHT_SERVICES_API
    #endif
#else
    #define LANLIGHT_SERVICES_API
#endif
