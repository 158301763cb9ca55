/**
 * @file export.hpp
 * @brief Symbol visibility macros for the sdcdisco_wsd library.
 *
 * @copyright Copyright (c) 2024 SdcDisco Contributors
 * @license MIT License
 */

#pragma once

#if defined(_WIN32) || defined(_WIN64)
    #if defined(SDCDISCO_WSD_BUILD)
        #define SDCDISCO_WSD_API __declspec(dllexport)
    #else
        #define SDCDISCO_WSD_API __declspec(dllimport)
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(SDCDISCO_WSD_BUILD)
        #define SDCDISCO_WSD_API __attribute__((visibility("default")))
    #else
        #define SDCDISCO_WSD_API
    #endif
#else
    #define SDCDISCO_WSD_API
#endif
