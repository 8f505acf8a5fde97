#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - GEOWARP_BUILD_SHARED: when building GeoWarp as shared library
 *   - GEOWARP_USE_SHARED: when using GeoWarp as shared library
 *   - GEOWARP_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(GEOWARP_BUILD_SHARED)
        #define GEOWARP_API __declspec(dllexport)
    #elif defined(GEOWARP_USE_SHARED)
        #define GEOWARP_API __declspec(dllimport)
    #else
        #define GEOWARP_API
    #endif
#else
    #if defined(GEOWARP_BUILD_SHARED)
        #define GEOWARP_API __attribute__((visibility("default")))
    #else
        #define GEOWARP_API
    #endif
#endif
