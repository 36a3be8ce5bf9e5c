#ifndef PROGMAN_EXPORT_HPP
#define PROGMAN_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Cross-platform shared library export/import macros.
 *
 * When building progman as a shared library:
 * - Define PROGMAN_SHARED when using the library
 * - PROGMAN_BUILDING_SHARED is defined automatically during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef PROGMAN_BUILDING_SHARED
        #define PROGMAN_API __declspec(dllexport)
    #elif defined(PROGMAN_SHARED)
        #define PROGMAN_API __declspec(dllimport)
    #else
        #define PROGMAN_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef PROGMAN_BUILDING_SHARED
        #define PROGMAN_API __attribute__((visibility("default")))
    #else
        #define PROGMAN_API
    #endif
#else
    #define PROGMAN_API
#endif

#endif // PROGMAN_EXPORT_HPP
