#ifndef SHKIT_EXPORT_HPP
#define SHKIT_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Symbol visibility macros for the shkit library.
 *
 * SHKIT_BUILDING_SHARED is defined by the build when libshkit is compiled
 * as a shared object. Static builds leave SHKIT_API empty.
 */

#if defined(__GNUC__) || defined(__clang__)
    #ifdef SHKIT_BUILDING_SHARED
        #define SHKIT_API __attribute__((visibility("default")))
    #else
        #define SHKIT_API
    #endif
#else
    #define SHKIT_API
#endif

#endif // SHKIT_EXPORT_HPP
