/**
 * @file macros.h
 * @brief Cross-compiler macros and utilities for the Ghoti.io DSV library
 *
 * This header provides cross-compiler macros for symbol visibility in the
 * shared library build, plus a small array helper.
 */

#ifndef GHOTI_IO_DSV_MACROS_H
#define GHOTI_IO_DSV_MACROS_H

/**
 * @brief API export macro for cross-platform library symbols
 *
 * Use this macro to mark functions and classes that should be exported
 * from the shared library. Automatically handles Windows DLL export/import
 * and Unix symbol visibility. Static builds define GDSV_STATIC, which
 * turns the macro into a no-op.
 *
 * Example:
 * @code
 * GDSV_API void public_function();
 * @endcode
 */
#if defined(GDSV_STATIC)
#define GDSV_API

#elif defined(_WIN32) || defined(__CYGWIN__)
#ifdef GDSV_BUILD
#define GDSV_API __declspec(dllexport)
#else
#define GDSV_API __declspec(dllimport)
#endif

#else
#define GDSV_API __attribute__((visibility("default")))

#endif

/**
 * @brief Internal API export macro for testing
 *
 * This macro is used to export internal functions that are needed for testing
 * but should not be part of the public API. These functions are only exported
 * when GDSV_TEST_BUILD is defined during library compilation.
 *
 * Example:
 * @code
 * GDSV_INTERNAL_API void internal_function();
 * @endcode
 */
#ifdef GDSV_TEST_BUILD
#define GDSV_INTERNAL_API GDSV_API
#else
#define GDSV_INTERNAL_API
#endif

/**
 * @brief Compile-time array size helper
 *
 * Calculates the number of elements in a statically-allocated array.
 *
 * @param a The array (not a pointer)
 * @return The number of elements in the array
 */
#ifndef GDSV_ARRAY_SIZE
#define GDSV_ARRAY_SIZE(a) (sizeof(a) / sizeof((a)[0]))
#endif

#endif /* GHOTI_IO_DSV_MACROS_H */
