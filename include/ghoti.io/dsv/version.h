/**
 * @file
 *
 * Version information for the Ghoti.io DSV library.
 *
 * This library reads and writes delimiter-separated text (CSV, TSV and
 * custom dialects) with configurable quoting and field typing.
 *
 * Copyright 2026 by Corey Pennycuff
 */

#ifndef GHOTI_IO_DSV_VERSION_H
#define GHOTI_IO_DSV_VERSION_H

#include <ghoti.io/dsv/macros.h>
#include <cstdint>

/**
 * @brief Library version information
 */
#define GDSV_VERSION_MAJOR 0
#define GDSV_VERSION_MINOR 1
#define GDSV_VERSION_PATCH 0

namespace gdsv {

/**
 * @brief Get the major version number
 * @return The major version number
 */
GDSV_API uint32_t version_major();

/**
 * @brief Get the minor version number
 * @return The minor version number
 */
GDSV_API uint32_t version_minor();

/**
 * @brief Get the patch version number
 * @return The patch version number
 */
GDSV_API uint32_t version_patch();

/**
 * @brief Get the version string
 * @return A string representation of the version (e.g., "0.1.0")
 */
GDSV_API const char * version_string();

} // namespace gdsv

#endif /* GHOTI_IO_DSV_VERSION_H */
