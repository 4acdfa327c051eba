/**
 * @file dsv_version.cpp
 * @brief Library version queries
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include <ghoti.io/dsv/version.h>

#define GDSV_STRINGIFY_(x) #x
#define GDSV_STRINGIFY(x) GDSV_STRINGIFY_(x)

namespace gdsv {

uint32_t version_major() {
  return GDSV_VERSION_MAJOR;
}

uint32_t version_minor() {
  return GDSV_VERSION_MINOR;
}

uint32_t version_patch() {
  return GDSV_VERSION_PATCH;
}

const char * version_string() {
  return GDSV_STRINGIFY(GDSV_VERSION_MAJOR) "." GDSV_STRINGIFY(
      GDSV_VERSION_MINOR) "." GDSV_STRINGIFY(GDSV_VERSION_PATCH);
}

} // namespace gdsv
