/**
 * @file dsv.h
 * @brief Delimiter-separated values parsing and serialization
 *
 * This header serves as the umbrella header for the DSV library.
 * It includes all DSV module headers for convenience.
 *
 * For code that only needs core types, use
 * <ghoti.io/dsv/dsv_core.h> instead to reduce compile-time dependencies.
 */

#ifndef GHOTI_IO_DSV_H
#define GHOTI_IO_DSV_H

// Include core types and definitions
#include <ghoti.io/dsv/version.h>
#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_value.h>

// DSV module headers
#include <ghoti.io/dsv/dsv_stream.h>
#include <ghoti.io/dsv/dsv_reader.h>
#include <ghoti.io/dsv/dsv_record.h>
#include <ghoti.io/dsv/dsv_dict_reader.h>
#include <ghoti.io/dsv/dsv_writer.h>
#include <ghoti.io/dsv/dsv_dict_writer.h>

#endif /* GHOTI_IO_DSV_H */
