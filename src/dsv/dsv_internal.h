/**
 * @file
 *
 * Internal definitions for DSV module implementation.
 *
 * This header contains internal-only definitions used by the DSV module
 * implementation. It should not be included by external code.
 *
 * Copyright 2026 by Corey Pennycuff
 */

#ifndef GHOTI_IO_DSV_INTERNAL_H
#define GHOTI_IO_DSV_INTERNAL_H

#include <cstddef>
#include <cstdint>
#include <string>

#include <ghoti.io/dsv/dsv_core.h>

namespace gdsv {

/**
 * @brief Default limits for parsing (used when opts->max_* is 0)
 */
#define DSV_DEFAULT_MAX_FIELD_BYTES (128 * 1024) // 128KiB
#define DSV_DEFAULT_MAX_COLS (100 * 1000)        // 100k columns

/**
 * @brief Default context radius for error snippets
 */
#define DSV_DEFAULT_CONTEXT_RADIUS_BYTES 40

/**
 * @brief Largest magnitude at which every integer is exact in a double (2^53)
 */
#define DSV_MAX_EXACT_INTEGER 9007199254740992.0

/**
 * @brief Position tracking structure for DSV processing
 */
struct dsv_position {
  size_t offset; ///< Byte offset from start
  int line;      ///< Line number (1-based)
  int column;    ///< Column number (1-based, byte-based)
};

/**
 * @brief Get limit value with default fallback
 *
 * @param configured Configured limit value (0 means use default)
 * @param default_val Default limit value to use if configured is 0
 * @return Effective limit value
 */
inline size_t dsv_get_limit(size_t configured, size_t default_val) {
  return configured > 0 ? configured : default_val;
}

/**
 * @brief Set error structure with common defaults
 *
 * Resets the error structure, then sets code and message. Line and column
 * default to 1. Additional fields can be set after the call if needed.
 *
 * @param err Error structure pointer (can be NULL, in which case this is a
 * no-op)
 * @param code Error code
 * @param message Error message (static string, NULL for status_message(code))
 */
inline void dsv_set_error(Error * err, Status code, const char * message) {
  if (err) {
    *err = Error();
    err->code = code;
    err->message = message ? message : status_message(code);
    err->line = 1;
    err->column = 1;
  }
}

/**
 * @brief Parse a field as a number
 *
 * Accepts the decimal and exponent forms of a floating point literal with
 * an optional sign, plus "inf", "infinity" and "nan" in any case. Leading
 * and trailing ASCII whitespace is ignored. Parsing does not depend on the
 * C locale.
 *
 * @param data Field data
 * @param len Field length in bytes
 * @param out Output parameter for the number (must not be NULL)
 * @return true if the whole field is a number, false otherwise
 */
GDSV_INTERNAL_API bool dsv_parse_number(
    const char * data, size_t len, double * out);

/**
 * @brief Format a number for output
 *
 * Integral values of magnitude up to 2^53 are written as bare decimal
 * digits ("18"). Other values use the shortest representation that parses
 * back to the same double ("2.5", "1e+300", "inf", "nan").
 *
 * @param number Number to format
 * @return Decimal text
 */
GDSV_INTERNAL_API std::string dsv_format_number(double number);

/**
 * @brief Format an exact integer as bare decimal digits
 */
GDSV_INTERNAL_API std::string dsv_format_integer(long long number);

/**
 * @brief Escape a field body for output
 *
 * Appends the field to `out` with quote characters doubled (or escaped),
 * escape characters escaped, and, under GDSV_QUOTE_NONE, delimiters and
 * line breaks escaped. Reports whether the content requires quoting under
 * GDSV_QUOTE_MINIMAL. Quotes around the field are not added.
 *
 * @param data Field data (may be NULL if len is 0)
 * @param len Field length in bytes
 * @param dialect Dialect
 * @param newline Record terminator; its bytes also trigger quoting
 * @param out Output string (appended to)
 * @param wants_quote Output parameter: whether the content needs quoting
 * @return GDSV_OK on success, GDSV_E_NEED_ESCAPE if a byte needs an escape
 *         character and none is configured
 */
GDSV_INTERNAL_API Status dsv_escape_field(const char * data, size_t len,
    const Dialect & dialect, const std::string & newline, std::string * out,
    bool * wants_quote);

/**
 * @brief Generate a context snippet around an error position
 *
 * Extracts a snippet of text around the error position for better error
 * reporting. The snippet includes context before and after the error position,
 * with a caret offset indicating the exact error location.
 *
 * @param input Input buffer containing the data
 * @param input_len Length of input buffer
 * @param error_offset Byte offset of the error (0-based, clamped to input_len)
 * @param context_before Number of bytes of context before the error
 * @param context_after Number of bytes of context after the error
 * @param snippet_out Output parameter for the snippet
 * @param caret_offset_out Output parameter for caret offset within snippet
 */
GDSV_INTERNAL_API void dsv_error_generate_context_snippet(const char * input,
    size_t input_len, size_t error_offset, size_t context_before,
    size_t context_after, std::string * snippet_out, size_t * caret_offset_out);

} // namespace gdsv

#endif /* GHOTI_IO_DSV_INTERNAL_H */
