/**
 * @file dsv_core.h
 * @brief Core DSV types and definitions
 *
 * This header provides the core types, enums, and option structures for the
 * DSV module. It does not include the reader or writer APIs. Use this for
 * code that only needs type definitions.
 *
 * For the full API, include <ghoti.io/dsv.h> instead.
 */

#ifndef GHOTI_IO_DSV_CORE_H
#define GHOTI_IO_DSV_CORE_H

#include <ghoti.io/dsv/macros.h>
#include <cstddef>
#include <string>

namespace gdsv {

/**
 * @brief DSV operation status codes
 */
enum Status {
  GDSV_OK = 0,

  GDSV_END, ///< No more rows (end of input, not an error)

  // General errors
  GDSV_E_INVALID, ///< Invalid input, configuration or operation
  GDSV_E_LIMIT,   ///< Resource limit exceeded

  // Parsing errors
  GDSV_E_UNTERMINATED_QUOTE, ///< Unterminated quoted field (EOF inside quotes)
  GDSV_E_UNEXPECTED_QUOTE,   ///< Unexpected byte after closing quote (strict)
  GDSV_E_INVALID_ESCAPE,     ///< Escape character at end of input
  GDSV_E_NUMBER,             ///< Unquoted field is not a number (NONNUMERIC)
  GDSV_E_DUPLICATE_COLUMN,   ///< Duplicate header name (DUPCOL_ERROR)
  GDSV_E_READ,               ///< Source read failed

  // Writing errors
  GDSV_E_NEED_ESCAPE,   ///< Field needs escaping but no escape is configured
  GDSV_E_MISSING_FIELD, ///< Named row lacks a configured column
  GDSV_E_EXTRA_FIELD,   ///< Named row has a key outside the column list
  GDSV_E_WRITE,         ///< Sink write failed
  GDSV_E_STATE          ///< Invalid state for operation
};

/**
 * @brief DSV error information
 *
 * Contains detailed error information including code, message, position,
 * and optional enhanced diagnostics (context snippet, caret positioning).
 */
struct Error {
  Status code = GDSV_OK;         ///< Error code
  const char * message = nullptr; ///< Human-readable error message (static string)
  size_t byte_offset = 0;        ///< Byte offset from start of input (0-based)
  int line = 0;                  ///< Line number (1-based)
  int column = 0;                ///< Column number (1-based, byte-based)
  size_t row_index = 0;          ///< Row index (0-based, physical records)
  size_t col_index = 0;          ///< Column index (0-based)

  // Enhanced error reporting (optional, may be empty)
  std::string context_snippet; ///< Text of the record around the error
  size_t caret_offset = 0;     ///< Byte offset of caret within context snippet
};

/**
 * @brief Quoting policy
 *
 * Controls which fields the writer wraps in quotes and, on input, whether
 * the presence of quotes decides the field type.
 */
enum Quoting {
  GDSV_QUOTE_MINIMAL,    ///< Quote only fields that need it (default)
  GDSV_QUOTE_ALL,        ///< Quote every field
  GDSV_QUOTE_NONNUMERIC, ///< Quote non-numeric fields; unquoted input is numeric
  GDSV_QUOTE_NONE        ///< Never quote; escape special bytes instead
};

/**
 * @brief Duplicate column name handling mode
 */
enum Dupcol_Mode {
  GDSV_DUPCOL_LAST_WINS,  ///< Name resolves to its last occurrence (default)
  GDSV_DUPCOL_FIRST_WINS, ///< Name resolves to its first occurrence
  GDSV_DUPCOL_ERROR       ///< Duplicate names are an error
};

/**
 * @brief DSV dialect structure
 *
 * Defines the exact format rules for parsing and writing. The same dialect
 * read back what it wrote.
 */
struct Dialect {
  char delimiter;          ///< Field delimiter (default ',')
  char quote;              ///< Quote character (default '"', 0 for none)
  char escape;             ///< Escape character (default 0, none)
  bool doublequote;        ///< A doubled quote is a literal quote (default true)
  bool skip_initial_space; ///< Ignore spaces after a delimiter (default false)
  bool strict;             ///< Reject bytes after a closing quote (default false)
  Quoting quoting;         ///< Quoting policy (default GDSV_QUOTE_MINIMAL)
};

/**
 * @brief DSV parse options structure
 *
 * Controls parsing behavior including dialect, limits, and error reporting.
 */
struct Parse_Options {
  Dialect dialect; ///< Dialect configuration

  // Limits (0 => library default)
  size_t max_field_bytes; ///< Maximum field size in bytes (0 = default, 128KiB)
  size_t max_cols;        ///< Maximum number of fields per record (0 = default, 100k)

  // Error context
  bool enable_context_snippet; ///< Generate context snippet for errors (default true)
  size_t context_radius_bytes; ///< Bytes before/after error in snippet (default 40)
};

/**
 * @brief DSV write options structure
 *
 * Controls serialization behavior: dialect (including the quoting policy)
 * and the record terminator.
 */
struct Write_Options {
  Dialect dialect;      ///< Dialect configuration
  const char * newline; ///< Record terminator (default "\r\n", never empty)
};

/**
 * @brief Initialize dialect with the default comma-separated rules
 *
 * Returns a dialect structure with:
 * - Comma delimiter
 * - Double quote character, doubled-quote escaping
 * - No escape character
 * - Minimal quoting
 * - Non-strict
 *
 * @return Initialized dialect structure
 */
GDSV_API Dialect dialect_default();

/**
 * @brief Spreadsheet-compatible comma dialect (same as the default)
 * @return Initialized dialect structure
 */
GDSV_API Dialect dialect_excel();

/**
 * @brief Spreadsheet-compatible tab dialect
 * @return Initialized dialect structure with a TAB delimiter
 */
GDSV_API Dialect dialect_excel_tab();

/**
 * @brief Unix dialect: comma delimiter, every field quoted
 *
 * Meant to be combined with a "\n" newline in the write options.
 *
 * @return Initialized dialect structure
 */
GDSV_API Dialect dialect_unix();

/**
 * @brief Look up one of the predefined dialects by name
 *
 * Known names are "excel", "excel-tab" and "unix".
 *
 * @param name Dialect name (must not be NULL)
 * @param out Output parameter for the dialect (must not be NULL)
 * @return GDSV_OK on success, GDSV_E_INVALID if the name is unknown
 */
GDSV_API Status dialect_by_name(const char * name, Dialect * out);

/**
 * @brief Validate a dialect
 *
 * Rejects dialects that cannot be parsed unambiguously:
 * - NUL, CR or LF as delimiter
 * - Delimiter equal to the quote or escape character
 * - No quote character unless quoting is GDSV_QUOTE_NONE
 * - CR or LF as quote or escape character
 *
 * @param dialect Dialect to validate
 * @return GDSV_OK if valid, GDSV_E_INVALID otherwise
 */
GDSV_API Status dialect_validate(const Dialect & dialect);

/**
 * @brief Initialize parse options with defaults
 *
 * Returns a parse options structure with:
 * - Default dialect
 * - All limits set to 0 (library defaults)
 * - Context snippets enabled
 *
 * @return Initialized parse options structure
 */
GDSV_API Parse_Options parse_options_default();

/**
 * @brief Initialize write options with defaults
 *
 * Returns a write options structure with:
 * - Default dialect (minimal quoting)
 * - "\r\n" record terminator
 *
 * @return Initialized write options structure
 */
GDSV_API Write_Options write_options_default();

/**
 * @brief Get a static description of a status code
 *
 * @param status Status code
 * @return Static, null-terminated description (never NULL)
 */
GDSV_API const char * status_message(Status status);

} // namespace gdsv

#endif /* GHOTI_IO_DSV_CORE_H */
