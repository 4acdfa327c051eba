/**
 * @file dsv_core.cpp
 * @brief Dialects, option defaults, status messages and error helpers
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"

#include <cstring>

namespace gdsv {

Dialect dialect_default() {
  Dialect dialect;
  dialect.delimiter = ',';
  dialect.quote = '"';
  dialect.escape = '\0';
  dialect.doublequote = true;
  dialect.skip_initial_space = false;
  dialect.strict = false;
  dialect.quoting = GDSV_QUOTE_MINIMAL;
  return dialect;
}

Dialect dialect_excel() {
  return dialect_default();
}

Dialect dialect_excel_tab() {
  Dialect dialect = dialect_default();
  dialect.delimiter = '\t';
  return dialect;
}

Dialect dialect_unix() {
  Dialect dialect = dialect_default();
  dialect.quoting = GDSV_QUOTE_ALL;
  return dialect;
}

Status dialect_by_name(const char * name, Dialect * out) {
  if (!name || !out) {
    return GDSV_E_INVALID;
  }
  if (strcmp(name, "excel") == 0) {
    *out = dialect_excel();
  }
  else if (strcmp(name, "excel-tab") == 0) {
    *out = dialect_excel_tab();
  }
  else if (strcmp(name, "unix") == 0) {
    *out = dialect_unix();
  }
  else {
    return GDSV_E_INVALID;
  }
  return GDSV_OK;
}

Status dialect_validate(const Dialect & dialect) {
  const char d = dialect.delimiter;
  if (d == '\0' || d == '\r' || d == '\n') {
    return GDSV_E_INVALID;
  }
  if (dialect.quoting < GDSV_QUOTE_MINIMAL || dialect.quoting > GDSV_QUOTE_NONE) {
    return GDSV_E_INVALID;
  }
  if (dialect.quote == '\0' && dialect.quoting != GDSV_QUOTE_NONE) {
    return GDSV_E_INVALID;
  }
  if (dialect.quote != '\0' &&
      (dialect.quote == d || dialect.quote == '\r' || dialect.quote == '\n')) {
    return GDSV_E_INVALID;
  }
  if (dialect.escape != '\0' &&
      (dialect.escape == d || dialect.escape == '\r' || dialect.escape == '\n')) {
    return GDSV_E_INVALID;
  }
  return GDSV_OK;
}

Parse_Options parse_options_default() {
  Parse_Options opts;
  opts.dialect = dialect_default();
  opts.max_field_bytes = 0;
  opts.max_cols = 0;
  opts.enable_context_snippet = true;
  opts.context_radius_bytes = DSV_DEFAULT_CONTEXT_RADIUS_BYTES;
  return opts;
}

Write_Options write_options_default() {
  Write_Options opts;
  opts.dialect = dialect_default();
  opts.newline = "\r\n";
  return opts;
}

const char * status_message(Status status) {
  switch (status) {
  case GDSV_OK:
    return "Success";
  case GDSV_END:
    return "End of input";
  case GDSV_E_INVALID:
    return "Invalid input or operation";
  case GDSV_E_LIMIT:
    return "Resource limit exceeded";
  case GDSV_E_UNTERMINATED_QUOTE:
    return "Unterminated quoted field";
  case GDSV_E_UNEXPECTED_QUOTE:
    return "Unexpected character after closing quote";
  case GDSV_E_INVALID_ESCAPE:
    return "Invalid escape sequence";
  case GDSV_E_NUMBER:
    return "Unquoted field is not a number";
  case GDSV_E_DUPLICATE_COLUMN:
    return "Duplicate column name";
  case GDSV_E_READ:
    return "Read from source failed";
  case GDSV_E_NEED_ESCAPE:
    return "Field needs escaping but no escape character is set";
  case GDSV_E_MISSING_FIELD:
    return "Row is missing a configured column";
  case GDSV_E_EXTRA_FIELD:
    return "Row has a key that is not a configured column";
  case GDSV_E_WRITE:
    return "Write to sink failed";
  case GDSV_E_STATE:
    return "Invalid state for operation";
  }
  return "Unknown status";
}

void dsv_error_generate_context_snippet(const char * input, size_t input_len,
    size_t error_offset, size_t context_before, size_t context_after,
    std::string * snippet_out, size_t * caret_offset_out) {
  if (!snippet_out || !caret_offset_out) {
    return;
  }
  snippet_out->clear();
  *caret_offset_out = 0;
  if (!input || input_len == 0) {
    return;
  }
  if (error_offset > input_len) {
    error_offset = input_len;
  }

  size_t start = error_offset > context_before ? error_offset - context_before : 0;
  size_t end = input_len - error_offset > context_after
      ? error_offset + context_after
      : input_len;

  snippet_out->assign(input + start, end - start);
  *caret_offset_out = error_offset - start;
}

} // namespace gdsv
