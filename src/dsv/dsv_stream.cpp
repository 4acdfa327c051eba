/**
 * @file dsv_stream.cpp
 * @brief Streaming DSV tokenizer
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_stream_internal.h"

#include <memory>
#include <utility>

namespace gdsv {

static bool dsv_is_newline(char c) {
  return c == '\n' || c == '\r';
}

static Status dsv_stream_emit(Stream::State * st, const Event & event) {
  Status status = st->callback(&event, st->user_data);
  if (status != GDSV_OK) {
    return dsv_stream_fail(st, status, "Parsing stopped by callback");
  }
  return GDSV_OK;
}

void dsv_stream_state_init(Stream::State * st, const Parse_Options * opts,
    Event_Callback callback, void * user_data) {
  st->opts = opts ? *opts : parse_options_default();
  st->callback = callback;
  st->user_data = user_data;

  st->state = DSV_STREAM_STATE_START_OF_RECORD;
  st->in_record = false;
  st->field_count = 0;
  st->row_count = 0;

  st->field.clear();
  st->field_is_quoted = false;
  st->record.clear();

  st->pos.offset = 0;
  st->pos.line = 1;
  st->pos.column = 1;
  st->lines = 0;
  st->last_was_cr = false;

  st->max_field_bytes =
      dsv_get_limit(st->opts.max_field_bytes, DSV_DEFAULT_MAX_FIELD_BYTES);
  st->max_cols = dsv_get_limit(st->opts.max_cols, DSV_DEFAULT_MAX_COLS);

  st->status = GDSV_OK;
  st->error = Error();

  if (!callback) {
    dsv_stream_fail(st, GDSV_E_INVALID, "Event callback is required");
  }
  else if (dialect_validate(st->opts.dialect) != GDSV_OK) {
    dsv_stream_fail(st, GDSV_E_INVALID, "Invalid dialect");
  }
}

Status dsv_stream_fail(Stream::State * st, Status code, const char * message) {
  if (st->status != GDSV_OK) {
    return st->status;
  }
  dsv_set_error(&st->error, code, message);
  st->error.byte_offset = st->pos.offset > 0 ? st->pos.offset - 1 : 0;
  st->error.line = st->pos.line;
  st->error.column = st->pos.column;
  st->error.row_index = st->row_count;
  st->error.col_index = st->field_count;

  if (st->opts.enable_context_snippet && !st->record.empty()) {
    size_t radius = dsv_get_limit(
        st->opts.context_radius_bytes, DSV_DEFAULT_CONTEXT_RADIUS_BYTES);
    dsv_error_generate_context_snippet(st->record.data(), st->record.size(),
        st->record.size() - 1, radius, radius, &st->error.context_snippet,
        &st->error.caret_offset);
  }

  st->status = code;
  st->state = DSV_STREAM_STATE_END;
  return code;
}

Status dsv_stream_append(Stream::State * st, char c) {
  if (st->field.size() >= st->max_field_bytes) {
    return dsv_stream_fail(st, GDSV_E_LIMIT, "Field larger than field limit");
  }
  st->field.push_back(c);
  return GDSV_OK;
}

Status dsv_stream_emit_field(Stream::State * st) {
  if (st->field_count >= st->max_cols) {
    return dsv_stream_fail(st, GDSV_E_LIMIT, "Too many fields in record");
  }

  Event event = {};
  event.type = GDSV_EVENT_FIELD;
  event.data = st->field.data();
  event.data_len = st->field.size();
  event.is_quoted = st->field_is_quoted;
  event.row_index = st->row_count;
  event.col_index = st->field_count;

  Status status = dsv_stream_emit(st, event);
  st->field.clear();
  st->field_is_quoted = false;
  if (status != GDSV_OK) {
    return status;
  }
  ++st->field_count;
  return GDSV_OK;
}

Status dsv_stream_begin_record(Stream::State * st) {
  Event event = {};
  event.type = GDSV_EVENT_RECORD_BEGIN;
  event.row_index = st->row_count;

  st->in_record = true;
  st->field_count = 0;
  st->state = DSV_STREAM_STATE_START_OF_FIELD;
  return dsv_stream_emit(st, event);
}

Status dsv_stream_end_record(Stream::State * st) {
  Event event = {};
  event.type = GDSV_EVENT_RECORD_END;
  event.row_index = st->row_count;
  event.line = st->lines;

  st->in_record = false;
  st->state = DSV_STREAM_STATE_START_OF_RECORD;
  Status status = dsv_stream_emit(st, event);
  if (status != GDSV_OK) {
    return status;
  }

  ++st->row_count;
  st->field_count = 0;
  st->record.clear();
  return GDSV_OK;
}

static Status dsv_stream_process_start_of_record(
    Stream::State * st, char c, bool after_cr, bool * reprocess) {
  if (c == '\n' && after_cr) {
    // Second half of a CRLF that ended the previous record
    return GDSV_OK;
  }
  Status status = dsv_stream_begin_record(st);
  if (status != GDSV_OK) {
    return status;
  }
  if (dsv_is_newline(c)) {
    // Blank line: a record with no fields
    return dsv_stream_end_record(st);
  }
  *reprocess = true;
  return GDSV_OK;
}

static Status dsv_stream_process_start_of_field(Stream::State * st, char c) {
  const Dialect & d = st->opts.dialect;

  if (d.quoting != GDSV_QUOTE_NONE && d.quote && c == d.quote) {
    st->field_is_quoted = true;
    st->state = DSV_STREAM_STATE_QUOTED_FIELD;
    return GDSV_OK;
  }
  if (c == d.delimiter) {
    return dsv_stream_emit_field(st);
  }
  if (dsv_is_newline(c)) {
    Status status = dsv_stream_emit_field(st);
    return status != GDSV_OK ? status : dsv_stream_end_record(st);
  }
  if (c == ' ' && d.skip_initial_space) {
    return GDSV_OK;
  }
  if (d.escape && c == d.escape) {
    st->state = DSV_STREAM_STATE_ESCAPE_IN_UNQUOTED;
    return GDSV_OK;
  }
  st->state = DSV_STREAM_STATE_UNQUOTED_FIELD;
  return dsv_stream_append(st, c);
}

static Status dsv_stream_process_unquoted_field(Stream::State * st, char c) {
  const Dialect & d = st->opts.dialect;

  if (c == d.delimiter) {
    st->state = DSV_STREAM_STATE_START_OF_FIELD;
    return dsv_stream_emit_field(st);
  }
  if (dsv_is_newline(c)) {
    Status status = dsv_stream_emit_field(st);
    return status != GDSV_OK ? status : dsv_stream_end_record(st);
  }
  if (d.escape && c == d.escape) {
    st->state = DSV_STREAM_STATE_ESCAPE_IN_UNQUOTED;
    return GDSV_OK;
  }
  // A quote character inside an unquoted field is literal
  return dsv_stream_append(st, c);
}

static Status dsv_stream_process_quoted_field(Stream::State * st, char c) {
  const Dialect & d = st->opts.dialect;

  if (d.escape && c == d.escape) {
    st->state = DSV_STREAM_STATE_ESCAPE_IN_QUOTED;
    return GDSV_OK;
  }
  if (c == d.quote) {
    st->state = DSV_STREAM_STATE_QUOTE_IN_QUOTED;
    return GDSV_OK;
  }
  // Delimiters and line breaks are part of a quoted field
  return dsv_stream_append(st, c);
}

static Status dsv_stream_process_quote_in_quoted(Stream::State * st, char c) {
  const Dialect & d = st->opts.dialect;

  if (c == d.quote && d.doublequote) {
    st->state = DSV_STREAM_STATE_QUOTED_FIELD;
    return dsv_stream_append(st, c);
  }
  if (c == d.delimiter) {
    st->state = DSV_STREAM_STATE_START_OF_FIELD;
    return dsv_stream_emit_field(st);
  }
  if (dsv_is_newline(c)) {
    Status status = dsv_stream_emit_field(st);
    return status != GDSV_OK ? status : dsv_stream_end_record(st);
  }
  if (d.strict) {
    return dsv_stream_fail(
        st, GDSV_E_UNEXPECTED_QUOTE, "Delimiter expected after closing quote");
  }
  // Lenient: bytes after the closing quote continue the field
  st->state = DSV_STREAM_STATE_UNQUOTED_FIELD;
  return dsv_stream_append(st, c);
}

Status dsv_stream_process_byte(Stream::State * st, char c) {
  bool after_cr = st->last_was_cr;
  st->last_was_cr = (c == '\r');

  ++st->pos.offset;
  if (c == '\r' || (c == '\n' && !after_cr)) {
    ++st->lines;
  }
  if (st->in_record || st->state != DSV_STREAM_STATE_START_OF_RECORD ||
      !dsv_is_newline(c)) {
    st->record.push_back(c);
  }

  Status status = GDSV_OK;
  bool reprocess = true;
  while (reprocess && status == GDSV_OK) {
    reprocess = false;
    switch (st->state) {
    case DSV_STREAM_STATE_START_OF_RECORD:
      status = dsv_stream_process_start_of_record(st, c, after_cr, &reprocess);
      break;
    case DSV_STREAM_STATE_START_OF_FIELD:
      status = dsv_stream_process_start_of_field(st, c);
      break;
    case DSV_STREAM_STATE_UNQUOTED_FIELD:
      status = dsv_stream_process_unquoted_field(st, c);
      break;
    case DSV_STREAM_STATE_ESCAPE_IN_UNQUOTED:
      st->state = DSV_STREAM_STATE_UNQUOTED_FIELD;
      status = dsv_stream_append(st, c);
      break;
    case DSV_STREAM_STATE_QUOTED_FIELD:
      status = dsv_stream_process_quoted_field(st, c);
      break;
    case DSV_STREAM_STATE_ESCAPE_IN_QUOTED:
      st->state = DSV_STREAM_STATE_QUOTED_FIELD;
      status = dsv_stream_append(st, c);
      break;
    case DSV_STREAM_STATE_QUOTE_IN_QUOTED:
      status = dsv_stream_process_quote_in_quoted(st, c);
      break;
    case DSV_STREAM_STATE_END:
      status = st->status != GDSV_OK ? st->status : GDSV_E_STATE;
      break;
    }
  }

  if (c == '\r' || (c == '\n' && !after_cr)) {
    st->pos.line += 1;
    st->pos.column = 1;
  }
  else if (c != '\n') {
    st->pos.column += 1;
  }
  return status;
}

Stream::Stream(
    const Parse_Options * opts, Event_Callback callback, void * user_data)
    : state_(std::make_unique<State>()) {
  dsv_stream_state_init(state_.get(), opts, callback, user_data);
}

Stream::~Stream() = default;

Status Stream::feed(const void * data, size_t len, Error * err) {
  State * st = state_.get();

  if (st->status == GDSV_OK && st->state == DSV_STREAM_STATE_END) {
    dsv_set_error(err, GDSV_E_STATE, "Stream already finished");
    return GDSV_E_STATE;
  }
  if (st->status == GDSV_OK && !data && len > 0) {
    dsv_set_error(err, GDSV_E_INVALID, "Input data is NULL");
    return GDSV_E_INVALID;
  }

  const char * bytes = static_cast<const char *>(data);
  for (size_t i = 0; i < len && st->status == GDSV_OK; ++i) {
    dsv_stream_process_byte(st, bytes[i]);
  }

  if (st->status != GDSV_OK) {
    if (err) {
      *err = st->error;
    }
    return st->status;
  }
  return GDSV_OK;
}

Status Stream::finish(Error * err) {
  State * st = state_.get();

  if (st->status == GDSV_OK && st->state == DSV_STREAM_STATE_END) {
    dsv_set_error(err, GDSV_E_STATE, "Stream already finished");
    return GDSV_E_STATE;
  }

  Status status = GDSV_OK;
  if (st->status == GDSV_OK && st->in_record) {
    // The last line had no terminator; it still counts as a line
    ++st->lines;
  }

  switch (st->status == GDSV_OK ? st->state : DSV_STREAM_STATE_END) {
  case DSV_STREAM_STATE_START_OF_RECORD:
  case DSV_STREAM_STATE_END:
    break;
  case DSV_STREAM_STATE_START_OF_FIELD:
  case DSV_STREAM_STATE_UNQUOTED_FIELD:
  case DSV_STREAM_STATE_QUOTE_IN_QUOTED:
    status = dsv_stream_emit_field(st);
    if (status == GDSV_OK) {
      status = dsv_stream_end_record(st);
    }
    break;
  case DSV_STREAM_STATE_QUOTED_FIELD:
    status = dsv_stream_fail(st, GDSV_E_UNTERMINATED_QUOTE,
        "Unterminated quoted field at end of input");
    break;
  case DSV_STREAM_STATE_ESCAPE_IN_UNQUOTED:
  case DSV_STREAM_STATE_ESCAPE_IN_QUOTED:
    status = dsv_stream_fail(
        st, GDSV_E_INVALID_ESCAPE, "Escape character at end of input");
    break;
  }

  if (st->status == GDSV_OK && status == GDSV_OK) {
    Event event = {};
    event.type = GDSV_EVENT_END;
    event.row_index = st->row_count;
    event.line = st->lines;
    dsv_stream_emit(st, event);
  }

  if (st->status != GDSV_OK) {
    if (err) {
      *err = st->error;
    }
    return st->status;
  }
  st->state = DSV_STREAM_STATE_END;
  return GDSV_OK;
}

size_t Stream::lines() const {
  return state_->lines;
}

} // namespace gdsv
