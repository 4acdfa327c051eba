/**
 * @file dsv_writer.cpp
 * @brief Positional streaming writer and field escaping
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_writer.h>

namespace gdsv {

Status dsv_escape_field(const char * data, size_t len, const Dialect & dialect,
    const std::string & newline, std::string * out, bool * wants_quote) {
  bool quote_needed = false;
  if (!out || (!data && len > 0)) {
    return GDSV_E_INVALID;
  }

  const bool quoting_none = dialect.quoting == GDSV_QUOTE_NONE;
  out->reserve(out->size() + len);
  for (size_t i = 0; i < len; ++i) {
    const char c = data[i];
    bool special = c == dialect.delimiter || c == '\r' || c == '\n' ||
        (dialect.quote && c == dialect.quote) ||
        (dialect.escape && c == dialect.escape) ||
        newline.find(c) != std::string::npos;

    if (special) {
      bool want_escape = false;
      if (quoting_none) {
        want_escape = true;
      }
      else {
        if (dialect.quote && c == dialect.quote) {
          if (dialect.doublequote) {
            out->push_back(dialect.quote);
          }
          else {
            want_escape = true;
          }
        }
        else if (dialect.escape && c == dialect.escape) {
          want_escape = true;
        }
        if (!want_escape) {
          quote_needed = true;
        }
      }
      if (want_escape) {
        if (!dialect.escape) {
          return GDSV_E_NEED_ESCAPE;
        }
        out->push_back(dialect.escape);
      }
    }
    out->push_back(c);
  }

  // A reader skipping initial spaces would drop an unquoted leading space
  if (len > 0 && data[0] == ' ' && dialect.skip_initial_space) {
    quote_needed = true;
  }

  if (wants_quote) {
    *wants_quote = quote_needed;
  }
  return GDSV_OK;
}

static Write_Options dsv_writer_options(const Write_Options * opts) {
  return opts ? *opts : write_options_default();
}

Writer::Writer(const Sink & sink, const Write_Options * opts)
    : sink_(sink),
      opts_(dsv_writer_options(opts)),
      newline_(opts_.newline ? opts_.newline : ""),
      config_status_(dialect_validate(opts_.dialect)) {
  opts_.newline = newline_.c_str();
  if (newline_.empty() || !sink_.write) {
    config_status_ = GDSV_E_INVALID;
  }
}

Status Writer::fail(Status status, const char * message, Error * err) {
  dsv_set_error(err, status, message);
  if (err) {
    err->row_index = record_count_;
    err->col_index = field_count_;
  }
  return status;
}

Status Writer::check_open(bool need_record, Error * err) {
  if (config_status_ != GDSV_OK) {
    return fail(config_status_, "Invalid writer configuration", err);
  }
  if (state_ == GDSV_WRITER_STATE_FINISHED) {
    return fail(GDSV_E_STATE, "Writer already finished", err);
  }
  if (need_record && state_ != GDSV_WRITER_STATE_IN_RECORD) {
    return fail(GDSV_E_STATE, "No record is open", err);
  }
  if (!need_record && state_ == GDSV_WRITER_STATE_IN_RECORD) {
    return fail(GDSV_E_STATE, "A record is already open", err);
  }
  return GDSV_OK;
}

Status Writer::emit(const char * bytes, size_t len, Error * err) {
  if (len == 0) {
    return GDSV_OK;
  }
  Status status = sink_.write(sink_.user, bytes, len);
  if (status != GDSV_OK) {
    return fail(GDSV_E_WRITE, "Write to sink failed", err);
  }
  return GDSV_OK;
}

Status Writer::encode(const char * bytes, size_t len, bool force_quote,
    std::string * out, Error * err) {
  const Dialect & d = opts_.dialect;
  std::string body;
  bool wants_quote = false;

  Status status = dsv_escape_field(bytes, len, d, newline_, &body, &wants_quote);
  if (status != GDSV_OK) {
    return fail(status, "Field needs escaping but no escape character is set",
        err);
  }

  bool quoted = force_quote || (d.quoting == GDSV_QUOTE_MINIMAL && wants_quote);
  if (quoted) {
    out->push_back(d.quote);
    out->append(body);
    out->push_back(d.quote);
  }
  else {
    out->append(body);
  }
  return GDSV_OK;
}

void Writer::value_bytes(const Value & value, std::string * scratch,
    const char ** bytes, size_t * len, bool * force_quote) const {
  const Quoting quoting = opts_.dialect.quoting;
  *bytes = nullptr;
  *len = 0;
  *force_quote = quoting == GDSV_QUOTE_ALL || quoting == GDSV_QUOTE_NONNUMERIC;

  switch (value.kind()) {
  case GDSV_VALUE_TEXT:
    *bytes = value.as_text().data();
    *len = value.as_text().size();
    break;
  case GDSV_VALUE_NUMBER:
    *scratch = value.to_string();
    *bytes = scratch->data();
    *len = scratch->size();
    *force_quote = quoting == GDSV_QUOTE_ALL;
    break;
  case GDSV_VALUE_ABSENT:
    break;
  }
}

Status Writer::encode_value(const Value & value, std::string * out, Error * err) {
  std::string digits;
  const char * bytes;
  size_t len;
  bool force_quote;
  value_bytes(value, &digits, &bytes, &len, &force_quote);
  return encode(bytes, len, force_quote, out, err);
}

Status Writer::record_begin(Error * err) {
  Status status = check_open(false, err);
  if (status != GDSV_OK) {
    return status;
  }
  state_ = GDSV_WRITER_STATE_IN_RECORD;
  field_count_ = 0;
  pending_empty_field_ = false;
  return GDSV_OK;
}

Status Writer::put(
    const char * bytes, size_t len, bool force_quote, Error * err) {
  std::string encoded;
  if (field_count_ > 0) {
    encoded.push_back(opts_.dialect.delimiter);
  }
  Status status = encode(bytes, len, force_quote, &encoded, err);
  if (status != GDSV_OK) {
    return status;
  }

  if (field_count_ == 0 && encoded.empty()) {
    // An unquoted empty first field is only written once it is known
    // whether the record has other fields
    pending_empty_field_ = true;
  }
  else {
    pending_empty_field_ = false;
    status = emit(encoded.data(), encoded.size(), err);
    if (status != GDSV_OK) {
      return status;
    }
  }
  ++field_count_;
  return GDSV_OK;
}

Status Writer::field(const Value & value, Error * err) {
  Status status = check_open(true, err);
  if (status != GDSV_OK) {
    return status;
  }

  std::string digits;
  const char * bytes;
  size_t len;
  bool force_quote;
  value_bytes(value, &digits, &bytes, &len, &force_quote);
  return put(bytes, len, force_quote, err);
}

Status Writer::field(const char * bytes, size_t len, Error * err) {
  Status status = check_open(true, err);
  if (status != GDSV_OK) {
    return status;
  }
  if (!bytes && len > 0) {
    return fail(GDSV_E_INVALID, "Field data is NULL", err);
  }
  const Quoting quoting = opts_.dialect.quoting;
  return put(bytes, len,
      quoting == GDSV_QUOTE_ALL || quoting == GDSV_QUOTE_NONNUMERIC, err);
}

Status Writer::record_end(Error * err) {
  Status status = check_open(true, err);
  if (status != GDSV_OK) {
    return status;
  }

  std::string tail;
  if (pending_empty_field_ && field_count_ == 1) {
    // A record of one empty field must be quoted to stay distinguishable
    // from a blank line
    if (opts_.dialect.quoting == GDSV_QUOTE_NONE) {
      return fail(GDSV_E_NEED_ESCAPE,
          "Single empty field record must be quoted", err);
    }
    tail.push_back(opts_.dialect.quote);
    tail.push_back(opts_.dialect.quote);
  }
  tail.append(newline_);

  status = emit(tail.data(), tail.size(), err);
  if (status != GDSV_OK) {
    return status;
  }
  state_ = GDSV_WRITER_STATE_INITIAL;
  pending_empty_field_ = false;
  field_count_ = 0;
  ++record_count_;
  return GDSV_OK;
}

Status Writer::write_row(const Row & row, Error * err) {
  Status status = check_open(false, err);
  if (status != GDSV_OK) {
    return status;
  }

  std::string line;
  for (size_t i = 0; i < row.size(); ++i) {
    field_count_ = i;
    if (i > 0) {
      line.push_back(opts_.dialect.delimiter);
    }
    status = encode_value(row[i], &line, err);
    if (status != GDSV_OK) {
      field_count_ = 0;
      return status;
    }
  }
  field_count_ = 0;

  if (row.size() == 1 && line.empty()) {
    if (opts_.dialect.quoting == GDSV_QUOTE_NONE) {
      return fail(GDSV_E_NEED_ESCAPE,
          "Single empty field record must be quoted", err);
    }
    line.push_back(opts_.dialect.quote);
    line.push_back(opts_.dialect.quote);
  }
  line.append(newline_);

  status = emit(line.data(), line.size(), err);
  if (status != GDSV_OK) {
    return status;
  }
  ++record_count_;
  return GDSV_OK;
}

Status Writer::write_rows(const std::vector<Row> & rows, Error * err) {
  for (size_t i = 0; i < rows.size(); ++i) {
    Status status = write_row(rows[i], err);
    if (status != GDSV_OK) {
      if (err) {
        err->row_index = i;
      }
      return status;
    }
  }
  return GDSV_OK;
}

Status Writer::finish(Error * err) {
  if (config_status_ != GDSV_OK) {
    return fail(config_status_, "Invalid writer configuration", err);
  }
  if (state_ == GDSV_WRITER_STATE_FINISHED) {
    return GDSV_OK;
  }

  Status status = GDSV_OK;
  if (state_ == GDSV_WRITER_STATE_IN_RECORD) {
    status = record_end(err);
  }
  // The sink is flushed even when closing the record failed
  state_ = GDSV_WRITER_STATE_FINISHED;
  if (sink_.flush) {
    Status flushed = sink_.flush(sink_.user);
    if (flushed != GDSV_OK && status == GDSV_OK) {
      status = fail(GDSV_E_WRITE, "Flushing the sink failed", err);
    }
  }
  return status;
}

} // namespace gdsv
