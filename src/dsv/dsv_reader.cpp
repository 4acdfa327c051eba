/**
 * @file dsv_reader.cpp
 * @brief Positional reader: tokenizer events to typed rows
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_reader.h>

#include <utility>

namespace gdsv {

/**
 * @brief Size of each read from the source
 */
#define DSV_READ_CHUNK_SIZE 4096

static Parse_Options dsv_reader_options(const Parse_Options * opts) {
  return opts ? *opts : parse_options_default();
}

Reader::Reader(const Source & source, const Parse_Options * opts)
    : source_(source),
      opts_(dsv_reader_options(opts)),
      config_status_(dialect_validate(opts_.dialect)),
      stream_(&opts_, &Reader::on_event, this),
      chunk_(DSV_READ_CHUNK_SIZE) {
  if (config_status_ == GDSV_OK && !source_.read) {
    config_status_ = GDSV_E_INVALID;
  }
}

Status Reader::on_event(const Event * event, void * user_data) {
  Reader * self = static_cast<Reader *>(user_data);

  switch (event->type) {
  case GDSV_EVENT_RECORD_BEGIN:
    self->current_row_.clear();
    self->current_status_ = GDSV_OK;
    self->current_error_ = Error();
    break;

  case GDSV_EVENT_FIELD:
    if (self->opts_.dialect.quoting == GDSV_QUOTE_NONNUMERIC &&
        !event->is_quoted) {
      double number = 0.0;
      if (dsv_parse_number(event->data, event->data_len, &number)) {
        self->current_row_.push_back(Value(number));
        break;
      }
      if (self->current_status_ == GDSV_OK) {
        self->current_status_ = GDSV_E_NUMBER;
        dsv_set_error(&self->current_error_, GDSV_E_NUMBER,
            "Could not convert unquoted field to a number");
        self->current_error_.row_index = event->row_index;
        self->current_error_.col_index = event->col_index;
        self->current_error_.context_snippet.assign(
            event->data, event->data_len);
      }
    }
    self->current_row_.push_back(Value(event->data, event->data_len));
    break;

  case GDSV_EVENT_RECORD_END: {
    Pending pending;
    pending.status = self->current_status_;
    pending.error = std::move(self->current_error_);
    pending.row = std::move(self->current_row_);
    pending.line = event->line;
    if (pending.status != GDSV_OK) {
      pending.error.line = static_cast<int>(event->line);
      pending.error.column = 1;
    }
    self->pending_.push_back(std::move(pending));
    self->current_row_.clear();
    self->current_error_ = Error();
    self->current_status_ = GDSV_OK;
    break;
  }

  case GDSV_EVENT_END:
    self->eof_ = true;
    break;
  }
  return GDSV_OK;
}

Status Reader::pull(Error * err) {
  size_t read_len = 0;
  Status status =
      source_.read(source_.user, chunk_.data(), chunk_.size(), &read_len);
  if (status != GDSV_OK) {
    dsv_set_error(err, GDSV_E_READ, "Read from source failed");
    if (err) {
      err->line = static_cast<int>(stream_.lines() + 1);
    }
    return GDSV_E_READ;
  }
  if (read_len == 0) {
    return stream_.finish(err);
  }
  return stream_.feed(chunk_.data(), read_len, err);
}

Status Reader::read_row(Row & row, Error * err) {
  if (config_status_ != GDSV_OK) {
    dsv_set_error(err, config_status_, "Invalid reader configuration");
    return config_status_;
  }

  for (;;) {
    if (!pending_.empty()) {
      Pending pending = std::move(pending_.front());
      pending_.pop_front();
      line_num_ = pending.line;
      if (pending.status != GDSV_OK) {
        if (err) {
          *err = std::move(pending.error);
        }
        return pending.status;
      }
      row = std::move(pending.row);
      return GDSV_OK;
    }

    if (terminal_status_ != GDSV_OK) {
      if (err) {
        *err = terminal_error_;
      }
      return terminal_status_;
    }
    if (eof_) {
      return GDSV_END;
    }

    Error pull_error;
    Status status = pull(&pull_error);
    if (status != GDSV_OK) {
      // Rows completed before the failure are still delivered first
      terminal_status_ = status;
      terminal_error_ = std::move(pull_error);
    }
  }
}

Status Reader::read_all(std::vector<Row> & rows, Error * err) {
  for (;;) {
    Row row;
    Status status = read_row(row, err);
    if (status == GDSV_END) {
      return GDSV_OK;
    }
    if (status != GDSV_OK) {
      return status;
    }
    rows.push_back(std::move(row));
  }
}

} // namespace gdsv
