/**
 * @file dsv_dict_writer.cpp
 * @brief Header-mapped writer
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_dict_writer.h>

#include <unordered_map>
#include <utility>

namespace gdsv {

Dict_Write_Options dict_write_options_default() {
  Dict_Write_Options opts;
  opts.write = write_options_default();
  opts.extras_action = GDSV_EXTRAS_IGNORE;
  opts.missing_action = GDSV_MISSING_ERROR;
  opts.rest_value = Value("");
  return opts;
}

static Dict_Write_Options dsv_dict_writer_options(
    const Dict_Write_Options * opts) {
  return opts ? *opts : dict_write_options_default();
}

Dict_Writer::Dict_Writer(const Sink & sink,
    std::vector<std::string> fieldnames, const Dict_Write_Options * opts)
    : fieldnames_(std::move(fieldnames)),
      opts_(dsv_dict_writer_options(opts)),
      writer_(sink, &opts_.write) {
  // Only membership is asked of the header; LAST_WINS cannot fail
  (void)Header::build(fieldnames_, GDSV_DUPCOL_LAST_WINS, &columns_);
}

Status Dict_Writer::write_header(Error * err) {
  Row row;
  row.reserve(fieldnames_.size());
  for (const std::string & name : fieldnames_) {
    row.push_back(Value(name));
  }
  return writer_.write_row(row, err);
}

Status Dict_Writer::to_positional(
    const Named_Row & row, Row & out, Error * err) const {
  // Later pairs overwrite earlier ones
  std::unordered_map<std::string, const Value *> lookup;
  lookup.reserve(row.size());
  for (size_t i = 0; i < row.size(); ++i) {
    if (opts_.extras_action == GDSV_EXTRAS_ERROR &&
        columns_.index(row[i].first, nullptr) != GDSV_OK) {
      dsv_set_error(err, GDSV_E_EXTRA_FIELD,
          "Row has a key that is not a column");
      if (err) {
        err->row_index = writer_.record_count();
        err->col_index = i;
        err->context_snippet = row[i].first;
      }
      return GDSV_E_EXTRA_FIELD;
    }
    lookup[row[i].first] = &row[i].second;
  }

  out.clear();
  out.reserve(fieldnames_.size());
  for (size_t i = 0; i < fieldnames_.size(); ++i) {
    auto it = lookup.find(fieldnames_[i]);
    if (it != lookup.end()) {
      out.push_back(*it->second);
    }
    else if (opts_.missing_action == GDSV_MISSING_FILL) {
      out.push_back(opts_.rest_value);
    }
    else {
      dsv_set_error(err, GDSV_E_MISSING_FIELD, "Row is missing a column");
      if (err) {
        err->row_index = writer_.record_count();
        err->col_index = i;
        err->context_snippet = fieldnames_[i];
      }
      return GDSV_E_MISSING_FIELD;
    }
  }
  return GDSV_OK;
}

Status Dict_Writer::write_row(const Named_Row & row, Error * err) {
  Row positional;
  Status status = to_positional(row, positional, err);
  if (status != GDSV_OK) {
    return status;
  }
  return writer_.write_row(positional, err);
}

Status Dict_Writer::write_row(const Record & record, Error * err) {
  return write_row(record.items(), err);
}

Status Dict_Writer::write_rows(const std::vector<Named_Row> & rows, Error * err) {
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

Status Dict_Writer::finish(Error * err) {
  return writer_.finish(err);
}

} // namespace gdsv
