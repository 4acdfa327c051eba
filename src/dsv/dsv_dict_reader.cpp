/**
 * @file dsv_dict_reader.cpp
 * @brief Header-mapped reader
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_dict_reader.h>

#include <utility>

namespace gdsv {

Dict_Read_Options dict_read_options_default() {
  Dict_Read_Options opts;
  opts.parse = parse_options_default();
  opts.fieldnames.clear();
  opts.rest_key.clear();
  opts.rest_value = Value();
  opts.header_dup_mode = GDSV_DUPCOL_LAST_WINS;
  return opts;
}

static Dict_Read_Options dsv_dict_reader_options(const Dict_Read_Options * opts) {
  return opts ? *opts : dict_read_options_default();
}

Dict_Reader::Dict_Reader(const Source & source, const Dict_Read_Options * opts)
    : opts_(dsv_dict_reader_options(opts)), reader_(source, &opts_.parse) {
  if (!opts_.fieldnames.empty()) {
    // Explicit column names: the first row of input is data
    std::shared_ptr<Header> header = std::make_shared<Header>();
    header_status_ =
        Header::build(opts_.fieldnames, opts_.header_dup_mode, header.get());
    if (header_status_ == GDSV_OK) {
      header_ = std::move(header);
    }
    else {
      dsv_set_error(&header_error_, header_status_, "Duplicate column name");
    }
  }
}

Status Dict_Reader::load_header(Error * err) {
  if (header_) {
    return GDSV_OK;
  }
  if (header_status_ != GDSV_OK) {
    if (err && header_status_ != GDSV_END) {
      *err = header_error_;
    }
    return header_status_;
  }

  Row row;
  Status status = reader_.read_row(row, &header_error_);
  if (status != GDSV_OK) {
    header_status_ = status;
    if (err && status != GDSV_END) {
      *err = header_error_;
    }
    return status;
  }

  std::vector<std::string> names;
  names.reserve(row.size());
  for (const Value & value : row) {
    names.push_back(value.to_string());
  }

  std::shared_ptr<Header> header = std::make_shared<Header>();
  status = Header::build(std::move(names), opts_.header_dup_mode, header.get());
  if (status != GDSV_OK) {
    header_status_ = status;
    dsv_set_error(&header_error_, status, "Duplicate column name");
    header_error_.line = static_cast<int>(reader_.line_num());
    if (err) {
      *err = header_error_;
    }
    return status;
  }

  header_ = std::move(header);
  return GDSV_OK;
}

const Header * Dict_Reader::fieldnames(Error * err) {
  return load_header(err) == GDSV_OK ? header_.get() : nullptr;
}

Status Dict_Reader::read_record(Record & record, Error * err) {
  Status status = load_header(err);
  if (status != GDSV_OK) {
    return status;
  }

  Row row;
  for (;;) {
    status = reader_.read_row(row, err);
    if (status != GDSV_OK) {
      return status;
    }
    if (!row.empty()) {
      break;
    }
  }

  const size_t columns = header_->size();
  Row values;
  Row overflow;
  values.reserve(columns);
  for (size_t i = 0; i < row.size(); ++i) {
    if (i < columns) {
      values.push_back(std::move(row[i]));
    }
    else {
      overflow.push_back(std::move(row[i]));
    }
  }
  while (values.size() < columns) {
    values.push_back(opts_.rest_value);
  }

  record = Record(header_, std::move(values), std::move(overflow),
      reader_.line_num());
  return GDSV_OK;
}

} // namespace gdsv
