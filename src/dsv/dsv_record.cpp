/**
 * @file dsv_record.cpp
 * @brief Header name lookup and named records
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include <ghoti.io/dsv/dsv_record.h>

#include <utility>

namespace gdsv {

Status Header::build(
    std::vector<std::string> names, Dupcol_Mode dup_mode, Header * out) {
  if (!out) {
    return GDSV_E_INVALID;
  }

  Header header;
  header.names_ = std::move(names);
  header.index_.reserve(header.names_.size());
  for (size_t i = 0; i < header.names_.size(); ++i) {
    auto inserted = header.index_.emplace(header.names_[i], i);
    if (inserted.second) {
      continue;
    }
    switch (dup_mode) {
    case GDSV_DUPCOL_LAST_WINS:
      inserted.first->second = i;
      break;
    case GDSV_DUPCOL_FIRST_WINS:
      break;
    case GDSV_DUPCOL_ERROR:
      return GDSV_E_DUPLICATE_COLUMN;
    }
  }

  *out = std::move(header);
  return GDSV_OK;
}

Status Header::index(const std::string & name, size_t * out_idx) const {
  auto it = index_.find(name);
  if (it == index_.end()) {
    return GDSV_E_INVALID;
  }
  if (out_idx) {
    *out_idx = it->second;
  }
  return GDSV_OK;
}

Record::Record(std::shared_ptr<const Header> header, Row values, Row overflow,
    size_t line)
    : header_(std::move(header)),
      values_(std::move(values)),
      overflow_(std::move(overflow)),
      line_(line) {}

const Header & Record::header() const {
  static const Header empty;
  return header_ ? *header_ : empty;
}

const Value * Record::find(const std::string & name) const {
  size_t idx = 0;
  if (!header_ || header_->index(name, &idx) != GDSV_OK ||
      idx >= values_.size()) {
    return nullptr;
  }
  return &values_[idx];
}

const Value & Record::get(const std::string & name) const {
  static const Value absent;
  const Value * value = find(name);
  return value ? *value : absent;
}

std::vector<std::pair<std::string, Value>> Record::items() const {
  std::vector<std::pair<std::string, Value>> items;
  if (!header_) {
    return items;
  }
  const std::vector<std::string> & names = header_->names();
  items.reserve(names.size());
  for (size_t i = 0; i < names.size() && i < values_.size(); ++i) {
    items.emplace_back(names[i], values_[i]);
  }
  return items;
}

} // namespace gdsv
