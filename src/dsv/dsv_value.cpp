/**
 * @file dsv_value.cpp
 * @brief Typed field values and number conversion
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_value.h>

#include <charconv>
#include <cmath>
#include <system_error>

namespace gdsv {

static bool dsv_is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
      c == '\v';
}

bool dsv_parse_number(const char * data, size_t len, double * out) {
  if (!data || !out) {
    return false;
  }

  const char * first = data;
  const char * last = data + len;
  while (first < last && dsv_is_space(*first)) {
    ++first;
  }
  while (last > first && dsv_is_space(*(last - 1))) {
    --last;
  }
  if (first == last) {
    return false;
  }

  // from_chars accepts '-' but not '+'
  bool negate = false;
  if (*first == '+' || *first == '-') {
    negate = (*first == '-');
    ++first;
    if (first == last || *first == '+' || *first == '-') {
      return false;
    }
  }

  double value = 0.0;
  std::from_chars_result result =
      std::from_chars(first, last, value, std::chars_format::general);
  if (result.ec == std::errc::invalid_argument || result.ptr != last) {
    return false;
  }
  // Out-of-range literals saturate to infinity or zero, as strtod does
  if (result.ec == std::errc::result_out_of_range) {
    bool tiny = false;
    for (const char * p = first; p < last; ++p) {
      if (*p == 'e' || *p == 'E') {
        tiny = (p + 1 < last && *(p + 1) == '-');
        break;
      }
    }
    value = tiny ? 0.0 : HUGE_VAL;
  }

  *out = negate ? -value : value;
  return true;
}

std::string dsv_format_number(double number) {
  if (std::isfinite(number) && std::fabs(number) <= DSV_MAX_EXACT_INTEGER &&
      number == std::trunc(number)) {
    return std::to_string(static_cast<long long>(number));
  }

  char buffer[64];
  std::to_chars_result result =
      std::to_chars(buffer, buffer + sizeof(buffer), number);
  return std::string(buffer, result.ptr);
}

std::string dsv_format_integer(long long number) {
  char buffer[32];
  std::to_chars_result result =
      std::to_chars(buffer, buffer + sizeof(buffer), number);
  return std::string(buffer, result.ptr);
}

std::string Value::to_string() const {
  switch (kind_) {
  case GDSV_VALUE_TEXT:
    return text_;
  case GDSV_VALUE_NUMBER:
    return integral_ ? dsv_format_integer(integer_) : dsv_format_number(number_);
  case GDSV_VALUE_ABSENT:
    break;
  }
  return std::string();
}

bool Value::operator==(const Value & other) const {
  if (kind_ != other.kind_) {
    return false;
  }
  switch (kind_) {
  case GDSV_VALUE_TEXT:
    return text_ == other.text_;
  case GDSV_VALUE_NUMBER:
    if (integral_ && other.integral_) {
      return integer_ == other.integer_;
    }
    return number_ == other.number_;
  case GDSV_VALUE_ABSENT:
    break;
  }
  return true;
}

} // namespace gdsv
