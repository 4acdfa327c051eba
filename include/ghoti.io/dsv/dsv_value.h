/**
 * @file dsv_value.h
 * @brief Typed field values
 *
 * A field is either text, a number, or absent. The type is decided by the
 * reader from the quoting policy and the presence of quotes, and it decides
 * how the writer quotes the field.
 */

#ifndef GHOTI_IO_DSV_VALUE_H
#define GHOTI_IO_DSV_VALUE_H

#include <ghoti.io/dsv/macros.h>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

namespace gdsv {

/**
 * @brief Field value kinds
 */
enum Value_Kind {
  GDSV_VALUE_ABSENT, ///< No value (missing trailing column)
  GDSV_VALUE_TEXT,   ///< Text value
  GDSV_VALUE_NUMBER  ///< Numeric value
};

/**
 * @brief A single typed field value
 *
 * Text values own their bytes. Numbers built from an integer type keep the
 * exact integer as well as its double; they are written as bare decimal
 * digits at any magnitude. Floating-point numbers are stored as double.
 */
class GDSV_API Value {
public:
  /**
   * @brief Construct an absent value
   */
  Value() = default;

  Value(const char * text) : kind_(GDSV_VALUE_TEXT), text_(text ? text : "") {}
  Value(const char * text, size_t len) : kind_(GDSV_VALUE_TEXT), text_(text, len) {}
  Value(std::string text) : kind_(GDSV_VALUE_TEXT), text_(std::move(text)) {}

  /**
   * @brief Construct a numeric value from any arithmetic type except bool and char
   */
  template <typename T,
      typename = typename std::enable_if<std::is_arithmetic<T>::value &&
          !std::is_same<T, bool>::value && !std::is_same<T, char>::value>::type>
  Value(T number)
      : kind_(GDSV_VALUE_NUMBER), number_(static_cast<double>(number)) {
    set_integer(number, std::is_integral<T>());
  }

  static Value absent() { return Value(); }
  static Value text(std::string text) { return Value(std::move(text)); }
  static Value number(double number) { return Value(number); }

  Value_Kind kind() const { return kind_; }
  bool is_absent() const { return kind_ == GDSV_VALUE_ABSENT; }
  bool is_text() const { return kind_ == GDSV_VALUE_TEXT; }
  bool is_number() const { return kind_ == GDSV_VALUE_NUMBER; }

  /**
   * @brief Text of a TEXT value
   *
   * @return The text, or an empty string for non-text values
   */
  const std::string & as_text() const { return text_; }

  /**
   * @brief Number of a NUMBER value
   *
   * @return The number, or 0 for non-numeric values
   */
  double as_number() const { return number_; }

  /**
   * @brief Whether a NUMBER value holds an exact integer
   */
  bool is_integer() const { return integral_; }

  /**
   * @brief Exact integer of a NUMBER value built from an integer type
   *
   * @return The integer, or the double truncated toward zero otherwise
   */
  long long as_integer() const {
    return integral_ ? integer_ : static_cast<long long>(number_);
  }

  /**
   * @brief Render the value as it appears inside a field
   *
   * Text is returned verbatim, numbers in their shortest decimal form,
   * absent values as an empty string.
   *
   * @return Field text (unquoted, unescaped)
   */
  std::string to_string() const;

  /**
   * @brief Compare kind and content
   *
   * Numbers compare by numeric value, so 30 read back as 30.0 is equal.
   */
  bool operator==(const Value & other) const;
  bool operator!=(const Value & other) const { return !(*this == other); }

private:
  template <typename T>
  void set_integer(T number, std::true_type) {
    // Unsigned values past the signed range keep only the double
    if (std::is_unsigned<T>::value &&
        static_cast<unsigned long long>(number) >
            static_cast<unsigned long long>(
                std::numeric_limits<long long>::max())) {
      return;
    }
    integral_ = true;
    integer_ = static_cast<long long>(number);
  }

  template <typename T>
  void set_integer(T, std::false_type) {}

  Value_Kind kind_ = GDSV_VALUE_ABSENT;
  std::string text_;
  double number_ = 0.0;
  long long integer_ = 0;
  bool integral_ = false;
};

/**
 * @brief A positional row: one value per field, in input order
 */
typedef std::vector<Value> Row;

} // namespace gdsv

#endif /* GHOTI_IO_DSV_VALUE_H */
