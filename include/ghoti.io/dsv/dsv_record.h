/**
 * @file dsv_record.h
 * @brief Header-mapped records
 *
 * A header is an ordered list of column names with a name lookup. A record
 * pairs a header with one value per column, plus any surplus values that
 * had no column.
 */

#ifndef GHOTI_IO_DSV_RECORD_H
#define GHOTI_IO_DSV_RECORD_H

#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_value.h>
#include <ghoti.io/dsv/macros.h>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace gdsv {

/**
 * @brief Ordered column names with name lookup
 */
class GDSV_API Header {
public:
  Header() = default;

  /**
   * @brief Build a header from column names
   *
   * @param names Column names in column order
   * @param dup_mode How a repeated name resolves in lookups
   * @param out Output parameter for the header (must not be NULL)
   * @return GDSV_OK on success, GDSV_E_DUPLICATE_COLUMN if a name repeats
   *         under GDSV_DUPCOL_ERROR
   */
  static Status build(
      std::vector<std::string> names, Dupcol_Mode dup_mode, Header * out);

  /**
   * @brief Number of columns
   */
  size_t size() const { return names_.size(); }

  /**
   * @brief Column names in order
   */
  const std::vector<std::string> & names() const { return names_; }

  /**
   * @brief Get column index by name
   *
   * @param name Column name to look up
   * @param out_idx Output parameter for column index (can be NULL)
   * @return GDSV_OK on success, GDSV_E_INVALID if the column is not found
   */
  Status index(const std::string & name, size_t * out_idx) const;

private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, size_t> index_;
};

/**
 * @brief A named row
 *
 * `values()` always has one entry per header column; columns the input
 * row did not reach hold the reader's rest value (absent by default).
 * Fields beyond the last column are kept in `overflow()`.
 */
class GDSV_API Record {
public:
  Record() = default;
  Record(std::shared_ptr<const Header> header, Row values, Row overflow,
      size_t line);

  const Header & header() const;
  const Row & values() const { return values_; }
  const Row & overflow() const { return overflow_; }

  /**
   * @brief Physical line on which the record ended (1-based)
   */
  size_t line() const { return line_; }

  /**
   * @brief Look up a value by column name
   *
   * @param name Column name
   * @return Pointer to the value, or NULL if the header has no such column
   */
  const Value * find(const std::string & name) const;

  /**
   * @brief Look up a value by column name
   *
   * @return The value, or an absent value if the header has no such column
   */
  const Value & get(const std::string & name) const;

  /**
   * @brief Name/value pairs in column order, overflow excluded
   */
  std::vector<std::pair<std::string, Value>> items() const;

private:
  std::shared_ptr<const Header> header_;
  Row values_;
  Row overflow_;
  size_t line_ = 0;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_RECORD_H */
