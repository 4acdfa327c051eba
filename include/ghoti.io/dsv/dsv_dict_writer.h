/**
 * @file dsv_dict_writer.h
 * @brief Header-mapped writer API
 *
 * Writes name/value rows in the order of a column list fixed at
 * construction, independent of the order in which a row lists its values.
 */

#ifndef GHOTI_IO_DSV_DICT_WRITER_H
#define GHOTI_IO_DSV_DICT_WRITER_H

#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_record.h>
#include <ghoti.io/dsv/dsv_value.h>
#include <ghoti.io/dsv/dsv_writer.h>
#include <ghoti.io/dsv/macros.h>
#include <string>
#include <utility>
#include <vector>

namespace gdsv {

/**
 * @brief A named row for writing: name/value pairs in any order
 *
 * If a name appears more than once, the last pair wins.
 */
typedef std::vector<std::pair<std::string, Value>> Named_Row;

/**
 * @brief Handling of keys that are not in the column list
 */
enum Extras_Action {
  GDSV_EXTRAS_IGNORE, ///< Silently drop extra keys (default)
  GDSV_EXTRAS_ERROR   ///< Fail the row with GDSV_E_EXTRA_FIELD
};

/**
 * @brief Handling of columns the row does not provide
 */
enum Missing_Action {
  GDSV_MISSING_ERROR, ///< Fail the row with GDSV_E_MISSING_FIELD (default)
  GDSV_MISSING_FILL   ///< Write the configured rest value instead
};

/**
 * @brief Named writer options
 */
struct Dict_Write_Options {
  Write_Options write;           ///< Options for the underlying writer
  Extras_Action extras_action;   ///< Extra key handling
  Missing_Action missing_action; ///< Missing column handling
  Value rest_value;              ///< Value written for missing columns (GDSV_MISSING_FILL)
};

/**
 * @brief Initialize named writer options with defaults
 *
 * Returns options with:
 * - Default write options
 * - Extra keys ignored
 * - Missing columns are an error
 * - Empty text rest value
 *
 * @return Initialized options structure
 */
GDSV_API Dict_Write_Options dict_write_options_default();

/**
 * @brief Header-mapped writer
 *
 * Each row is validated against the column list before any of its bytes
 * are written, so a rejected row leaves no partial record behind.
 */
class GDSV_API Dict_Writer {
public:
  /**
   * @brief Create a named writer
   *
   * @param sink Output sink (copied; its user context must outlive the writer)
   * @param fieldnames Column names in output order; a repeated name writes
   *        the same value in each of its positions
   * @param opts Options (can be NULL for defaults, copied internally)
   */
  Dict_Writer(const Sink & sink, std::vector<std::string> fieldnames,
      const Dict_Write_Options * opts);

  Dict_Writer(const Dict_Writer &) = delete;
  Dict_Writer & operator=(const Dict_Writer &) = delete;

  /**
   * @brief Write the column names as a record
   *
   * Names are text, so they are quoted under GDSV_QUOTE_NONNUMERIC.
   * The header is only written when this is called.
   *
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status write_header(Error * err = nullptr);

  /**
   * @brief Write a named row
   *
   * @param row Name/value pairs
   * @param err Error output structure (can be NULL); `col_index` names the
   *        missing column on GDSV_E_MISSING_FIELD
   * @return GDSV_OK on success, or error code
   */
  Status write_row(const Named_Row & row, Error * err = nullptr);

  /**
   * @brief Write a record read by a Dict_Reader
   *
   * Columns are matched by name; the record's overflow is not written.
   *
   * @param record Record to write
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status write_row(const Record & record, Error * err = nullptr);

  /**
   * @brief Write named rows in order
   *
   * @param rows Rows to write
   * @param err Error output structure (can be NULL); `row_index` names the failing row
   * @return GDSV_OK on success, or the first error
   */
  Status write_rows(const std::vector<Named_Row> & rows, Error * err = nullptr);

  /**
   * @brief Finish writing and flush the sink
   */
  Status finish(Error * err = nullptr);

  const std::vector<std::string> & fieldnames() const { return fieldnames_; }

private:
  Status to_positional(const Named_Row & row, Row & out, Error * err) const;

  std::vector<std::string> fieldnames_;
  Header columns_;
  Dict_Write_Options opts_;
  Writer writer_;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_DICT_WRITER_H */
