/**
 * @file dsv_dict_reader.h
 * @brief Header-mapped reader API
 *
 * Reads rows through a positional reader and maps them onto column names
 * taken from the first row of input (or supplied up front).
 */

#ifndef GHOTI_IO_DSV_DICT_READER_H
#define GHOTI_IO_DSV_DICT_READER_H

#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_reader.h>
#include <ghoti.io/dsv/dsv_record.h>
#include <ghoti.io/dsv/dsv_value.h>
#include <ghoti.io/dsv/macros.h>
#include <memory>
#include <string>
#include <vector>

namespace gdsv {

/**
 * @brief Named reader options
 */
struct Dict_Read_Options {
  Parse_Options parse;                 ///< Options for the underlying reader
  std::vector<std::string> fieldnames; ///< Column names; empty = read from first row
  std::string rest_key;                ///< Name under which overflow fields are reported
  Value rest_value;                    ///< Value for columns a short row does not reach
  Dupcol_Mode header_dup_mode;         ///< Duplicate column name handling
};

/**
 * @brief Initialize named reader options with defaults
 *
 * Returns options with:
 * - Default parse options
 * - Column names read from the first row
 * - Empty rest key, absent rest value
 * - GDSV_DUPCOL_LAST_WINS
 *
 * @return Initialized options structure
 */
GDSV_API Dict_Read_Options dict_read_options_default();

/**
 * @brief Header-mapped reader
 *
 * Line numbers count physical lines including the header, so the first
 * data record ends on line 2. Blank lines are skipped but counted.
 */
class GDSV_API Dict_Reader {
public:
  /**
   * @brief Create a named reader
   *
   * @param source Input source (copied; its user context must outlive the reader)
   * @param opts Options (can be NULL for defaults, copied internally)
   */
  Dict_Reader(const Source & source, const Dict_Read_Options * opts);

  Dict_Reader(const Dict_Reader &) = delete;
  Dict_Reader & operator=(const Dict_Reader &) = delete;

  /**
   * @brief Column names, reading the header row if it has not been read yet
   *
   * @param err Error output structure (can be NULL)
   * @return Pointer to the header, or NULL if it could not be read
   */
  const Header * fieldnames(Error * err);

  /**
   * @brief Read the next record
   *
   * @param record Output record
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK with a record, GDSV_END at end of input, or error code
   */
  Status read_record(Record & record, Error * err);

  /**
   * @brief Physical lines consumed so far, header included (1-based)
   */
  size_t line_num() const { return reader_.line_num(); }

  /**
   * @brief Reserved name reported for overflow fields
   */
  const std::string & rest_key() const { return opts_.rest_key; }

private:
  Status load_header(Error * err);

  Dict_Read_Options opts_;
  Reader reader_;
  std::shared_ptr<Header> header_;
  Status header_status_ = GDSV_OK;
  Error header_error_;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_DICT_READER_H */
