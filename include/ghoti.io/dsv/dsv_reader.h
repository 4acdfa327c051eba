/**
 * @file
 *
 * DSV reader infrastructure and source abstraction.
 *
 * This header provides the source abstraction for reading delimited input
 * from various origins (strings, files, callbacks) and the positional
 * reader, which turns input into typed rows one at a time.
 *
 * Copyright 2026 by Corey Pennycuff
 */

#ifndef GHOTI_IO_DSV_READER_H
#define GHOTI_IO_DSV_READER_H

#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_stream.h>
#include <ghoti.io/dsv/dsv_value.h>
#include <ghoti.io/dsv/macros.h>
#include <cstddef>
#include <cstdio>
#include <deque>
#include <string>
#include <vector>

namespace gdsv {

/**
 * @brief Read callback function type
 *
 * This callback is invoked by the reader to pull input bytes. It should
 * copy at most `len` bytes into `buffer`, store the number of bytes copied
 * in `*read_len`, and return GDSV_OK. A successful read of zero bytes
 * signals end of input.
 *
 * @param user User-provided context pointer
 * @param buffer Destination buffer
 * @param len Capacity of the destination buffer
 * @param read_len Output parameter: number of bytes copied
 * @return GDSV_OK on success, GDSV_E_READ on failure
 */
typedef Status (*Read_Function)(
    void * user, char * buffer, size_t len, size_t * read_len);

/**
 * @brief DSV input source structure
 *
 * A source encapsulates a read callback and user context.
 */
struct Source {
  Read_Function read; ///< Read callback function
  void * user;        ///< User context pointer passed to callback
};

/**
 * @brief In-memory source over a string
 *
 * The string is copied; the source is independent of the argument's
 * lifetime.
 */
class GDSV_API String_Source {
public:
  explicit String_Source(std::string text);

  /**
   * @brief Get the source structure for this object
   *
   * The returned source references this object and is valid for its lifetime.
   */
  Source source();

  String_Source(const String_Source &) = delete;
  String_Source & operator=(const String_Source &) = delete;

private:
  static Status read(void * user, char * buffer, size_t len, size_t * read_len);

  std::string text_;
  size_t offset_ = 0;
};

/**
 * @brief File source owning a FILE handle
 *
 * The file is opened in binary mode by the constructor and closed by the
 * destructor on every path.
 */
class GDSV_API File_Source {
public:
  explicit File_Source(const char * path);
  ~File_Source();

  File_Source(const File_Source &) = delete;
  File_Source & operator=(const File_Source &) = delete;

  /**
   * @brief Whether the file was opened successfully
   */
  bool is_open() const { return file_ != nullptr; }

  /**
   * @brief Get the source structure for this object
   *
   * Reading from a source whose file failed to open returns GDSV_E_READ.
   */
  Source source();

private:
  static Status read(void * user, char * buffer, size_t len, size_t * read_len);

  FILE * file_;
};

/**
 * @brief Positional reader
 *
 * Pulls bytes from a source, tokenizes them, and yields one row per record.
 * Under GDSV_QUOTE_NONNUMERIC unquoted fields become numbers and quoted
 * fields stay text; under every other policy all fields are text.
 *
 * The reader is lazy, forward-only and cannot be restarted.
 */
class GDSV_API Reader {
public:
  /**
   * @brief Create a reader
   *
   * @param source Input source (copied; its user context must outlive the reader)
   * @param opts Parse options (can be NULL for defaults, copied internally)
   */
  Reader(const Source & source, const Parse_Options * opts);

  Reader(const Reader &) = delete;
  Reader & operator=(const Reader &) = delete;

  /**
   * @brief Read the next row
   *
   * A blank line yields an empty row. A number conversion failure is
   * reported for its row only; the following call continues with the next
   * row. Tokenizer and source errors end the input.
   *
   * @param row Output row (replaced, not appended to)
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK with a row, GDSV_END at end of input, or error code
   */
  Status read_row(Row & row, Error * err);

  /**
   * @brief Read every remaining row
   *
   * Stops at the first error; rows read before it are kept in `rows`.
   *
   * @param rows Output rows (appended to)
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK when input is exhausted, or the first error
   */
  Status read_all(std::vector<Row> & rows, Error * err);

  /**
   * @brief Physical lines consumed by the rows returned so far (1-based)
   */
  size_t line_num() const { return line_num_; }

  /**
   * @brief Parse options in effect
   */
  const Parse_Options & options() const { return opts_; }

private:
  struct Pending {
    Status status;
    Error error;
    Row row;
    size_t line;
  };

  static Status on_event(const Event * event, void * user_data);
  Status pull(Error * err);

  Source source_;
  Parse_Options opts_;
  Status config_status_;
  Stream stream_;

  std::deque<Pending> pending_;
  Row current_row_;
  Status current_status_ = GDSV_OK;
  Error current_error_;

  Status terminal_status_ = GDSV_OK;
  Error terminal_error_;
  bool eof_ = false;
  size_t line_num_ = 0;
  std::vector<char> chunk_;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_READER_H */
