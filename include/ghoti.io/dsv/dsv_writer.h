/**
 * @file
 *
 * DSV writer infrastructure and sink abstraction.
 *
 * This header provides the sink abstraction for writing output to various
 * destinations (buffers, files, callbacks, etc.) and helper classes for
 * common sink types. It also provides the streaming writer API for
 * incremental construction with structural enforcement.
 *
 * Copyright 2026 by Corey Pennycuff
 */

#ifndef GHOTI_IO_DSV_WRITER_H
#define GHOTI_IO_DSV_WRITER_H

#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_value.h>
#include <ghoti.io/dsv/macros.h>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace gdsv {

/**
 * @brief Write callback function type
 *
 * This callback is invoked by the writer to output data chunks.
 * The callback should write the provided bytes to the destination and
 * return GDSV_OK on success, or an error code on failure.
 *
 * @param user User-provided context pointer
 * @param bytes Pointer to the data to write
 * @param len Number of bytes to write
 * @return GDSV_OK on success, error code on failure
 */
typedef Status (*Write_Function)(void * user, const char * bytes, size_t len);

/**
 * @brief Flush callback function type
 *
 * @param user User-provided context pointer
 * @return GDSV_OK on success, error code on failure
 */
typedef Status (*Flush_Function)(void * user);

/**
 * @brief DSV output sink structure
 *
 * A sink encapsulates a write callback, an optional flush callback and
 * user context for outputting data.
 */
struct Sink {
  Write_Function write; ///< Write callback function
  Flush_Function flush; ///< Flush callback function (can be NULL)
  void * user;          ///< User context pointer passed to callbacks
};

/**
 * @brief Growable buffer sink
 *
 * Writes to a dynamically-growing buffer owned by this object.
 */
class GDSV_API Buffer_Sink {
public:
  Buffer_Sink() = default;

  Buffer_Sink(const Buffer_Sink &) = delete;
  Buffer_Sink & operator=(const Buffer_Sink &) = delete;

  /**
   * @brief Get the sink structure for this buffer
   *
   * The returned sink references this object and is valid for its lifetime.
   */
  Sink sink();

  /**
   * @brief Buffer data (may contain null bytes, see size())
   */
  const char * data() const { return buffer_.data(); }

  /**
   * @brief Number of bytes written
   */
  size_t size() const { return buffer_.size(); }

  /**
   * @brief Buffer contents as a string
   */
  const std::string & str() const { return buffer_; }

  /**
   * @brief Discard the buffer contents
   */
  void clear() { buffer_.clear(); }

private:
  static Status write(void * user, const char * bytes, size_t len);

  std::string buffer_;
};

/**
 * @brief Fixed-size buffer sink
 *
 * Writes to a buffer provided by the caller. If the output exceeds the
 * buffer size it is truncated, the truncated flag is set, and the write
 * reports GDSV_E_WRITE.
 */
class GDSV_API Fixed_Buffer_Sink {
public:
  /**
   * @param buffer Buffer to write to (must remain valid for sink lifetime)
   * @param size Maximum size of the buffer
   */
  Fixed_Buffer_Sink(char * buffer, size_t size);

  Fixed_Buffer_Sink(const Fixed_Buffer_Sink &) = delete;
  Fixed_Buffer_Sink & operator=(const Fixed_Buffer_Sink &) = delete;

  Sink sink();

  /**
   * @brief Number of bytes written to the buffer
   */
  size_t used() const { return used_; }

  /**
   * @brief true if output was truncated due to insufficient space
   */
  bool truncated() const { return truncated_; }

private:
  static Status write(void * user, const char * bytes, size_t len);

  char * data_;
  size_t size_;
  size_t used_ = 0;
  bool truncated_ = false;
};

/**
 * @brief File sink owning a FILE handle
 *
 * The file is opened in binary mode, so record terminators are written
 * exactly as configured on every platform. The destructor flushes and
 * closes the file on every path; bytes already written are never rolled
 * back.
 */
class GDSV_API File_Sink {
public:
  /**
   * @param path File path
   * @param append Append to the file instead of truncating it
   */
  explicit File_Sink(const char * path, bool append = false);
  ~File_Sink();

  File_Sink(const File_Sink &) = delete;
  File_Sink & operator=(const File_Sink &) = delete;

  bool is_open() const { return file_ != nullptr; }

  /**
   * @brief Get the sink structure for this file
   *
   * Writing to a sink whose file failed to open returns GDSV_E_WRITE.
   */
  Sink sink();

  /**
   * @brief Flush and close the file early
   *
   * @return GDSV_OK on success, GDSV_E_WRITE if flushing or closing failed
   */
  Status close();

private:
  static Status write(void * user, const char * bytes, size_t len);
  static Status flush(void * user);

  FILE * file_;
};

/**
 * @brief Writer state
 */
enum Writer_State {
  GDSV_WRITER_STATE_INITIAL,   ///< Initial state (no record open)
  GDSV_WRITER_STATE_IN_RECORD, ///< Record is open (fields can be written)
  GDSV_WRITER_STATE_FINISHED   ///< Writer has been finished (no more writes)
};

/**
 * @brief Positional streaming writer
 *
 * Writes typed fields with quoting decided by the dialect's quoting policy,
 * inserting delimiters between fields and the configured newline after
 * every record. The writer enforces structural correctness (fields only
 * within records, proper record boundaries).
 *
 * Writing several rows at once produces exactly the bytes of writing them
 * one by one. Nothing is buffered inside the writer.
 */
class GDSV_API Writer {
public:
  /**
   * @brief Create a writer
   *
   * An invalid dialect or empty newline makes every operation fail with
   * GDSV_E_INVALID.
   *
   * @param sink Output sink (copied; its user context must outlive the writer)
   * @param opts Write options (can be NULL for defaults, copied internally)
   */
  Writer(const Sink & sink, const Write_Options * opts);

  Writer(const Writer &) = delete;
  Writer & operator=(const Writer &) = delete;

  /**
   * @brief Begin a new record
   *
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, GDSV_E_STATE if a record is already open or
   *         the writer is finished
   */
  Status record_begin(Error * err = nullptr);

  /**
   * @brief Write a typed field to the current record
   *
   * @param value Field value
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, GDSV_E_STATE if no record is open,
   *         GDSV_E_NEED_ESCAPE if the field cannot be represented, or write error
   */
  Status field(const Value & value, Error * err = nullptr);

  /**
   * @brief Write a text field to the current record
   *
   * @param bytes Field data (may be NULL if len is 0)
   * @param len Field length in bytes
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status field(const char * bytes, size_t len, Error * err = nullptr);

  /**
   * @brief End the current record and write the newline
   *
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, GDSV_E_STATE if no record is open, or write error
   */
  Status record_end(Error * err = nullptr);

  /**
   * @brief Write one row as a complete record
   *
   * The whole record is encoded before it is written, so a row that fails
   * (for example with GDSV_E_NEED_ESCAPE) leaves nothing in the sink. A
   * row holding a single empty field is written as an empty quoted field.
   *
   * @param row Row values
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status write_row(const Row & row, Error * err = nullptr);

  /**
   * @brief Write rows in order
   *
   * @param rows Rows to write
   * @param err Error output structure (can be NULL); `row_index` names the failing row
   * @return GDSV_OK on success, or the first error
   */
  Status write_rows(const std::vector<Row> & rows, Error * err = nullptr);

  /**
   * @brief Finish writing
   *
   * Closes an open record and flushes the sink. After finish() the writer
   * accepts no more records.
   *
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or write error
   */
  Status finish(Error * err = nullptr);

  /**
   * @brief Number of records completed so far
   */
  size_t record_count() const { return record_count_; }

  Writer_State state() const { return state_; }

  const Write_Options & options() const { return opts_; }

private:
  Status check_open(bool need_record, Error * err);
  Status fail(Status status, const char * message, Error * err);
  Status emit(const char * bytes, size_t len, Error * err);
  Status encode(const char * bytes, size_t len, bool force_quote,
      std::string * out, Error * err);
  void value_bytes(const Value & value, std::string * scratch,
      const char ** bytes, size_t * len, bool * force_quote) const;
  Status encode_value(const Value & value, std::string * out, Error * err);
  Status put(const char * bytes, size_t len, bool force_quote, Error * err);

  Sink sink_;
  Write_Options opts_;
  std::string newline_;
  Status config_status_;
  Writer_State state_ = GDSV_WRITER_STATE_INITIAL;
  size_t field_count_ = 0;
  size_t record_count_ = 0;
  bool pending_empty_field_ = false;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_WRITER_H */
