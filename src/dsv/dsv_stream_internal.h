/**
 * @file dsv_stream_internal.h
 * @brief Internal definitions for the DSV streaming tokenizer
 *
 * This header contains internal-only definitions used by the streaming
 * tokenizer implementation. It should not be included by external code.
 */

#ifndef GHOTI_IO_DSV_STREAM_INTERNAL_H
#define GHOTI_IO_DSV_STREAM_INTERNAL_H

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_core.h>
#include <ghoti.io/dsv/dsv_stream.h>
#include <cstddef>
#include <string>

namespace gdsv {

/**
 * @brief Tokenizer state enumeration
 *
 * Represents the current state of the tokenizer state machine.
 * The tokenizer transitions between these states as it processes input.
 */
enum dsv_stream_state {
  DSV_STREAM_STATE_START_OF_RECORD,    ///< At the beginning of a new record
  DSV_STREAM_STATE_START_OF_FIELD,     ///< At the beginning of a new field
  DSV_STREAM_STATE_UNQUOTED_FIELD,     ///< Processing an unquoted field
  DSV_STREAM_STATE_ESCAPE_IN_UNQUOTED, ///< Escape character seen in an unquoted field
  DSV_STREAM_STATE_QUOTED_FIELD,       ///< Processing a quoted field
  DSV_STREAM_STATE_ESCAPE_IN_QUOTED,   ///< Escape character seen in a quoted field
  DSV_STREAM_STATE_QUOTE_IN_QUOTED,    ///< Quote character seen inside a quoted field
  DSV_STREAM_STATE_END                 ///< Tokenizing has ended (error or completion)
};

/**
 * @brief Tokenizer state (internal)
 *
 * Contains all state needed for incremental tokenizing: the state machine
 * state, the field accumulation buffer, position tracking, and limits.
 */
struct Stream::State {
  // Configuration
  Parse_Options opts;      ///< Parse options and dialect configuration
  Event_Callback callback; ///< Event callback function
  void * user_data;        ///< User context passed to callback

  // State machine
  dsv_stream_state state; ///< Current tokenizer state
  bool in_record;         ///< Whether currently processing a record
  size_t field_count;     ///< Number of fields emitted in current record
  size_t row_count;       ///< Number of records completed

  // Field accumulation
  std::string field;   ///< Unescaped bytes of the current field
  bool field_is_quoted; ///< Whether the current field began with a quote
  std::string record;  ///< Raw bytes of the current record (for error snippets)

  // Position tracking
  dsv_position pos;  ///< Position of the next byte (line, column, offset)
  size_t lines;      ///< Physical lines consumed (CR, LF, CRLF each count once)
  bool last_was_cr;  ///< Whether the previous byte was CR

  // Limits
  size_t max_field_bytes; ///< Maximum field size in bytes
  size_t max_cols;        ///< Maximum number of fields per record

  // Error state
  Status status; ///< Sticky status (GDSV_OK until an error occurs)
  Error error;   ///< Error details for the sticky status
};

/**
 * @brief Initialize tokenizer state
 *
 * @param st State to initialize (must not be NULL)
 * @param opts Parse options (can be NULL for defaults)
 * @param callback Event callback function
 * @param user_data User context passed to callback
 */
void dsv_stream_state_init(Stream::State * st, const Parse_Options * opts,
    Event_Callback callback, void * user_data);

/**
 * @brief Process one byte in the current state
 *
 * Dispatches to the state handler. A handler may ask for the byte to be
 * processed again in the new state (used when a record begins).
 *
 * @param st Tokenizer state (must not be NULL)
 * @param c Byte to process
 * @return GDSV_OK on success, or error code
 */
Status dsv_stream_process_byte(Stream::State * st, char c);

/**
 * @brief Emit the current field
 *
 * Checks the column limit, emits a FIELD event, and clears the field.
 *
 * @param st Tokenizer state (must not be NULL)
 * @return GDSV_OK on success, or error code
 */
Status dsv_stream_emit_field(Stream::State * st);

/**
 * @brief Emit RECORD_BEGIN and enter the record
 *
 * @param st Tokenizer state (must not be NULL)
 * @return GDSV_OK on success, or error code
 */
Status dsv_stream_begin_record(Stream::State * st);

/**
 * @brief Emit RECORD_END and return to START_OF_RECORD
 *
 * @param st Tokenizer state (must not be NULL)
 * @return GDSV_OK on success, or error code
 */
Status dsv_stream_end_record(Stream::State * st);

/**
 * @brief Append a byte to the current field
 *
 * @param st Tokenizer state (must not be NULL)
 * @param c Byte to append
 * @return GDSV_OK on success, GDSV_E_LIMIT if the field exceeds the limit
 */
Status dsv_stream_append(Stream::State * st, char c);

/**
 * @brief Record a tokenizer error
 *
 * Fills the sticky error with position, indices and (if enabled) a snippet
 * of the current record, then moves to the END state.
 *
 * @param st Tokenizer state (must not be NULL)
 * @param code Error code
 * @param message Static error message
 * @return `code`
 */
Status dsv_stream_fail(Stream::State * st, Status code, const char * message);

} // namespace gdsv

#endif /* GHOTI_IO_DSV_STREAM_INTERNAL_H */
