/**
 * @file dsv_stream.h
 * @brief Streaming DSV tokenizer API
 *
 * Provides an event-based streaming tokenizer for processing delimited data
 * incrementally. Input may be fed in chunks of any size; fields and records
 * may span chunk boundaries.
 */

#ifndef GHOTI_IO_DSV_STREAM_H
#define GHOTI_IO_DSV_STREAM_H

#include <ghoti.io/dsv/macros.h>
#include <ghoti.io/dsv/dsv_core.h>
#include <cstddef>
#include <memory>

namespace gdsv {

/**
 * @brief DSV event types
 */
enum Event_Type {
  GDSV_EVENT_RECORD_BEGIN, ///< Start of a new record
  GDSV_EVENT_FIELD,        ///< A field value (data provided)
  GDSV_EVENT_RECORD_END,   ///< End of current record
  GDSV_EVENT_END           ///< End of input (parsing complete)
};

/**
 * @brief DSV event structure
 *
 * Contains event type and associated data for streaming tokenizer events.
 * Field data is only valid for the duration of the callback.
 */
struct Event {
  Event_Type type;     ///< Event type
  const char * data;   ///< Field data (for FIELD events, NULL otherwise)
  size_t data_len;     ///< Field data length (for FIELD events, 0 otherwise)
  bool is_quoted;      ///< Whether the field began with a quote (FIELD events)
  size_t row_index;    ///< Record index (0-based, for FIELD/RECORD events)
  size_t col_index;    ///< Column index (0-based, for FIELD events)
  size_t line;         ///< Physical lines consumed (RECORD_END and END events)
};

/**
 * @brief Event callback function type
 *
 * Called by the tokenizer for each event.
 *
 * @param event Event data
 * @param user_data User-provided context
 * @return GDSV_OK to continue, or error code to stop parsing
 */
typedef Status (*Event_Callback)(const Event * event, void * user_data);

/**
 * @brief Streaming tokenizer
 *
 * The tokenizer is a state machine over bytes. It applies the dialect's
 * quoting, escaping, and line ending rules and reports fields as events.
 * It performs no field typing.
 *
 * Errors are sticky: once feed() or finish() fails, every later call
 * returns the same status.
 */
class GDSV_API Stream {
public:
  /**
   * @brief Create a new streaming tokenizer
   *
   * @param opts Parse options (can be NULL for defaults, copied internally)
   * @param callback Event callback function (must not be NULL)
   * @param user_data User context passed to callback
   */
  Stream(const Parse_Options * opts, Event_Callback callback, void * user_data);
  ~Stream();

  Stream(const Stream &) = delete;
  Stream & operator=(const Stream &) = delete;

  /**
   * @brief Feed data to the tokenizer
   *
   * Processes the provided data incrementally and emits events via the
   * callback. Can be called multiple times with different chunks of data.
   *
   * @param data Input data chunk
   * @param len Length of input data
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status feed(const void * data, size_t len, Error * err);

  /**
   * @brief Finish parsing and emit final events
   *
   * Should be called after all data has been fed. Completes a record that
   * lacks a final newline, then emits the END event.
   *
   * @param err Error output structure (can be NULL)
   * @return GDSV_OK on success, or error code
   */
  Status finish(Error * err);

  /**
   * @brief Number of physical lines consumed so far
   */
  size_t lines() const;

  /**
   * @brief Internal tokenizer state (defined in dsv_stream_internal.h)
   */
  struct State;

private:
  std::unique_ptr<State> state_;
};

} // namespace gdsv

#endif /* GHOTI_IO_DSV_STREAM_H */
