/**
 * @file dsv_sink.cpp
 * @brief Output sinks: growable buffer, fixed buffer, and file
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_writer.h>

#include <cstring>

namespace gdsv {

//
// Growable buffer
//

Sink Buffer_Sink::sink() {
  Sink sink;
  sink.write = &Buffer_Sink::write;
  sink.flush = nullptr;
  sink.user = this;
  return sink;
}

Status Buffer_Sink::write(void * user, const char * bytes, size_t len) {
  Buffer_Sink * self = static_cast<Buffer_Sink *>(user);
  if (!self || (!bytes && len > 0)) {
    return GDSV_E_INVALID;
  }
  self->buffer_.append(bytes, len);
  return GDSV_OK;
}

//
// Fixed buffer
//

Fixed_Buffer_Sink::Fixed_Buffer_Sink(char * buffer, size_t size)
    : data_(buffer), size_(buffer ? size : 0) {}

Sink Fixed_Buffer_Sink::sink() {
  Sink sink;
  sink.write = &Fixed_Buffer_Sink::write;
  sink.flush = nullptr;
  sink.user = this;
  return sink;
}

Status Fixed_Buffer_Sink::write(void * user, const char * bytes, size_t len) {
  Fixed_Buffer_Sink * self = static_cast<Fixed_Buffer_Sink *>(user);
  if (!self || !self->data_ || (!bytes && len > 0)) {
    return GDSV_E_INVALID;
  }

  size_t available = self->size_ - self->used_;
  size_t to_copy = len < available ? len : available;
  if (to_copy > 0) {
    memcpy(self->data_ + self->used_, bytes, to_copy);
    self->used_ += to_copy;
  }
  if (to_copy < len) {
    self->truncated_ = true;
    return GDSV_E_WRITE;
  }
  return GDSV_OK;
}

//
// File
//

File_Sink::File_Sink(const char * path, bool append)
    : file_(path ? fopen(path, append ? "ab" : "wb") : nullptr) {}

File_Sink::~File_Sink() {
  // Errors cannot be reported from here; call close() to observe them
  if (file_) {
    fclose(file_);
  }
}

Sink File_Sink::sink() {
  Sink sink;
  sink.write = &File_Sink::write;
  sink.flush = &File_Sink::flush;
  sink.user = this;
  return sink;
}

Status File_Sink::close() {
  if (!file_) {
    return GDSV_E_WRITE;
  }
  int flushed = fflush(file_);
  int closed = fclose(file_);
  file_ = nullptr;
  return (flushed == 0 && closed == 0) ? GDSV_OK : GDSV_E_WRITE;
}

Status File_Sink::write(void * user, const char * bytes, size_t len) {
  File_Sink * self = static_cast<File_Sink *>(user);
  if (!self || !self->file_) {
    return GDSV_E_WRITE;
  }
  if (len == 0) {
    return GDSV_OK;
  }
  if (!bytes || fwrite(bytes, 1, len, self->file_) != len) {
    return GDSV_E_WRITE;
  }
  return GDSV_OK;
}

Status File_Sink::flush(void * user) {
  File_Sink * self = static_cast<File_Sink *>(user);
  if (!self || !self->file_) {
    return GDSV_E_WRITE;
  }
  return fflush(self->file_) == 0 ? GDSV_OK : GDSV_E_WRITE;
}

} // namespace gdsv
