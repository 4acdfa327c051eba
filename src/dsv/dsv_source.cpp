/**
 * @file dsv_source.cpp
 * @brief Input sources: string and file
 *
 * Copyright 2026 by Corey Pennycuff
 */

#include "dsv_internal.h"
#include <ghoti.io/dsv/dsv_reader.h>

#include <cstring>
#include <utility>

namespace gdsv {

String_Source::String_Source(std::string text) : text_(std::move(text)) {}

Source String_Source::source() {
  Source source;
  source.read = &String_Source::read;
  source.user = this;
  return source;
}

Status String_Source::read(
    void * user, char * buffer, size_t len, size_t * read_len) {
  String_Source * self = static_cast<String_Source *>(user);
  if (!self || !buffer || !read_len) {
    return GDSV_E_READ;
  }
  size_t available = self->text_.size() - self->offset_;
  size_t n = len < available ? len : available;
  if (n > 0) {
    memcpy(buffer, self->text_.data() + self->offset_, n);
    self->offset_ += n;
  }
  *read_len = n;
  return GDSV_OK;
}

File_Source::File_Source(const char * path)
    : file_(path ? fopen(path, "rb") : nullptr) {}

File_Source::~File_Source() {
  if (file_) {
    fclose(file_);
  }
}

Source File_Source::source() {
  Source source;
  source.read = &File_Source::read;
  source.user = this;
  return source;
}

Status File_Source::read(
    void * user, char * buffer, size_t len, size_t * read_len) {
  File_Source * self = static_cast<File_Source *>(user);
  if (!self || !self->file_ || !buffer || !read_len) {
    return GDSV_E_READ;
  }
  size_t n = fread(buffer, 1, len, self->file_);
  if (n < len && ferror(self->file_)) {
    *read_len = 0;
    return GDSV_E_READ;
  }
  *read_len = n;
  return GDSV_OK;
}

} // namespace gdsv
