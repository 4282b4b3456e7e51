// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/seekable_source.h"
#include "catstream/stream_error.h"

#include <cstdio>
#include <memory>
#include <string>

namespace catstream {

/// A file could not be opened as a source
class SourceOpenError : public StreamError {
public:
  SourceOpenError(const std::string &message, std::string path, int errno_value);

  const std::string &path() const noexcept { return _path; }
  int errno_value() const noexcept { return _errno_value; }

private:
  std::string _path;
  int _errno_value;
};

/**
 * @brief ISeekableSource over a file opened with stdio in binary read mode
 *
 * Offsets are 64-bit (fseeko/ftello). A FileSource that was not closed
 * explicitly closes its handle on destruction.
 */
class FileSource : public ISeekableSource {
public:
  /**
   * @brief Open path for reading
   * @throws SourceOpenError if the file cannot be opened
   */
  static std::unique_ptr<FileSource> open(const std::string &path);

  /// Adopt an already open handle; the FileSource becomes its owner
  FileSource(FILE *handle, std::string path);

  ~FileSource() override;

  FileSource(const FileSource &) = delete;
  FileSource &operator=(const FileSource &) = delete;

  ssize_t read(void *buffer, size_t size) override;
  int64_t seek(int64_t offset, int whence) override;
  int close() override;

  const std::string &path() const { return _path; }
  bool is_open() const { return _handle != nullptr; }

private:
  FILE *_handle;
  std::string _path;
};

} // namespace catstream
