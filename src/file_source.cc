// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/file_source.h"
#include "stream_fault_util.h"

#include <cerrno>
#include <utility>

namespace catstream {

SourceOpenError::SourceOpenError(const std::string &message, std::string path, int errno_value)
  : StreamError(message)
  , _path(std::move(path))
  , _errno_value(errno_value) {}

std::unique_ptr<FileSource> FileSource::open(const std::string &path) {
  errno = 0;
  FILE *handle = std::fopen(path.c_str(), "rb");
  if (!handle) {
    const int err = errno;
    throw SourceOpenError(format_path_errno_error("Failed to open source file", path, err), path, err);
  }
  return std::make_unique<FileSource>(handle, path);
}

FileSource::FileSource(FILE *handle, std::string path)
  : _handle(handle)
  , _path(std::move(path)) {}

FileSource::~FileSource() {
  if (_handle) {
    std::fclose(_handle);
  }
}

ssize_t FileSource::read(void *buffer, size_t size) {
  if (!_handle) {
    errno = EBADF;
    return -1;
  }

  errno = 0;
  const std::size_t bytes_read = std::fread(buffer, 1, size, _handle);
  if (bytes_read > 0) {
    return static_cast<ssize_t>(bytes_read);
  }

  if (std::feof(_handle)) {
    return 0;
  }

  if (std::ferror(_handle)) {
    const int err = errno != 0 ? errno : EIO;
    std::clearerr(_handle);
    errno = err;
    return -1;
  }
  return 0;
}

int64_t FileSource::seek(int64_t offset, int whence) {
  if (!_handle) {
    errno = EBADF;
    return -1;
  }

  if (CATSTREAM_FSEEK(_handle, offset, whence) != 0) {
    return -1;
  }
  const auto position = CATSTREAM_FTELL(_handle);
  return position >= 0 ? static_cast<int64_t>(position) : -1;
}

int FileSource::close() {
  if (!_handle) {
    errno = EBADF;
    return -1;
  }

  FILE *handle = _handle;
  _handle = nullptr;
  return std::fclose(handle) == 0 ? 0 : -1;
}

} // namespace catstream
