// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/memory_source.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>
#include <utility>

namespace catstream {

MemorySource::MemorySource(std::vector<uint8_t> data)
  : _data(std::move(data)) {}

MemorySource::MemorySource(const std::string &data)
  : _data(data.begin(), data.end()) {}

ssize_t MemorySource::read(void *buffer, size_t size) {
  if (!_open) {
    errno = EBADF;
    return -1;
  }

  const int64_t length = static_cast<int64_t>(_data.size());
  if (_position >= length || size == 0) {
    return 0;
  }

  const size_t available = static_cast<size_t>(length - _position);
  const size_t count = std::min(size, available);
  std::memcpy(buffer, _data.data() + _position, count);
  _position += static_cast<int64_t>(count);
  return static_cast<ssize_t>(count);
}

int64_t MemorySource::seek(int64_t offset, int whence) {
  if (!_open) {
    errno = EBADF;
    return -1;
  }

  int64_t base = 0;
  switch (whence) {
  case SEEK_SET:
    base = 0;
    break;
  case SEEK_CUR:
    base = _position;
    break;
  case SEEK_END:
    base = static_cast<int64_t>(_data.size());
    break;
  default:
    errno = EINVAL;
    return -1;
  }

  int64_t target = 0;
  if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) {
    target = std::numeric_limits<int64_t>::max();
  } else {
    target = base + offset;
  }
  if (target < 0) {
    errno = EINVAL;
    return -1;
  }
  _position = target;
  return _position;
}

int MemorySource::close() {
  if (!_open) {
    errno = EBADF;
    return -1;
  }
  _open = false;
  std::vector<uint8_t>().swap(_data);
  _position = 0;
  return 0;
}

} // namespace catstream
