// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/platform_compat.h"

#include <cstddef>
#include <cstdint>

namespace catstream {

/// Seek origins accepted by ConcatenatedStream::seek (same values as SEEK_SET/SEEK_CUR/SEEK_END)
enum class Origin : int {
  Start = 0,
  Current = 1,
  End = 2,
};

/**
 * @brief Capability interface for one underlying source of a concatenated stream
 *
 * A source is readable, seekable by offset and origin, and closable. Failures
 * are reported by returning -1 with errno set; implementations may also throw
 * a std::exception subclass, which the stream wraps the same way.
 */
class ISeekableSource {
public:
  virtual ~ISeekableSource() = default;

  /**
   * @brief Read up to size bytes at the source's cursor
   * @return Bytes read, 0 at end of source, -1 on failure
   */
  virtual ssize_t read(void *buffer, size_t size) = 0;

  /**
   * @brief Move the source's cursor
   * @param offset Offset relative to whence
   * @param whence SEEK_SET, SEEK_CUR or SEEK_END
   * @return New position within the source, -1 on failure
   */
  virtual int64_t seek(int64_t offset, int whence) = 0;

  /**
   * @brief Release the resource behind the source
   * @return 0 on success, -1 on failure
   */
  virtual int close() = 0;
};

} // namespace catstream
