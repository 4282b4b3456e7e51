// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/stream_fault.h"

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace catstream {

/// Base class of every exception thrown by catstream
class StreamError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The stream was constructed from an empty or otherwise unusable source list
class ConfigurationError : public StreamError {
public:
  using StreamError::StreamError;
};

/// An argument (origin, offset) was rejected before any source was touched
class InvalidArgumentError : public StreamError {
public:
  using StreamError::StreamError;
};

/// The stream was closed, or failed earlier, and can no longer be used
class ClosedError : public StreamError {
public:
  using StreamError::StreamError;
};

/**
 * @brief An underlying source failed to read, seek or close
 *
 * The fault identifies the source by index. When the source threw, the
 * original exception is kept in cause(). For reads that failed part way,
 * bytes_transferred() tells how many bytes were already copied into the
 * caller's buffer by the same call.
 */
class SourceError : public StreamError {
public:
  explicit SourceError(StreamFault fault, std::size_t bytes_transferred = 0, std::exception_ptr cause = nullptr);

  const StreamFault &fault() const noexcept { return _fault; }
  std::size_t source_index() const noexcept { return _fault.source_index; }
  SourceOperation operation() const noexcept { return _fault.operation; }
  int errno_value() const noexcept { return _fault.errno_value; }
  std::size_t bytes_transferred() const noexcept { return _bytes_transferred; }
  std::exception_ptr cause() const noexcept { return _cause; }

private:
  StreamFault _fault;
  std::size_t _bytes_transferred;
  std::exception_ptr _cause;
};

/// Aggregate of every source that failed to close
class CloseError : public StreamError {
public:
  explicit CloseError(std::vector<StreamFault> faults);

  const std::vector<StreamFault> &faults() const noexcept { return _faults; }

private:
  std::vector<StreamFault> _faults;
};

} // namespace catstream
