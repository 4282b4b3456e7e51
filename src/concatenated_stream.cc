// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/concatenated_stream.h"
#include "stream_fault_util.h"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <utility>

namespace catstream {

namespace {

std::string with_label(const std::string &label, const std::string &message) { return label.empty() ? message : label + ": " + message; }

// Used where an exception is already in flight or cannot be thrown.
void dispatch_faults_quietly(const std::vector<StreamFault> &faults) {
  for (const auto &fault : faults) {
    try {
      dispatch_registered_fault(fault);
    } catch (const std::exception &) {
      // A throwing fault callback must not replace the pending error or escape a destructor.
    }
  }
}

} // namespace

ConcatenatedStream::ConcatenatedStream(std::vector<std::unique_ptr<ISeekableSource>> sources, ConcatenatedStreamOptions options)
  : _sources(std::move(sources))
  , _options(std::move(options)) {
  try {
    if (_sources.empty()) {
      throw ConfigurationError(with_label(_options.label, "ConcatenatedStream requires at least one source"));
    }
    for (std::size_t i = 0; i < _sources.size(); ++i) {
      if (!_sources[i]) {
        throw ConfigurationError(with_label(_options.label, "Source #" + std::to_string(i) + " is null"));
      }
    }
    survey_sources();
  } catch (const std::exception &) {
    // The destructor will not run; release what was handed over before propagating.
    _closed = true;
    dispatch_faults_quietly(close_all_sources());
    throw;
  }
}

ConcatenatedStream::~ConcatenatedStream() {
  if (_closed || !_options.close_sources_on_destroy) {
    return;
  }
  _closed = true;
  dispatch_faults_quietly(close_all_sources());
}

void ConcatenatedStream::survey_sources() {
  std::vector<int64_t> sizes;
  sizes.reserve(_sources.size());

  for (std::size_t i = 0; i < _sources.size(); ++i) {
    int64_t end_position = -1;
    int err = 0;
    try {
      errno = 0;
      end_position = _sources[i]->seek(0, SEEK_END);
      err = errno;
    } catch (const std::exception &ex) {
      raise_source_fault(i, SourceOperation::Seek, std::string("seek to end: ") + ex.what(), 0, 0, std::current_exception());
    }
    if (end_position < 0) {
      raise_source_fault(i, SourceOperation::Seek, "seek to end", err);
    }
    sizes.push_back(end_position);

    position_source(i, 0);
  }

  _boundaries = BoundaryTable(sizes);
  _current = 0;
  _position = 0;
}

void ConcatenatedStream::ensure_usable(const char *operation) const {
  if (_closed) {
    throw ClosedError(with_label(_options.label, std::string("Cannot ") + operation + " a closed stream"));
  }
  if (_failed) {
    throw ClosedError(with_label(_options.label, std::string("Cannot ") + operation + " a stream that failed after a source error"));
  }
}

void ConcatenatedStream::position_source(std::size_t index, int64_t local_offset, std::size_t transferred) {
  int64_t landed = -1;
  int err = 0;
  try {
    errno = 0;
    landed = _sources[index]->seek(local_offset, SEEK_SET);
    err = errno;
  } catch (const std::exception &ex) {
    raise_source_fault(index, SourceOperation::Seek, "seek to local offset " + std::to_string(local_offset) + ": " + ex.what(), 0, transferred,
                       std::current_exception());
  }

  if (landed < 0) {
    raise_source_fault(index, SourceOperation::Seek, "seek to local offset " + std::to_string(local_offset), err, transferred);
  }
  if (landed != local_offset) {
    raise_source_fault(index, SourceOperation::Seek, "seek to local offset " + std::to_string(local_offset) + " landed at " + std::to_string(landed), 0,
                       transferred);
  }
}

bool ConcatenatedStream::advance_source(std::size_t transferred) {
  const auto next = _boundaries.next_non_empty(_current);
  if (!next) {
    return false;
  }

  // The next source may have been left anywhere by an earlier seek.
  try {
    position_source(*next, 0, transferred);
  } catch (const std::exception &) {
    _failed = true;
    throw;
  }
  _current = *next;
  return true;
}

ssize_t ConcatenatedStream::read(void *buffer, size_t size) {
  ensure_usable("read");
  if (size == 0) {
    return 0;
  }

  auto *out = static_cast<uint8_t *>(buffer);
  size_t total = 0;

  while (total < size) {
    const int64_t source_end = _boundaries.start_offset(_current) + _boundaries.source_size(_current);
    if (_position >= source_end) {
      if (!advance_source(total)) {
        break;
      }
      continue;
    }

    const int64_t remaining_in_source = source_end - _position;
    const size_t request = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(size - total), remaining_in_source));

    ssize_t bytes_read = -1;
    int err = 0;
    try {
      errno = 0;
      bytes_read = _sources[_current]->read(out + total, request);
      err = errno;
    } catch (const std::exception &ex) {
      raise_source_fault(_current, SourceOperation::Read, ex.what(), 0, total, std::current_exception());
    }

    if (bytes_read < 0) {
      raise_source_fault(_current, SourceOperation::Read, "", err, total);
    }
    if (bytes_read == 0) {
      const int64_t local = _position - _boundaries.start_offset(_current);
      raise_source_fault(_current, SourceOperation::Read,
                         "source ended at local offset " + std::to_string(local) + ", before its surveyed size " +
                             std::to_string(_boundaries.source_size(_current)),
                         0, total);
    }
    if (static_cast<size_t>(bytes_read) > request) {
      raise_source_fault(_current, SourceOperation::Read, "source returned more bytes than requested", 0, total);
    }

    total += static_cast<size_t>(bytes_read);
    _position += bytes_read;
  }

  return static_cast<ssize_t>(total);
}

int64_t ConcatenatedStream::seek(int64_t offset, int whence) {
  ensure_usable("seek");

  if (whence != static_cast<int>(Origin::Start) && whence != static_cast<int>(Origin::Current) && whence != static_cast<int>(Origin::End)) {
    throw InvalidArgumentError(with_label(_options.label, "Seek origin must be 0 (start), 1 (current) or 2 (end), got " + std::to_string(whence)));
  }
  const Origin origin = static_cast<Origin>(whence);

  if (origin == Origin::Current && offset == 0) {
    return _position;
  }
  if (origin == Origin::End && offset > 0) {
    throw InvalidArgumentError(with_label(_options.label, "Seek from end requires an offset <= 0, got " + std::to_string(offset)));
  }

  int64_t base = 0;
  if (origin == Origin::Current) {
    base = _position;
  } else if (origin == Origin::End) {
    base = _boundaries.total_size();
  }

  int64_t candidate = 0;
  if (offset > 0 && base > std::numeric_limits<int64_t>::max() - offset) {
    candidate = std::numeric_limits<int64_t>::max();
  } else {
    candidate = base + offset;
  }

  // Backward undershoot lands on the first byte, forward overshoot on the end.
  candidate = std::clamp<int64_t>(candidate, 0, _boundaries.total_size());

  std::size_t target = _sources.size() - 1;
  if (const auto resolved = _boundaries.resolve(candidate)) {
    target = *resolved;
  }

  try {
    position_source(target, candidate - _boundaries.start_offset(target));
  } catch (const std::exception &) {
    _failed = true;
    throw;
  }

  _current = target;
  _position = candidate;
  return _position;
}

ssize_t ConcatenatedStream::read_at(void *buffer, size_t size, int64_t offset) {
  ensure_usable("read_at");
  if (offset < 0) {
    throw InvalidArgumentError(with_label(_options.label, "read_at offset cannot be negative, got " + std::to_string(offset)));
  }

  const int64_t saved = _position;
  seek(offset, SEEK_SET);
  ssize_t bytes_read = 0;
  try {
    bytes_read = read(buffer, size);
  } catch (const std::exception &) {
    // A read error leaves the stream usable; put the cursor back before reporting it.
    if (!_failed) {
      seek(saved, SEEK_SET);
    }
    throw;
  }
  seek(saved, SEEK_SET);
  return bytes_read;
}

void ConcatenatedStream::close() {
  if (_closed) {
    return;
  }
  _closed = true;

  std::vector<StreamFault> faults = close_all_sources();
  if (faults.empty()) {
    return;
  }
  for (const auto &fault : faults) {
    dispatch_registered_fault(fault);
  }
  throw CloseError(std::move(faults));
}

std::vector<StreamFault> ConcatenatedStream::close_all_sources() {
  std::vector<StreamFault> faults;

  for (std::size_t i = 0; i < _sources.size(); ++i) {
    if (!_sources[i]) {
      continue;
    }

    int result = -1;
    int err = 0;
    try {
      errno = 0;
      result = _sources[i]->close();
      err = errno;
    } catch (const std::exception &ex) {
      faults.push_back(make_source_fault(_options.label, i, SourceOperation::Close, ex.what(), 0));
      continue;
    }
    if (result != 0) {
      faults.push_back(make_source_fault(_options.label, i, SourceOperation::Close, "", err));
    }
  }
  return faults;
}

void ConcatenatedStream::raise_source_fault(std::size_t index, SourceOperation operation, const std::string &detail, int err, std::size_t transferred,
                                            std::exception_ptr cause) const {
  StreamFault fault = make_source_fault(_options.label, index, operation, detail, err);
  dispatch_registered_fault(fault);
  throw SourceError(std::move(fault), transferred, std::move(cause));
}

} // namespace catstream
