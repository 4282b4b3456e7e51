// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/boundary_table.h"
#include "catstream/seekable_source.h"
#include "catstream/stream_error.h"
#include "catstream/stream_fault.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace catstream {

struct ConcatenatedStreamOptions {
  std::string label;                    ///< Display name used as prefix of fault messages
  bool close_sources_on_destroy = true; ///< Close remaining sources when destroyed without close()
};

/**
 * @brief Presents an ordered list of sources as one seekable byte stream
 *
 * Construction measures every source with an end-seek, records its range in a
 * BoundaryTable and rewinds it. read() and seek() then translate the logical
 * cursor to the source holding it, crossing source boundaries as needed.
 *
 * Usage:
 *   std::vector<std::unique_ptr<ISeekableSource>> parts;
 *   parts.push_back(FileSource::open("archive.tar.part001"));
 *   parts.push_back(FileSource::open("archive.tar.part002"));
 *   ConcatenatedStream stream(std::move(parts));
 *   stream.seek(-512, SEEK_END);
 *   ssize_t n = stream.read(buffer, 512);
 *
 * @note Thread Safety
 * A ConcatenatedStream is not thread-safe. read() and seek() both mutate the
 * cursor; serialize access externally or use one stream per consumer.
 */
class ConcatenatedStream {
public:
  /**
   * @brief Take ownership of sources and survey their sizes
   * @throws ConfigurationError if sources is empty or holds a null pointer
   * @throws SourceError if a source cannot be measured or rewound
   */
  explicit ConcatenatedStream(std::vector<std::unique_ptr<ISeekableSource>> sources, ConcatenatedStreamOptions options = {});

  ~ConcatenatedStream();

  // Non-copyable
  ConcatenatedStream(const ConcatenatedStream &) = delete;
  ConcatenatedStream &operator=(const ConcatenatedStream &) = delete;

  /**
   * @brief Read up to size bytes, crossing source boundaries
   * @return Bytes read; fewer than size only at end of stream; 0 at end of stream
   * @throws ClosedError after close() or a fatal failure
   * @throws SourceError if a source fails (bytes_transferred() reports partial progress)
   * @note A source that returns 0 before reaching its surveyed size is reported as a SourceError, not end of stream.
   */
  ssize_t read(void *buffer, size_t size);

  /**
   * @brief Move the logical cursor
   * @param offset Offset relative to whence
   * @param whence SEEK_SET, SEEK_CUR or SEEK_END (Origin values)
   * @return New logical position
   * @throws InvalidArgumentError for an unknown whence or a positive offset from SEEK_END
   * @throws ClosedError after close() or a fatal failure
   * @throws SourceError if the target source cannot be positioned (the stream fails)
   */
  int64_t seek(int64_t offset, int whence);

  int64_t seek(int64_t offset, Origin origin) { return seek(offset, static_cast<int>(origin)); }

  /**
   * @brief Read at an absolute logical offset, leaving the cursor where it was
   * @return Bytes read; fewer than size only at end of stream
   * @throws SourceError as read(); the cursor is restored unless the stream failed
   */
  ssize_t read_at(void *buffer, size_t size, int64_t offset);

  /**
   * @brief Close every source
   *
   * All sources are attempted even if some fail. Later calls are no-ops.
   * @throws CloseError listing every source that failed to close
   */
  void close();

  int64_t tell() const { return _position; }
  int64_t size() const { return _boundaries.total_size(); }
  bool at_end() const { return _position >= _boundaries.total_size(); }

  std::size_t source_count() const { return _sources.size(); }
  std::size_t current_source() const { return _current; }
  const BoundaryTable &boundaries() const { return _boundaries; }
  const ConcatenatedStreamOptions &options() const { return _options; }

  bool is_closed() const { return _closed; }
  bool has_failed() const { return _failed; }

private:
  void survey_sources();
  void ensure_usable(const char *operation) const;
  void position_source(std::size_t index, int64_t local_offset, std::size_t transferred = 0);
  bool advance_source(std::size_t transferred);

  [[noreturn]] void raise_source_fault(std::size_t index, SourceOperation operation, const std::string &detail, int err, std::size_t transferred = 0,
                                       std::exception_ptr cause = nullptr) const;

  std::vector<StreamFault> close_all_sources();

  std::vector<std::unique_ptr<ISeekableSource>> _sources;
  ConcatenatedStreamOptions _options;
  BoundaryTable _boundaries;
  std::size_t _current = 0;
  int64_t _position = 0;
  bool _closed = false;
  bool _failed = false;
};

} // namespace catstream
