// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/concatenated_stream.h"
#include "catstream/stream_error.h"

#include <archive.h>
#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace catstream {

struct ArchiveReaderOptions {
  std::vector<std::string> passphrases; ///< Passphrases for encrypted archives
  std::vector<std::string> formats;     ///< Specific archive formats to enable (empty = all)
};

/// libarchive rejected the data or the configuration
class ArchiveError : public StreamError {
public:
  ArchiveError(const std::string &message, int errno_value);

  int errno_value() const noexcept { return _errno_value; }

private:
  int _errno_value;
};

/**
 * @brief Reads an archive through libarchive from a ConcatenatedStream
 *
 * Typical use is a split archive whose parts were handed to the stream in
 * order. The reader installs read, seek and skip callbacks that forward to
 * the stream, so formats that need random access (zip, 7zip) work across
 * part boundaries.
 *
 * Usage:
 *   ConcatenatedStream stream(std::move(parts));
 *   ArchiveReader reader(stream);
 *   while (reader.next_entry()) {
 *     std::cout << reader.pathname() << "\n";
 *   }
 *
 * The stream must outlive the reader. Exceptions thrown by the stream inside
 * a callback are rethrown from the ArchiveReader call that triggered them.
 */
class ArchiveReader {
public:
  /**
   * @brief Open the archive at the stream's current position
   * @throws ArchiveError if libarchive cannot recognize the data
   */
  explicit ArchiveReader(ConcatenatedStream &stream, ArchiveReaderOptions options = {});

  ~ArchiveReader();

  // Non-copyable
  ArchiveReader(const ArchiveReader &) = delete;
  ArchiveReader &operator=(const ArchiveReader &) = delete;

  /**
   * @brief Advance to the next entry header
   * @return false once the archive is exhausted
   */
  bool next_entry();

  std::string pathname() const;
  int64_t size() const;
  bool is_file() const;
  bool is_directory() const;

  /// libarchive's name for the detected format (valid after the first next_entry())
  std::string format_name() const;

  /**
   * @brief Read payload of the current entry
   * @return Bytes read, 0 at the end of the entry
   */
  ssize_t read_data(void *buffer, size_t size);

private:
  void open_archive();
  void configure_and_open();
  void require_entry(const char *operation) const;
  [[noreturn]] void raise_archive_error(const std::string &context);
  void rethrow_pending();

  static la_ssize_t read_callback_bridge(struct archive *a, void *client_data, const void **buff);
  static la_int64_t seek_callback_bridge(struct archive *a, void *client_data, la_int64_t request, int whence);
  static la_int64_t skip_callback_bridge(struct archive *a, void *client_data, la_int64_t request);

  ConcatenatedStream &_stream;
  ArchiveReaderOptions _options;
  struct archive *_ar;
  struct archive_entry *_entry;
  std::vector<char> _buffer;
  std::exception_ptr _pending;
  bool _at_eof;
};

} // namespace catstream
