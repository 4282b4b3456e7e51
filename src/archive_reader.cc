// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/archive_reader.h"

#include <archive_entry.h>
#include <cerrno>
#include <cstdio>
#include <utility>

namespace catstream {

namespace {

constexpr std::size_t kReadBufferSize = 64 * 1024;

} // namespace

ArchiveError::ArchiveError(const std::string &message, int errno_value)
  : StreamError(message)
  , _errno_value(errno_value) {}

ArchiveReader::ArchiveReader(ConcatenatedStream &stream, ArchiveReaderOptions options)
  : _stream(stream)
  , _options(std::move(options))
  , _ar(nullptr)
  , _entry(nullptr)
  , _buffer(kReadBufferSize)
  , _at_eof(false) {
  open_archive();
}

ArchiveReader::~ArchiveReader() {
  if (_ar) {
    archive_read_free(_ar);
    _ar = nullptr;
  }
}

void ArchiveReader::open_archive() {
  _ar = archive_read_new();
  if (!_ar) {
    throw ArchiveError("Failed to allocate libarchive reader", ENOMEM);
  }

  try {
    configure_and_open();
  } catch (const std::exception &) {
    archive_read_free(_ar);
    _ar = nullptr;
    throw;
  }
}

void ArchiveReader::configure_and_open() {
  archive_read_support_filter_all(_ar);
  if (_options.formats.empty()) {
    archive_read_support_format_all(_ar);
  } else {
    for (const auto &format : _options.formats) {
      if (archive_read_support_format_by_name(_ar, format.c_str()) != ARCHIVE_OK) {
        raise_archive_error("Unsupported archive format '" + format + "'");
      }
    }
  }

  for (const auto &passphrase : _options.passphrases) {
    if (archive_read_add_passphrase(_ar, passphrase.c_str()) != ARCHIVE_OK) {
      raise_archive_error("Failed to register passphrase");
    }
  }

  archive_read_set_callback_data(_ar, this);
  archive_read_set_read_callback(_ar, read_callback_bridge);
  archive_read_set_skip_callback(_ar, skip_callback_bridge);
  archive_read_set_seek_callback(_ar, seek_callback_bridge);

  if (archive_read_open1(_ar) != ARCHIVE_OK) {
    rethrow_pending();
    raise_archive_error("Failed to open archive");
  }
}

bool ArchiveReader::next_entry() {
  if (_at_eof) {
    return false;
  }

  const int rc = archive_read_next_header(_ar, &_entry);
  if (rc == ARCHIVE_EOF) {
    _entry = nullptr;
    _at_eof = true;
    return false;
  }
  if (rc < ARCHIVE_WARN) {
    _entry = nullptr;
    rethrow_pending();
    raise_archive_error("Failed to read entry header");
  }
  return true;
}

std::string ArchiveReader::pathname() const {
  require_entry("pathname");
  const char *name = archive_entry_pathname(_entry);
  return name ? std::string(name) : std::string();
}

int64_t ArchiveReader::size() const {
  require_entry("size");
  return archive_entry_size_is_set(_entry) ? static_cast<int64_t>(archive_entry_size(_entry)) : -1;
}

bool ArchiveReader::is_file() const {
  require_entry("is_file");
  return archive_entry_filetype(_entry) == AE_IFREG;
}

bool ArchiveReader::is_directory() const {
  require_entry("is_directory");
  return archive_entry_filetype(_entry) == AE_IFDIR;
}

std::string ArchiveReader::format_name() const {
  const char *name = archive_format_name(_ar);
  return name ? std::string(name) : std::string();
}

ssize_t ArchiveReader::read_data(void *buffer, size_t size) {
  require_entry("read_data");
  const la_ssize_t bytes_read = archive_read_data(_ar, buffer, size);
  if (bytes_read < 0) {
    rethrow_pending();
    raise_archive_error("Failed to read entry data for '" + pathname() + "'");
  }
  return static_cast<ssize_t>(bytes_read);
}

void ArchiveReader::require_entry(const char *operation) const {
  if (!_entry) {
    throw ArchiveError(std::string(operation) + " requires a current entry; call next_entry() first", 0);
  }
}

void ArchiveReader::raise_archive_error(const std::string &context) {
  const char *detail = archive_error_string(_ar);
  const int err = archive_errno(_ar);
  std::string message = context;
  if (detail && *detail) {
    message += ": ";
    message += detail;
  }
  throw ArchiveError(message, err);
}

void ArchiveReader::rethrow_pending() {
  if (_pending) {
    std::exception_ptr pending = std::move(_pending);
    _pending = nullptr;
    std::rethrow_exception(pending);
  }
}

la_ssize_t ArchiveReader::read_callback_bridge(struct archive *a, void *client_data, const void **buff) {
  auto *reader = static_cast<ArchiveReader *>(client_data);

  ssize_t bytes_read = 0;
  try {
    bytes_read = reader->_stream.read(reader->_buffer.data(), reader->_buffer.size());
  } catch (const std::exception &ex) {
    reader->_pending = std::current_exception();
    archive_set_error(a, EIO, "%s", ex.what());
    return -1;
  }

  *buff = reader->_buffer.data();
  return static_cast<la_ssize_t>(bytes_read);
}

la_int64_t ArchiveReader::seek_callback_bridge(struct archive *a, void *client_data, la_int64_t request, int whence) {
  auto *reader = static_cast<ArchiveReader *>(client_data);
  try {
    return reader->_stream.seek(request, whence);
  } catch (const std::exception &ex) {
    reader->_pending = std::current_exception();
    archive_set_error(a, EIO, "%s", ex.what());
    return ARCHIVE_FATAL;
  }
}

la_int64_t ArchiveReader::skip_callback_bridge(struct archive *a, void *client_data, la_int64_t request) {
  auto *reader = static_cast<ArchiveReader *>(client_data);
  try {
    const int64_t current = reader->_stream.tell();
    const int64_t result = reader->_stream.seek(request, SEEK_CUR);
    return result - current;
  } catch (const std::exception &ex) {
    reader->_pending = std::current_exception();
    archive_set_error(a, EIO, "%s", ex.what());
    return 0;
  }
}

} // namespace catstream
