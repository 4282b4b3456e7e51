// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/concatenated_stream.h"
#include "catstream/seekable_source.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#if !defined(_WIN32)
#  include <unistd.h>
#else
#  include <process.h>
#endif

namespace catstream {
namespace testing {

// Observable state of a ScriptedSource, shared with the test after the
// source itself has been handed to a stream.
struct SourceProbe {
  int reads = 0;
  int seeks = 0;
  int closes = 0;
  int64_t position = 0;

  bool fail_seek_to_end = false;
  bool fail_rewind = false;
  bool fail_local_seek = false;  // any SEEK_SET to a non-zero offset
  bool fail_all_seeks_after_survey = false;
  bool fail_close = false;
  bool throw_on_read = false;
  int64_t fail_read_at = -1;     // local offset at which read() returns -1
  int64_t truncate_at = -1;      // local offset at which read() returns 0
  size_t max_chunk = 0;          // cap on bytes returned per read (0 = no cap)
  bool surveyed = false;
};

// In-memory source whose failures are scripted through a SourceProbe.
class ScriptedSource : public ISeekableSource {
public:
  ScriptedSource(std::string data, std::shared_ptr<SourceProbe> probe)
    : _data(std::move(data))
    , _probe(std::move(probe)) {}

  ssize_t read(void *buffer, size_t size) override {
    ++_probe->reads;
    if (_probe->throw_on_read) {
      throw std::runtime_error("scripted read exception");
    }
    if (_probe->fail_read_at >= 0 && _probe->position >= _probe->fail_read_at) {
      errno = EIO;
      return -1;
    }
    if (_probe->truncate_at >= 0 && _probe->position >= _probe->truncate_at) {
      return 0;
    }

    const int64_t length = static_cast<int64_t>(_data.size());
    if (_probe->position >= length) {
      return 0;
    }
    size_t count = std::min(size, static_cast<size_t>(length - _probe->position));
    if (_probe->max_chunk > 0) {
      count = std::min(count, _probe->max_chunk);
    }
    if (_probe->fail_read_at >= 0) {
      count = std::min(count, static_cast<size_t>(_probe->fail_read_at - _probe->position));
    }
    if (_probe->truncate_at >= 0) {
      count = std::min(count, static_cast<size_t>(_probe->truncate_at - _probe->position));
    }
    std::memcpy(buffer, _data.data() + _probe->position, count);
    _probe->position += static_cast<int64_t>(count);
    return static_cast<ssize_t>(count);
  }

  int64_t seek(int64_t offset, int whence) override {
    ++_probe->seeks;
    if (whence == SEEK_END) {
      if (_probe->fail_seek_to_end) {
        errno = ESPIPE;
        return -1;
      }
      _probe->position = static_cast<int64_t>(_data.size()) + offset;
      return _probe->position;
    }
    if (whence != SEEK_SET) {
      errno = EINVAL;
      return -1;
    }
    if (!_probe->surveyed) {
      _probe->surveyed = true;
      if (_probe->fail_rewind) {
        errno = EIO;
        return -1;
      }
    } else if (_probe->fail_all_seeks_after_survey || (_probe->fail_local_seek && offset != 0)) {
      errno = EIO;
      return -1;
    }
    if (offset < 0) {
      errno = EINVAL;
      return -1;
    }
    _probe->position = offset;
    return _probe->position;
  }

  int close() override {
    ++_probe->closes;
    if (_probe->fail_close) {
      errno = EIO;
      return -1;
    }
    return 0;
  }

private:
  std::string _data;
  std::shared_ptr<SourceProbe> _probe;
};

struct ScriptedSet {
  std::vector<std::unique_ptr<ISeekableSource>> sources;
  std::vector<std::shared_ptr<SourceProbe>> probes;
};

inline ScriptedSet make_scripted_sources(const std::vector<std::string> &contents) {
  ScriptedSet set;
  for (const auto &content : contents) {
    auto probe = std::make_shared<SourceProbe>();
    set.sources.push_back(std::make_unique<ScriptedSource>(content, probe));
    set.probes.push_back(std::move(probe));
  }
  return set;
}

inline std::string concatenate(const std::vector<std::string> &contents) {
  std::string all;
  for (const auto &content : contents) {
    all += content;
  }
  return all;
}

inline std::string read_string(ConcatenatedStream &stream, size_t size) {
  std::string buffer(size, '\0');
  const ssize_t n = stream.read(&buffer[0], size);
  buffer.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return buffer;
}

// Scratch directory for file-based tests: $CATSTREAM_TEST_TMPDIR if set,
// otherwise the system temporary directory, with a per-process subdirectory.
inline std::filesystem::path scratch_directory(const std::string &name) {
  std::filesystem::path base;
  if (const char *configured = std::getenv("CATSTREAM_TEST_TMPDIR"); configured && *configured) {
    base = configured;
  } else {
    base = std::filesystem::temp_directory_path();
  }

  const auto pid =
#if defined(_WIN32)
      _getpid();
#else
      getpid();
#endif

  const auto dir = base / ("catstream_" + name + "_" + std::to_string(static_cast<long long>(pid)));
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create scratch directory: " + ec.message());
  }
  return dir;
}

struct ScratchDir {
  std::filesystem::path path;
  explicit ScratchDir(const std::string &name)
    : path(scratch_directory(name)) {}
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
};

inline std::string write_file(const std::filesystem::path &dir, const std::string &name, const std::string &content) {
  const auto file_path = dir / name;
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open temp file for writing: " + file_path.string());
  }
  out << content;
  return file_path.string();
}

} // namespace testing
} // namespace catstream
