// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/seekable_source.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace catstream {

/**
 * @brief ISeekableSource over an in-memory byte buffer
 *
 * Seeking past the end is allowed (reads then return 0); seeking before 0
 * fails with EINVAL. After close() every operation fails with EBADF.
 */
class MemorySource : public ISeekableSource {
public:
  explicit MemorySource(std::vector<uint8_t> data);
  explicit MemorySource(const std::string &data);

  static std::unique_ptr<MemorySource> from_string(const std::string &data) { return std::make_unique<MemorySource>(data); }

  ssize_t read(void *buffer, size_t size) override;
  int64_t seek(int64_t offset, int whence) override;
  int close() override;

  bool is_open() const { return _open; }

private:
  std::vector<uint8_t> _data;
  int64_t _position = 0;
  bool _open = true;
};

} // namespace catstream
