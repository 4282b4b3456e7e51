// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/memory_source.h"

#include <cerrno>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace catstream;

namespace {

bool expect(bool condition, const char *message) {
  if (!condition) {
    std::cerr << message << std::endl;
    return false;
  }
  return true;
}

} // namespace

int main() {
  bool ok = true;

  {
    MemorySource source(std::vector<uint8_t>{ 'a', 'b', 'c', 'd' });
    char buf[8] = { 0 };
    ok = ok && expect(source.read(buf, 3) == 3 && std::string(buf, 3) == "abc", "read should return the first 3 bytes");
    ok = ok && expect(source.seek(0, SEEK_CUR) == 3, "seek(0,SEEK_CUR) should report the position");
    ok = ok && expect(source.seek(0, SEEK_END) == 4, "seek(0,SEEK_END) should report the size");
    ok = ok && expect(source.read(buf, 1) == 0, "read at the end should return 0");
    ok = ok && expect(source.seek(10, SEEK_SET) == 10, "seeking past the end is allowed");
    ok = ok && expect(source.read(buf, 1) == 0, "read past the end should return 0");
    ok = ok && expect(source.read(buf, 0) == 0, "zero-sized read should return 0");
  }

  {
    MemorySource source(std::vector<uint8_t>{ 'a', 'b', 'c', 'd' });
    const int64_t max = std::numeric_limits<int64_t>::max();
    char buf[4] = { 0 };
    ok = ok && expect(source.seek(1, SEEK_SET) == 1, "seek(1,SEEK_SET) should land at 1");
    ok = ok && expect(source.seek(max, SEEK_CUR) == max, "an overflowing relative seek should saturate");
    ok = ok && expect(source.read(buf, sizeof(buf)) == 0, "read at the saturated position should return 0");
    ok = ok && expect(source.seek(max, SEEK_END) == max, "an overflowing end-relative seek should saturate");
  }

  {
    MemorySource source(std::string("xyz"));
    errno = 0;
    ok = ok && expect(source.seek(-1, SEEK_SET) == -1 && errno == EINVAL, "negative target should fail with EINVAL");
    errno = 0;
    ok = ok && expect(source.seek(-4, SEEK_END) == -1 && errno == EINVAL, "negative end-relative target should fail with EINVAL");
    errno = 0;
    ok = ok && expect(source.seek(0, 7) == -1 && errno == EINVAL, "unknown whence should fail with EINVAL");
    ok = ok && expect(source.seek(0, SEEK_CUR) == 0, "failed seeks should leave the position unchanged");
  }

  {
    auto source = MemorySource::from_string("payload");
    ok = ok && expect(source->is_open(), "new source should be open");
    ok = ok && expect(source->close() == 0, "close should succeed");
    ok = ok && expect(!source->is_open(), "closed source should not be open");

    char buf[4];
    errno = 0;
    ok = ok && expect(source->read(buf, sizeof(buf)) == -1 && errno == EBADF, "read after close should fail with EBADF");
    errno = 0;
    ok = ok && expect(source->seek(0, SEEK_SET) == -1 && errno == EBADF, "seek after close should fail with EBADF");
    errno = 0;
    ok = ok && expect(source->close() == -1 && errno == EBADF, "second close should fail with EBADF");
  }

  if (!ok) {
    return 1;
  }

  std::cout << "MemorySource tests passed" << std::endl;
  return 0;
}
