// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/concatenated_stream.h"
#include "catstream/file_source.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace catstream;

namespace {

void print_usage(const char *program) {
  std::cerr << "Usage: " << program << " [--offset N] [--length N] <file> [file...]\n";
  std::cerr << "\nWrites the byte range of the files concatenated in order to stdout.\n";
  std::cerr << "A negative --offset counts back from the end.\n";
  std::cerr << "\nExamples:\n";
  std::cerr << "  " << program << " video.part1 video.part2 > video.bin\n";
  std::cerr << "  " << program << " --offset -512 archive.tar.001 archive.tar.002\n";
}

bool parse_int64(const std::string &text, int64_t &value) {
  try {
    std::size_t consumed = 0;
    value = std::stoll(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception &) {
    return false;
  }
}

// Copy up to length bytes (all when negative) from the cursor to stdout
int64_t copy_range(ConcatenatedStream &stream, int64_t length) {
  std::vector<char> buffer(64 * 1024);
  int64_t copied = 0;
  while (length < 0 || copied < length) {
    std::size_t request = buffer.size();
    if (length >= 0 && static_cast<int64_t>(request) > length - copied) {
      request = static_cast<std::size_t>(length - copied);
    }
    const ssize_t n = stream.read(buffer.data(), request);
    if (n <= 0) {
      break;
    }
    if (std::fwrite(buffer.data(), 1, static_cast<std::size_t>(n), stdout) != static_cast<std::size_t>(n)) {
      throw std::runtime_error("Failed to write to stdout");
    }
    copied += n;
  }
  return copied;
}

} // namespace

int main(int argc, char *argv[]) {
  int64_t offset = 0;
  int64_t length = -1;
  std::vector<std::string> paths;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if ((arg == "--offset" || arg == "--length") && i + 1 < argc) {
      int64_t value = 0;
      if (!parse_int64(argv[++i], value)) {
        std::cerr << "Invalid number for " << arg << ": " << argv[i] << "\n";
        return 1;
      }
      if (arg == "--offset") {
        offset = value;
      } else {
        length = value;
      }
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      paths.push_back(arg);
    }
  }

  if (paths.empty()) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    std::vector<std::unique_ptr<ISeekableSource>> sources;
    for (const auto &path : paths) {
      sources.push_back(FileSource::open(path));
    }
    ConcatenatedStream stream(std::move(sources), ConcatenatedStreamOptions{ "cat_sources", true });

    if (offset < 0) {
      stream.seek(offset, SEEK_END);
    } else {
      stream.seek(offset, SEEK_SET);
    }
    copy_range(stream, length);
    std::fflush(stdout);
    stream.close();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
