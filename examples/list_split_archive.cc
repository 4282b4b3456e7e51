// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/archive_reader.h"
#include "catstream/concatenated_stream.h"
#include "catstream/file_source.h"
#include "catstream/stream_fault.h"

#include <iostream>
#include <locale.h>
#include <memory>
#include <string>
#include <vector>

using namespace catstream;

int main(int argc, char *argv[]) {
  setlocale(LC_ALL, "");

  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <part> [part...]\n";
    std::cerr << "\nLists the entries of an archive split into parts, given in order.\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << argv[0] << " backup.tar.gz.aa backup.tar.gz.ab backup.tar.gz.ac\n";
    std::cerr << "  " << argv[0] << " photos.zip.001 photos.zip.002\n";
    return 1;
  }

  // Report source faults that are not turned into exceptions (close on teardown).
  register_fault_callback([](const StreamFault &fault) { std::cerr << "warning: " << fault.message << "\n"; });

  try {
    std::vector<std::unique_ptr<ISeekableSource>> parts;
    for (int i = 1; i < argc; ++i) {
      parts.push_back(FileSource::open(argv[i]));
    }
    ConcatenatedStream stream(std::move(parts), ConcatenatedStreamOptions{ argv[1], true });
    std::cout << "=== " << stream.source_count() << " parts, " << stream.size() << " bytes ===\n";

    ArchiveReader reader(stream);
    size_t count = 0;
    while (reader.next_entry()) {
      std::cout << reader.pathname();
      if (reader.is_file()) {
        std::cout << " (file, " << reader.size() << " bytes)";
      } else if (reader.is_directory()) {
        std::cout << " (dir)";
      }
      std::cout << "\n";
      count++;
    }

    std::cout << "\nFormat: " << reader.format_name() << "\n";
    std::cout << "Total entries: " << count << "\n";
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    register_fault_callback(FaultCallback{});
    return 1;
  }

  register_fault_callback(FaultCallback{});
  return 0;
}
