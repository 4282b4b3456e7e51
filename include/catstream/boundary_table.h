// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace catstream {

/**
 * @brief Maps every source to its byte range in the concatenated address space
 *
 * Source i covers the logical offsets [start_offset(i), end_offset(i)].
 * Ranges are contiguous: start_offset(0) == 0 and
 * start_offset(i) == end_offset(i - 1) + 1. A zero-length source owns no byte;
 * its end_offset() is start_offset() - 1 and resolve() never returns it.
 *
 * The table is immutable once built.
 */
class BoundaryTable {
public:
  BoundaryTable() = default;

  /// Build from per-source sizes (all sizes must be >= 0)
  explicit BoundaryTable(const std::vector<int64_t> &sizes);

  std::size_t source_count() const { return _starts.size(); }
  bool empty() const { return _starts.empty(); }

  int64_t start_offset(std::size_t index) const { return _starts.at(index); }
  int64_t end_offset(std::size_t index) const { return _starts.at(index) + _sizes.at(index) - 1; }
  int64_t source_size(std::size_t index) const { return _sizes.at(index); }

  /// Sum of all source sizes
  int64_t total_size() const { return _total_size; }

  /**
   * @brief Find the source holding a logical offset
   * @return Index of the source, or std::nullopt if position < 0 or position >= total_size()
   */
  std::optional<std::size_t> resolve(int64_t position) const;

  /// Index of the first source after index that owns at least one byte
  std::optional<std::size_t> next_non_empty(std::size_t index) const;

private:
  std::vector<int64_t> _starts;
  std::vector<int64_t> _sizes;
  int64_t _total_size = 0;
};

} // namespace catstream
