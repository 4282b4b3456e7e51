// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/boundary_table.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace catstream {

BoundaryTable::BoundaryTable(const std::vector<int64_t> &sizes) {
  _starts.reserve(sizes.size());
  _sizes.reserve(sizes.size());

  int64_t next_start = 0;
  for (const int64_t size : sizes) {
    if (size < 0) {
      throw std::invalid_argument("Source size cannot be negative");
    }
    if (size > std::numeric_limits<int64_t>::max() - next_start) {
      throw std::overflow_error("Concatenated size exceeds the 64-bit offset range");
    }
    _starts.push_back(next_start);
    _sizes.push_back(size);
    next_start += size;
  }
  _total_size = next_start;
}

std::optional<std::size_t> BoundaryTable::resolve(int64_t position) const {
  if (position < 0 || position >= _total_size) {
    return std::nullopt;
  }

  // Zero-length sources share their start with the following source, so the
  // last start <= position always belongs to a source that owns bytes.
  const auto it = std::upper_bound(_starts.begin(), _starts.end(), position);
  return static_cast<std::size_t>(std::distance(_starts.begin(), it) - 1);
}

std::optional<std::size_t> BoundaryTable::next_non_empty(std::size_t index) const {
  for (std::size_t next = index + 1; next < _sizes.size(); ++next) {
    if (_sizes[next] > 0) {
      return next;
    }
  }
  return std::nullopt;
}

} // namespace catstream
