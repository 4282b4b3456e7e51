// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/stream_error.h"

#include <utility>

namespace catstream {

namespace {

std::string join_fault_messages(const std::vector<StreamFault> &faults) {
  std::string message = "Failed to close " + std::to_string(faults.size()) + (faults.size() == 1 ? " source" : " sources");
  for (const auto &fault : faults) {
    message += "; " + fault.message;
  }
  return message;
}

} // namespace

SourceError::SourceError(StreamFault fault, std::size_t bytes_transferred, std::exception_ptr cause)
  : StreamError(fault.message)
  , _fault(std::move(fault))
  , _bytes_transferred(bytes_transferred)
  , _cause(std::move(cause)) {}

CloseError::CloseError(std::vector<StreamFault> faults)
  : StreamError(join_fault_messages(faults))
  , _faults(std::move(faults)) {}

} // namespace catstream
