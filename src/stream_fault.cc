// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/stream_fault.h"
#include "stream_fault_util.h"

#include <cstring>
#include <mutex>
#include <utility>

namespace catstream {

namespace {

std::mutex &fault_callback_mutex() {
  static std::mutex mutex;
  return mutex;
}

FaultCallback &fault_callback_slot() {
  static FaultCallback callback;
  return callback;
}

} // namespace

const char *source_operation_name(SourceOperation operation) {
  switch (operation) {
  case SourceOperation::Read:
    return "read";
  case SourceOperation::Seek:
    return "seek";
  case SourceOperation::Close:
    return "close";
  }
  return "unknown";
}

void register_fault_callback(FaultCallback callback) {
  std::lock_guard<std::mutex> lock(fault_callback_mutex());
  fault_callback_slot() = std::move(callback);
}

void dispatch_registered_fault(const StreamFault &fault) {
  FaultCallback callback;
  {
    std::lock_guard<std::mutex> lock(fault_callback_mutex());
    callback = fault_callback_slot();
  }
  if (callback) {
    callback(fault);
  }
}

std::string format_errno_error(const std::string &prefix, int err) {
  if (err == 0) {
    return prefix;
  }
  return prefix + ": " + std::strerror(err);
}

std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err) {
  return format_errno_error(prefix + " '" + path + "'", err);
}

StreamFault make_source_fault(const std::string &label, std::size_t index, SourceOperation operation, const std::string &detail, int err) {
  StreamFault fault;
  fault.stream_label = label;
  fault.source_index = index;
  fault.operation = operation;
  fault.errno_value = err;

  std::string message = "Failed to " + std::string(source_operation_name(operation)) + " source #" + std::to_string(index);
  if (!detail.empty()) {
    message += " (" + detail + ")";
  }
  if (!label.empty()) {
    message = label + ": " + message;
  }
  fault.message = format_errno_error(message, err);
  return fault;
}

} // namespace catstream
