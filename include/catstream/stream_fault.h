// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace catstream {

/// Operation of an underlying source that produced a fault
enum class SourceOperation {
  Read,
  Seek,
  Close,
};

const char *source_operation_name(SourceOperation operation);

/**
 * @brief Describes one failure of one source operation
 *
 * Faults are attached to SourceError/CloseError exceptions and are also
 * delivered to the callback registered with register_fault_callback().
 */
struct StreamFault {
  std::string message;                               ///< Human readable description including the cause
  std::string stream_label;                          ///< ConcatenatedStreamOptions::label of the stream
  std::size_t source_index = 0;                      ///< 0-based index of the failing source
  SourceOperation operation = SourceOperation::Read; ///< Operation that failed
  int errno_value = 0;                               ///< errno reported by the source (0 when unknown)
};

using FaultCallback = std::function<void(const StreamFault &)>;

/**
 * @brief Install the process-wide fault callback
 *
 * Passing an empty callback clears the registration. Registration is
 * thread-safe; the callback itself runs on the thread that hit the fault.
 */
void register_fault_callback(FaultCallback callback);

/// Deliver a fault to the registered callback, if any
void dispatch_registered_fault(const StreamFault &fault);

} // namespace catstream
