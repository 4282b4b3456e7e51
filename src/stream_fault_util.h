// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#pragma once

#include "catstream/stream_fault.h"

#include <cstddef>
#include <string>

namespace catstream {

/// "prefix: strerror(err)", or just prefix when err is 0
std::string format_errno_error(const std::string &prefix, int err);

/// "prefix 'path': strerror(err)"
std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err);

/// Fault for source #index; the message is prefixed with label when it is not empty
StreamFault make_source_fault(const std::string &label, std::size_t index, SourceOperation operation, const std::string &detail, int err);

} // namespace catstream
