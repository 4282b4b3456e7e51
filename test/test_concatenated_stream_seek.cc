// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/concatenated_stream.h"
#include "source_fixtures.h"

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace catstream;
using namespace catstream::testing;

namespace {

bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << message << std::endl;
    return false;
  }
  return true;
}

void report_result(const std::string &name, bool success) { std::cout << "[" << (success ? "PASS" : "FAIL") << "] " << name << std::endl; }

const std::vector<std::string> kContents = { "ABCDE", "FGH", "IJKL" };

int total_seeks(const ScriptedSet &set) {
  int seeks = 0;
  for (const auto &probe : set.probes) {
    seeks += probe->seeks;
  }
  return seeks;
}

template <typename Error, typename Fn> bool throws(Fn &&fn) {
  try {
    fn();
  } catch (const Error &) {
    return true;
  }
  return false;
}

bool test_seek_current_zero_is_a_no_op() {
  auto set = make_scripted_sources(kContents);
  auto probes = set.probes;
  ScriptedSet observed;
  observed.probes = probes;
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  const int before = total_seeks(observed);
  ok = expect(stream.seek(0, SEEK_CUR) == 0, "seek(0, current) on a new stream should return 0") && ok;
  ok = expect(total_seeks(observed) == before, "seek(0, current) should not touch any source") && ok;

  stream.seek(9, SEEK_SET);
  const int after_move = total_seeks(observed);
  ok = expect(stream.seek(0, SEEK_CUR) == 9, "seek(0, current) should return the current position") && ok;
  ok = expect(stream.seek(0, Origin::Current) == 9, "Origin overload should behave the same") && ok;
  ok = expect(total_seeks(observed) == after_move, "seek(0, current) should still not touch any source") && ok;
  ok = expect(stream.tell() == 9 && stream.current_source() == 2, "cursor should be unchanged") && ok;
  return ok;
}

bool test_end_origin_rules() {
  auto set = make_scripted_sources(kContents);
  ScriptedSet observed;
  observed.probes = set.probes;
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  stream.seek(3, SEEK_SET);
  const int before = total_seeks(observed);
  ok = expect(throws<InvalidArgumentError>([&] { stream.seek(1, SEEK_END); }), "seek(1, end) should throw InvalidArgumentError") && ok;
  ok = expect(total_seeks(observed) == before, "rejected seek should not touch any source") && ok;
  ok = expect(stream.tell() == 3, "rejected seek should not move the cursor") && ok;

  ok = expect(stream.seek(-1, SEEK_END) == 11, "seek(-1, end) should land on the last byte") && ok;
  ok = expect(read_string(stream, 1) == "L", "byte at total_size - 1 should be L") && ok;

  ok = expect(stream.seek(0, SEEK_END) == 12, "seek(0, end) should land at end of stream") && ok;
  ok = expect(stream.current_source() == 2, "end of stream should be addressed through the last source") && ok;
  ok = expect(read_string(stream, 4).empty(), "read at end of stream should return nothing") && ok;

  ok = expect(stream.seek(-12, SEEK_END) == 0, "seek(-total, end) should land on 0") && ok;
  ok = expect(read_string(stream, 2) == "AB", "read after seek(-total, end) should start at the first byte") && ok;
  return ok;
}

bool test_invalid_origins_are_rejected() {
  auto set = make_scripted_sources(kContents);
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  ok = expect(throws<InvalidArgumentError>([&] { stream.seek(0, 3); }), "whence 3 should throw InvalidArgumentError") && ok;
  ok = expect(throws<InvalidArgumentError>([&] { stream.seek(0, -1); }), "whence -1 should throw InvalidArgumentError") && ok;
  ok = expect(throws<StreamError>([&] { stream.seek(0, 12345); }), "InvalidArgumentError should be a StreamError") && ok;
  ok = expect(!stream.has_failed(), "invalid arguments should not fail the stream") && ok;
  return ok;
}

bool test_relative_seeks() {
  auto set = make_scripted_sources(kContents);
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  ok = expect(stream.seek(3, SEEK_CUR) == 3, "seek(3, current) from 0 should be 3") && ok;
  ok = expect(read_string(stream, 3) == "DEF", "read after relative seek should cross the boundary") && ok;
  ok = expect(stream.seek(-4, SEEK_CUR) == 2, "seek(-4, current) from 6 should be 2") && ok;
  ok = expect(stream.current_source() == 0, "position 2 is held by source 0") && ok;
  ok = expect(stream.seek(6, SEEK_CUR) == 8, "seek(6, current) from 2 should be 8") && ok;
  ok = expect(stream.current_source() == 2, "position 8 is held by source 2") && ok;
  ok = expect(read_string(stream, 10) == "IJKL", "read from 8 should return the last source") && ok;
  return ok;
}

bool test_out_of_range_targets_clamp() {
  auto set = make_scripted_sources(kContents);
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  ok = expect(stream.seek(100, SEEK_SET) == 12, "forward overshoot from start should clamp to total size") && ok;
  ok = expect(stream.current_source() == 2, "forward overshoot should clamp to the last source") && ok;
  ok = expect(read_string(stream, 1).empty(), "read after forward overshoot should signal end of stream") && ok;

  stream.seek(10, SEEK_SET);
  ok = expect(stream.seek(5, SEEK_CUR) == 12, "forward overshoot from current should clamp to total size") && ok;

  ok = expect(stream.seek(-100, SEEK_END) == 0, "backward undershoot from end should clamp to 0") && ok;
  ok = expect(stream.current_source() == 0, "backward undershoot should clamp to the first source") && ok;

  stream.seek(7, SEEK_SET);
  ok = expect(stream.seek(-20, SEEK_CUR) == 0, "backward undershoot from current should clamp to 0") && ok;
  ok = expect(stream.seek(-1, SEEK_SET) == 0, "negative absolute offset should clamp to 0") && ok;
  ok = expect(read_string(stream, 1) == "A", "read after clamping to 0 should return the first byte") && ok;

  stream.seek(5, SEEK_SET);
  ok = expect(stream.seek(std::numeric_limits<int64_t>::max(), SEEK_CUR) == 12, "overflowing relative seek should clamp to total size") && ok;
  ok = expect(stream.seek(std::numeric_limits<int64_t>::max(), SEEK_SET) == 12, "INT64_MAX from start should clamp to total size") && ok;
  ok = expect(stream.seek(std::numeric_limits<int64_t>::min(), SEEK_END) == 0, "INT64_MIN from end should clamp to 0") && ok;
  return ok;
}

bool test_every_position_reads_the_concatenated_byte() {
  const std::vector<std::string> contents = { "ABCDE", "FGH", "", "IJKL", "M" };
  const std::string expected = concatenate(contents);
  auto set = make_scripted_sources(contents);
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  // Visit positions out of order so every source is re-entered from elsewhere.
  const int64_t total = static_cast<int64_t>(expected.size());
  for (int64_t step = 0; step < total; ++step) {
    const int64_t p = (step * 7) % total;
    ok = expect(stream.seek(p, SEEK_SET) == p, "seek should return the requested position " + std::to_string(p)) && ok;
    const std::string byte = read_string(stream, 1);
    ok = expect(byte.size() == 1 && byte[0] == expected[static_cast<std::size_t>(p)], "byte mismatch at position " + std::to_string(p)) && ok;
  }
  return ok;
}

bool test_failed_local_seek_is_fatal() {
  auto set = make_scripted_sources(kContents);
  set.probes[1]->fail_local_seek = true;
  ConcatenatedStream stream(std::move(set.sources));

  bool ok = true;
  stream.seek(2, SEEK_SET);
  try {
    stream.seek(6, SEEK_SET);
    ok = expect(false, "seek into a source whose local seek fails should throw") && ok;
  } catch (const SourceError &error) {
    ok = expect(error.source_index() == 1, "failure should name source #1") && ok;
    ok = expect(error.operation() == SourceOperation::Seek, "failure should be a seek") && ok;
    ok = expect(error.errno_value() == EIO, "failure should carry the source errno") && ok;
  }
  ok = expect(stream.has_failed(), "stream should be in the failed state") && ok;
  ok = expect(stream.tell() == 2, "failed seek should not move the cursor") && ok;

  ok = expect(throws<ClosedError>([&] { stream.seek(0, SEEK_SET); }), "seek on a failed stream should throw ClosedError") && ok;
  ok = expect(throws<ClosedError>([&] { stream.seek(0, SEEK_CUR); }), "even the seek(0, current) fast path should throw ClosedError") && ok;
  ok = expect(throws<ClosedError>([&] {
                char byte;
                stream.read(&byte, 1);
              }),
              "read on a failed stream should throw ClosedError") &&
       ok;

  // close() still releases every source of a failed stream.
  stream.close();
  ok = expect(stream.is_closed(), "failed stream should still close") && ok;
  return ok;
}

} // namespace

int main() {
  bool all = true;
  auto run = [&all](const std::string &name, bool (*test)()) {
    bool success = false;
    try {
      success = test();
    } catch (const std::exception &ex) {
      std::cerr << name << ": unexpected exception: " << ex.what() << std::endl;
    }
    report_result(name, success);
    all = all && success;
  };

  run("seek_current_zero_is_a_no_op", test_seek_current_zero_is_a_no_op);
  run("end_origin_rules", test_end_origin_rules);
  run("invalid_origins_are_rejected", test_invalid_origins_are_rejected);
  run("relative_seeks", test_relative_seeks);
  run("out_of_range_targets_clamp", test_out_of_range_targets_clamp);
  run("every_position_reads_the_concatenated_byte", test_every_position_reads_the_concatenated_byte);
  run("failed_local_seek_is_fatal", test_failed_local_seek_is_fatal);

  if (!all) {
    return 1;
  }

  std::cout << "ConcatenatedStream seek tests passed" << std::endl;
  return 0;
}
