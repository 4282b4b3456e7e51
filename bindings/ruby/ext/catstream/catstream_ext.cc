// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/concatenated_stream.h"
#include "catstream/file_source.h"
#include "catstream/stream_error.h"
#include "catstream/stream_fault.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>
#include <memory>
#include <ruby.h>
#include <ruby/encoding.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace catstream;

// Ruby module and class references
static VALUE mCatstream;
static VALUE cConcatenatedStream;
static VALUE eError;
static VALUE eConfigurationError;
static VALUE eInvalidArgumentError;
static VALUE eClosedError;
static VALUE eSourceError;
static VALUE eCloseError;
static VALUE eSourceOpenError;
static ID rb_id_read_method;
static ID rb_id_seek_method;
static ID rb_id_tell_method;
static ID rb_id_close_method;
static ID rb_id_call_method;

// Ruby exception raised inside a source or fault callback, re-raised once
// control is back in the calling Ruby method.
static VALUE g_pending_ruby_error = Qnil;

// Helper: Convert Ruby string to C++ string
static std::string rb_string_to_cpp(VALUE rb_str) {
  Check_Type(rb_str, T_STRING);
  return std::string(RSTRING_PTR(rb_str), RSTRING_LEN(rb_str));
}

// Helper: Convert C++ string to Ruby string
static VALUE cpp_string_to_rb(const std::string &str) { return rb_str_new(str.c_str(), str.length()); }

static void catstream_cleanup(VALUE) {
  register_fault_callback(FaultCallback{});
}

struct RubyCallbackHolder {
  explicit RubyCallbackHolder(VALUE proc)
      : proc_value(proc) {
    rb_gc_register_address(&proc_value);
  }

  ~RubyCallbackHolder() { rb_gc_unregister_address(&proc_value); }

  VALUE proc_value;
};

/// A Ruby method raised; the exception is parked in g_pending_ruby_error
class RubyCallbackError : public std::runtime_error {
public:
  explicit RubyCallbackError(const std::string &message)
      : std::runtime_error(message) {}
};

struct FuncallPayload {
  VALUE receiver;
  ID method;
  int argc;
  VALUE argv[2];
};

static VALUE invoke_funcall(VALUE data) {
  auto *payload = reinterpret_cast<FuncallPayload *>(data);
  return rb_funcallv(payload->receiver, payload->method, payload->argc, payload->argv);
}

// rb_funcall that never unwinds C++ frames: a Ruby exception becomes RubyCallbackError.
static VALUE protected_funcall(VALUE receiver, ID method, int argc, VALUE arg0 = Qnil, VALUE arg1 = Qnil) {
  FuncallPayload payload{ receiver, method, argc, { arg0, arg1 } };
  int state = 0;
  VALUE result = rb_protect(invoke_funcall, reinterpret_cast<VALUE>(&payload), &state);
  if (state != 0) {
    VALUE error = rb_errinfo();
    rb_set_errinfo(Qnil);
    std::string message = "Ruby ";
    if (NIL_P(error)) {
      message += "non-local exit";
    } else {
      g_pending_ruby_error = error;
      message += rb_obj_classname(error);
    }
    message += " raised by #" + std::string(rb_id2name(method));
    throw RubyCallbackError(message);
  }
  return result;
}

// Adapts a Ruby IO-like object (read/seek/tell, optional close) to ISeekableSource.
class RubyIOSource : public ISeekableSource {
public:
  explicit RubyIOSource(VALUE io)
      : _io(io)
      , _has_close(rb_respond_to(io, rb_id_close_method)) {}

  static void ensure_io_like(VALUE io) {
    if (!rb_respond_to(io, rb_id_read_method)) {
      rb_raise(rb_eTypeError, "sources must respond to #read");
    }
    if (!rb_respond_to(io, rb_id_seek_method) || !rb_respond_to(io, rb_id_tell_method)) {
      rb_raise(rb_eTypeError, "sources must respond to #seek and #tell");
    }
  }

  ssize_t read(void *buffer, size_t size) override {
    if (size == 0) {
      return 0;
    }
    VALUE result = protected_funcall(_io, rb_id_read_method, 1, SIZET2NUM(size));
    if (NIL_P(result)) {
      return 0;
    }
    if (!RB_TYPE_P(result, T_STRING)) {
      throw std::runtime_error("#read must return a String or nil");
    }
    const size_t length = static_cast<size_t>(RSTRING_LEN(result));
    if (length > size) {
      throw std::runtime_error("#read returned more bytes than requested");
    }
    std::memcpy(buffer, RSTRING_PTR(result), length);
    return static_cast<ssize_t>(length);
  }

  int64_t seek(int64_t offset, int whence) override {
    // IO#seek returns 0; the position comes from #tell.
    protected_funcall(_io, rb_id_seek_method, 2, LL2NUM(offset), INT2NUM(whence));
    VALUE position = protected_funcall(_io, rb_id_tell_method, 0);
    return static_cast<int64_t>(NUM2LL(position));
  }

  int close() override {
    if (_has_close) {
      protected_funcall(_io, rb_id_close_method, 0);
    }
    return 0;
  }

private:
  VALUE _io;
  bool _has_close;
};

//=============================================================================
// Faults and errors
//=============================================================================

static VALUE stream_fault_to_rb(const StreamFault &fault) {
  VALUE hash = rb_hash_new();
  static ID id_message = rb_intern("message");
  static ID id_label = rb_intern("label");
  static ID id_source_index = rb_intern("source_index");
  static ID id_operation = rb_intern("operation");
  static ID id_errno = rb_intern("errno");

  rb_hash_aset(hash, ID2SYM(id_message), cpp_string_to_rb(fault.message));
  rb_hash_aset(hash, ID2SYM(id_label), cpp_string_to_rb(fault.stream_label));
  rb_hash_aset(hash, ID2SYM(id_source_index), SIZET2NUM(fault.source_index));
  rb_hash_aset(hash, ID2SYM(id_operation), ID2SYM(rb_intern(source_operation_name(fault.operation))));
  rb_hash_aset(hash, ID2SYM(id_errno), INT2NUM(fault.errno_value));
  return hash;
}

static FaultCallback make_ruby_fault_callback(VALUE callable) {
  if (NIL_P(callable)) {
    return {};
  }

  if (!rb_respond_to(callable, rb_id_call_method)) {
    rb_raise(rb_eTypeError, "fault callback must respond to #call");
  }

  auto holder = std::make_shared<RubyCallbackHolder>(callable);

  return [holder](const StreamFault &fault) { protected_funcall(holder->proc_value, rb_id_call_method, 1, stream_fault_to_rb(fault)); };
}

static VALUE new_error(VALUE klass, const std::exception &e) { return rb_exc_new_cstr(klass, e.what()); }

// Map a C++ exception to the Ruby exception object to raise.
static VALUE exception_to_rb(const std::exception &e) {
  if (!NIL_P(g_pending_ruby_error)) {
    // The root cause is a Ruby exception from a source or callback.
    VALUE pending = g_pending_ruby_error;
    g_pending_ruby_error = Qnil;
    return pending;
  }

  if (const auto *source_error = dynamic_cast<const SourceError *>(&e)) {
    VALUE error = new_error(eSourceError, e);
    rb_iv_set(error, "@source_index", SIZET2NUM(source_error->source_index()));
    rb_iv_set(error, "@operation", ID2SYM(rb_intern(source_operation_name(source_error->operation()))));
    rb_iv_set(error, "@errno", INT2NUM(source_error->errno_value()));
    rb_iv_set(error, "@bytes_transferred", SIZET2NUM(source_error->bytes_transferred()));
    return error;
  }
  if (const auto *close_error = dynamic_cast<const CloseError *>(&e)) {
    VALUE faults = rb_ary_new_capa(static_cast<long>(close_error->faults().size()));
    for (const auto &fault : close_error->faults()) {
      rb_ary_push(faults, stream_fault_to_rb(fault));
    }
    VALUE error = new_error(eCloseError, e);
    rb_iv_set(error, "@faults", faults);
    return error;
  }
  if (const auto *open_error = dynamic_cast<const SourceOpenError *>(&e)) {
    VALUE error = new_error(eSourceOpenError, e);
    rb_iv_set(error, "@path", cpp_string_to_rb(open_error->path()));
    rb_iv_set(error, "@errno", INT2NUM(open_error->errno_value()));
    return error;
  }
  if (dynamic_cast<const ConfigurationError *>(&e)) {
    return new_error(eConfigurationError, e);
  }
  if (dynamic_cast<const InvalidArgumentError *>(&e)) {
    return new_error(eInvalidArgumentError, e);
  }
  if (dynamic_cast<const ClosedError *>(&e)) {
    return new_error(eClosedError, e);
  }
  if (dynamic_cast<const StreamError *>(&e)) {
    return new_error(eError, e);
  }
  return new_error(rb_eRuntimeError, e);
}

// Run fn and raise the translated Ruby exception once the C++ frames are gone.
template <typename Fn> static VALUE call_guarded(Fn &&fn) {
  g_pending_ruby_error = Qnil;
  VALUE error = Qnil;
  try {
    return fn();
  } catch (const std::exception &e) {
    error = exception_to_rb(e);
  }
  rb_exc_raise(error);
  return Qnil;
}

//=============================================================================
// ConcatenatedStream class
//=============================================================================

struct StreamWrapper {
  std::unique_ptr<ConcatenatedStream> stream;
  std::vector<VALUE> ios;
};

static void stream_wrapper_mark(void *ptr) {
  auto *wrapper = static_cast<StreamWrapper *>(ptr);
  for (VALUE io : wrapper->ios) {
    rb_gc_mark(io);
  }
}

static void stream_wrapper_free(void *ptr) {
  auto *wrapper = static_cast<StreamWrapper *>(ptr);
  delete wrapper;
}

static size_t stream_wrapper_memsize(const void *ptr) { return sizeof(StreamWrapper); }

static const rb_data_type_t stream_wrapper_type = {
  "Catstream::ConcatenatedStream",
  {
    stream_wrapper_mark,
    stream_wrapper_free,
    stream_wrapper_memsize,
  },
  nullptr,
  nullptr,
  RUBY_TYPED_FREE_IMMEDIATELY,
};

static StreamWrapper *get_stream_wrapper(VALUE self) {
  StreamWrapper *wrapper = nullptr;
  TypedData_Get_Struct(self, StreamWrapper, &stream_wrapper_type, wrapper);
  if (!wrapper) {
    rb_raise(rb_eRuntimeError, "invalid ConcatenatedStream wrapper");
  }
  return wrapper;
}

static ConcatenatedStream &stream_unwrap(VALUE self) {
  StreamWrapper *wrapper = get_stream_wrapper(self);
  if (!wrapper->stream) {
    rb_raise(rb_eRuntimeError, "ConcatenatedStream is not initialized");
  }
  return *wrapper->stream;
}

static VALUE stream_allocate(VALUE klass) {
  auto *wrapper = new StreamWrapper();
  return TypedData_Wrap_Struct(klass, &stream_wrapper_type, wrapper);
}

static ConcatenatedStreamOptions options_from_rb(VALUE opts) {
  ConcatenatedStreamOptions options;
  // The stream may be freed during GC where Ruby methods cannot run; sources
  // are closed explicitly through #close or left to Ruby's own finalizers.
  options.close_sources_on_destroy = false;
  if (NIL_P(opts)) {
    return options;
  }

  Check_Type(opts, T_HASH);
  static ID id_label = rb_intern("label");
  VALUE label = rb_hash_aref(opts, ID2SYM(id_label));
  if (!NIL_P(label)) {
    options.label = rb_string_to_cpp(StringValue(label));
  }
  return options;
}

static void install_stream(VALUE self, std::vector<std::unique_ptr<ISeekableSource>> sources, std::vector<VALUE> ios, ConcatenatedStreamOptions options) {
  StreamWrapper *wrapper = get_stream_wrapper(self);
  wrapper->ios = std::move(ios);
  call_guarded([&]() -> VALUE {
    wrapper->stream = std::make_unique<ConcatenatedStream>(std::move(sources), std::move(options));
    return Qnil;
  });
}

// ConcatenatedStream.new(*ios, label: nil) -> ConcatenatedStream
static VALUE stream_initialize(int argc, VALUE *argv, VALUE self) {
  StreamWrapper *wrapper = get_stream_wrapper(self);
  if (wrapper->stream) {
    rb_raise(rb_eRuntimeError, "ConcatenatedStream already initialized");
  }

  VALUE ios = Qnil;
  VALUE opts = Qnil;
  rb_scan_args(argc, argv, "*:", &ios, &opts);
  const long len = RARRAY_LEN(ios);
  for (long i = 0; i < len; ++i) {
    RubyIOSource::ensure_io_like(rb_ary_entry(ios, i));
  }
  ConcatenatedStreamOptions options = options_from_rb(opts);

  std::vector<VALUE> io_values;
  std::vector<std::unique_ptr<ISeekableSource>> sources;
  for (long i = 0; i < len; ++i) {
    VALUE io = rb_ary_entry(ios, i);
    io_values.push_back(io);
    sources.push_back(std::make_unique<RubyIOSource>(io));
  }

  install_stream(self, std::move(sources), std::move(io_values), std::move(options));
  return self;
}

static VALUE stream_close_helper(VALUE self);

// ConcatenatedStream.open(*paths, label: nil) { |stream| ... } -> stream or block result
static VALUE stream_s_open(int argc, VALUE *argv, VALUE klass) {
  VALUE paths = Qnil;
  VALUE opts = Qnil;
  rb_scan_args(argc, argv, "*:", &paths, &opts);
  if (RARRAY_LEN(paths) == 1 && RB_TYPE_P(rb_ary_entry(paths, 0), T_ARRAY)) {
    paths = rb_ary_entry(paths, 0);
  }
  ConcatenatedStreamOptions options = options_from_rb(opts);
  options.close_sources_on_destroy = true;

  std::vector<std::string> path_list;
  const long len = RARRAY_LEN(paths);
  for (long i = 0; i < len; ++i) {
    VALUE item = rb_ary_entry(paths, i);
    path_list.push_back(rb_string_to_cpp(StringValue(item)));
  }

  VALUE self = stream_allocate(klass);
  call_guarded([&]() -> VALUE {
    std::vector<std::unique_ptr<ISeekableSource>> sources;
    for (const auto &path : path_list) {
      sources.push_back(FileSource::open(path));
    }
    get_stream_wrapper(self)->stream = std::make_unique<ConcatenatedStream>(std::move(sources), std::move(options));
    return Qnil;
  });

  if (rb_block_given_p()) {
    return rb_ensure(rb_yield, self, stream_close_helper, self);
  }
  return self;
}

// ConcatenatedStream#read(length = nil) -> String or nil
static VALUE stream_read(int argc, VALUE *argv, VALUE self) {
  VALUE length_value = Qnil;
  rb_scan_args(argc, argv, "01", &length_value);
  ConcatenatedStream &stream = stream_unwrap(self);

  int64_t requested = -1;
  if (!NIL_P(length_value)) {
    requested = NUM2LL(length_value);
    if (requested < 0) {
      rb_raise(rb_eArgError, "negative length %lld given", static_cast<long long>(requested));
    }
  }

  int64_t size = requested;
  if (size < 0) {
    size = std::max<int64_t>(stream.size() - stream.tell(), 0);
  }
  if (static_cast<uint64_t>(size) > static_cast<uint64_t>(std::numeric_limits<long>::max())) {
    rb_raise(rb_eRangeError, "requested length exceeds platform limits");
  }

  VALUE result = rb_str_buf_new(static_cast<long>(size));
  ssize_t bytes_read = 0;
  call_guarded([&]() -> VALUE {
    bytes_read = stream.read(RSTRING_PTR(result), static_cast<size_t>(size));
    return Qnil;
  });
  rb_str_set_len(result, static_cast<long>(bytes_read));

  // IO semantics: read(positive) at the end returns nil, read() returns "".
  if (requested > 0 && bytes_read == 0) {
    return Qnil;
  }
  rb_enc_associate(result, rb_ascii8bit_encoding());
  return result;
}

// ConcatenatedStream#seek(offset, whence = IO::SEEK_SET) -> Integer position
static VALUE stream_seek(int argc, VALUE *argv, VALUE self) {
  VALUE offset_value = Qnil;
  VALUE whence_value = Qnil;
  rb_scan_args(argc, argv, "11", &offset_value, &whence_value);
  ConcatenatedStream &stream = stream_unwrap(self);

  const int64_t offset = NUM2LL(offset_value);
  const int whence = NIL_P(whence_value) ? SEEK_SET : NUM2INT(whence_value);
  int64_t position = 0;
  call_guarded([&]() -> VALUE {
    position = stream.seek(offset, whence);
    return Qnil;
  });
  return LL2NUM(position);
}

static VALUE stream_tell(VALUE self) { return LL2NUM(stream_unwrap(self).tell()); }

static VALUE stream_size(VALUE self) { return LL2NUM(stream_unwrap(self).size()); }

static VALUE stream_is_eof(VALUE self) { return stream_unwrap(self).at_end() ? Qtrue : Qfalse; }

static VALUE stream_source_count(VALUE self) { return SIZET2NUM(stream_unwrap(self).source_count()); }

static VALUE stream_is_closed(VALUE self) { return stream_unwrap(self).is_closed() ? Qtrue : Qfalse; }

// ConcatenatedStream#close -> nil
static VALUE stream_close(VALUE self) {
  ConcatenatedStream &stream = stream_unwrap(self);
  call_guarded([&]() -> VALUE {
    stream.close();
    return Qnil;
  });
  return Qnil;
}

static VALUE stream_close_helper(VALUE self) { return stream_close(self); }

// Catstream.on_fault(callable = nil) { |fault| ... }
static VALUE catstream_on_fault(int argc, VALUE *argv, VALUE self) {
  VALUE callback = Qnil;
  rb_scan_args(argc, argv, "01", &callback);

  if (!NIL_P(callback) && rb_block_given_p()) {
    rb_raise(rb_eArgError, "provide callable argument or block, not both");
  }

  if (NIL_P(callback) && rb_block_given_p()) {
    callback = rb_block_proc();
  }

  if (NIL_P(callback)) {
    register_fault_callback(FaultCallback{});
    return self;
  }

  FaultCallback cb = make_ruby_fault_callback(callback);
  register_fault_callback(std::move(cb));
  return self;
}

//=============================================================================
// Module initialization
//=============================================================================

extern "C" void Init_catstream() {
  mCatstream = rb_define_module("Catstream");

  rb_id_read_method = rb_intern("read");
  rb_id_seek_method = rb_intern("seek");
  rb_id_tell_method = rb_intern("tell");
  rb_id_close_method = rb_intern("close");
  rb_id_call_method = rb_intern("call");

  rb_gc_register_address(&g_pending_ruby_error);

  // Error hierarchy
  eError = rb_define_class_under(mCatstream, "Error", rb_eStandardError);
  eConfigurationError = rb_define_class_under(mCatstream, "ConfigurationError", eError);
  eInvalidArgumentError = rb_define_class_under(mCatstream, "InvalidArgumentError", eError);
  eClosedError = rb_define_class_under(mCatstream, "ClosedError", eError);
  eSourceError = rb_define_class_under(mCatstream, "SourceError", eError);
  rb_define_attr(eSourceError, "source_index", 1, 0);
  rb_define_attr(eSourceError, "operation", 1, 0);
  rb_define_attr(eSourceError, "errno", 1, 0);
  rb_define_attr(eSourceError, "bytes_transferred", 1, 0);
  eCloseError = rb_define_class_under(mCatstream, "CloseError", eError);
  rb_define_attr(eCloseError, "faults", 1, 0);
  eSourceOpenError = rb_define_class_under(mCatstream, "SourceOpenError", eError);
  rb_define_attr(eSourceOpenError, "path", 1, 0);
  rb_define_attr(eSourceOpenError, "errno", 1, 0);

  // Define ConcatenatedStream class
  cConcatenatedStream = rb_define_class_under(mCatstream, "ConcatenatedStream", rb_cObject);
  rb_define_alloc_func(cConcatenatedStream, stream_allocate);
  rb_define_method(cConcatenatedStream, "initialize", RUBY_METHOD_FUNC(stream_initialize), -1);
  rb_define_singleton_method(cConcatenatedStream, "open", RUBY_METHOD_FUNC(stream_s_open), -1);
  rb_define_method(cConcatenatedStream, "read", RUBY_METHOD_FUNC(stream_read), -1);
  rb_define_method(cConcatenatedStream, "seek", RUBY_METHOD_FUNC(stream_seek), -1);
  rb_define_method(cConcatenatedStream, "tell", RUBY_METHOD_FUNC(stream_tell), 0);
  rb_define_method(cConcatenatedStream, "pos", RUBY_METHOD_FUNC(stream_tell), 0);
  rb_define_method(cConcatenatedStream, "size", RUBY_METHOD_FUNC(stream_size), 0);
  rb_define_method(cConcatenatedStream, "eof?", RUBY_METHOD_FUNC(stream_is_eof), 0);
  rb_define_method(cConcatenatedStream, "source_count", RUBY_METHOD_FUNC(stream_source_count), 0);
  rb_define_method(cConcatenatedStream, "close", RUBY_METHOD_FUNC(stream_close), 0);
  rb_define_method(cConcatenatedStream, "closed?", RUBY_METHOD_FUNC(stream_is_closed), 0);

  rb_define_module_function(mCatstream, "on_fault", RUBY_METHOD_FUNC(catstream_on_fault), -1);

  rb_set_end_proc(catstream_cleanup, Qnil);
}
