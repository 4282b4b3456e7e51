// SPDX-License-Identifier: MIT
// Copyright (c) 2025 catstream Team

#include "catstream/concatenated_stream.h"
#include "catstream/file_source.h"
#include "catstream/stream_error.h"
#include "catstream/stream_fault.h"
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace catstream;

namespace {

py::dict stream_fault_to_python(const StreamFault &fault) {
  py::dict result;
  result[py::str("message")] = py::str(fault.message);
  result[py::str("label")] = py::str(fault.stream_label);
  result[py::str("source_index")] = py::int_(fault.source_index);
  result[py::str("operation")] = py::str(source_operation_name(fault.operation));
  result[py::str("errno")] = py::int_(fault.errno_value);
  return result;
}

FaultCallback make_python_fault_callback(const py::object &callable) {
  if (callable.is_none()) {
    return {};
  }
  if (!PyCallable_Check(callable.ptr())) {
    throw py::type_error("fault callback must be callable");
  }
  py::function func = py::reinterpret_borrow<py::function>(callable);
  return [func = std::move(func)](const StreamFault &fault) {
    py::gil_scoped_acquire gil;
    func(stream_fault_to_python(fault));
  };
}

// Adapts a Python file-like object (read/seek, optional close) to ISeekableSource.
// Python exceptions raised by the object propagate as py::error_already_set and
// are wrapped by the stream as SourceError.
class PyObjectSource : public ISeekableSource {
public:
  explicit PyObjectSource(py::object io)
      : io_(std::move(io))
      , closable_(py::hasattr(io_, "close")) {
    if (!py::hasattr(io_, "read")) {
      throw py::type_error("source objects must provide a read() method");
    }
    if (!py::hasattr(io_, "seek")) {
      throw py::type_error("source objects must provide a seek() method");
    }
  }

  ssize_t read(void *buffer, size_t size) override {
    if (size == 0) {
      return 0;
    }
    py::gil_scoped_acquire gil;
    py::object result = io_.attr("read")(py::int_(size));
    if (result.is_none()) {
      return 0;
    }
    py::bytes data = py::reinterpret_borrow<py::bytes>(py::bytes(result));
    Py_ssize_t length = PyBytes_Size(data.ptr());
    if (length < 0) {
      throw py::error_already_set();
    }
    if (length == 0) {
      return 0;
    }
    if (static_cast<size_t>(length) > size) {
      throw std::runtime_error("read() returned more bytes than requested");
    }
    char *raw = PyBytes_AsString(data.ptr());
    if (!raw) {
      throw py::error_already_set();
    }
    std::memcpy(buffer, raw, static_cast<size_t>(length));
    return static_cast<ssize_t>(length);
  }

  int64_t seek(int64_t offset, int whence) override {
    py::gil_scoped_acquire gil;
    py::object result = io_.attr("seek")(py::int_(offset), py::int_(whence));
    // Some file-likes return None from seek(); ask tell() instead.
    if (result.is_none()) {
      if (!py::hasattr(io_, "tell")) {
        throw py::type_error("seek() returned None and the object has no tell()");
      }
      result = io_.attr("tell")();
    }
    return result.cast<int64_t>();
  }

  int close() override {
    if (!closable_) {
      return 0;
    }
    py::gil_scoped_acquire gil;
    io_.attr("close")();
    return 0;
  }

private:
  py::object io_;
  bool closable_;
};

class PyConcatenatedStream {
public:
  PyConcatenatedStream(const py::iterable &sources, std::optional<std::string> label)
      : stream_(std::make_unique<ConcatenatedStream>(wrap_sources(sources), make_options(label))) {}

  PyConcatenatedStream(std::vector<std::unique_ptr<ISeekableSource>> sources, std::optional<std::string> label)
      : stream_(std::make_unique<ConcatenatedStream>(std::move(sources), make_options(label))) {}

  static std::unique_ptr<PyConcatenatedStream> from_paths(const std::vector<std::string> &paths, std::optional<std::string> label) {
    std::vector<std::unique_ptr<ISeekableSource>> sources;
    sources.reserve(paths.size());
    for (const auto &path : paths) {
      sources.push_back(FileSource::open(path));
    }
    return std::make_unique<PyConcatenatedStream>(std::move(sources), std::move(label));
  }

  py::bytes read(std::optional<int64_t> size = std::nullopt) {
    int64_t requested = size.has_value() ? *size : -1;
    if (requested < 0) {
      requested = std::max<int64_t>(stream_->size() - stream_->tell(), 0);
    }
    if (static_cast<uint64_t>(requested) > static_cast<uint64_t>(std::numeric_limits<ssize_t>::max())) {
      throw py::value_error("Requested size exceeds platform limits");
    }

    std::string buffer(static_cast<size_t>(requested), '\0');
    const ssize_t bytes_read = stream_->read(buffer.data(), buffer.size());
    buffer.resize(static_cast<size_t>(bytes_read));
    return py::bytes(buffer);
  }

  int64_t seek(int64_t offset, int whence = SEEK_SET) { return stream_->seek(offset, whence); }

  int64_t tell() const { return stream_->tell(); }
  int64_t size() const { return stream_->size(); }
  size_t source_count() const { return stream_->source_count(); }
  size_t current_source() const { return stream_->current_source(); }
  bool closed() const { return stream_->is_closed(); }

  void close() { stream_->close(); }

  PyConcatenatedStream &enter() { return *this; }

  void exit(py::object exc_type, py::object exc_value, py::object traceback) { stream_->close(); }

  std::string repr() const {
    return "<ConcatenatedStream sources=" + std::to_string(stream_->source_count()) + " size=" + std::to_string(stream_->size()) +
           " position=" + std::to_string(stream_->tell()) + (stream_->is_closed() ? " closed" : "") + ">";
  }

private:
  static ConcatenatedStreamOptions make_options(const std::optional<std::string> &label) {
    ConcatenatedStreamOptions options;
    if (label) {
      options.label = *label;
    }
    return options;
  }

  static std::vector<std::unique_ptr<ISeekableSource>> wrap_sources(const py::iterable &sources) {
    if (py::isinstance<py::str>(sources) || py::isinstance<py::bytes>(sources)) {
      throw py::type_error("sources must be a sequence of file-like objects");
    }
    std::vector<std::unique_ptr<ISeekableSource>> wrapped;
    for (py::handle item : sources) {
      wrapped.push_back(std::make_unique<PyObjectSource>(py::reinterpret_borrow<py::object>(item)));
    }
    return wrapped;
  }

  std::unique_ptr<ConcatenatedStream> stream_;
};

} // namespace

PYBIND11_MODULE(catstream, m) {
  m.doc() = "Python bindings for catstream, a seekable stream over concatenated sources";

  static py::exception<StreamError> stream_error(m, "StreamError", PyExc_IOError);
  static py::exception<ConfigurationError> configuration_error(m, "ConfigurationError", stream_error.ptr());
  static py::exception<InvalidArgumentError> invalid_argument_error(m, "InvalidArgumentError", stream_error.ptr());
  static py::exception<ClosedError> closed_error(m, "ClosedError", stream_error.ptr());
  static py::exception<SourceError> source_error(m, "SourceError", stream_error.ptr());
  static py::exception<CloseError> close_error(m, "CloseError", stream_error.ptr());
  static py::exception<SourceOpenError> source_open_error(m, "SourceOpenError", stream_error.ptr());

  // Most derived first; the base translator catches whatever is left.
  py::register_exception_translator([](std::exception_ptr p) {
    try {
      if (p) {
        std::rethrow_exception(p);
      }
    } catch (const SourceError &e) {
      py::object instance = py::handle(source_error.ptr())(e.what());
      instance.attr("source_index") = py::int_(e.source_index());
      instance.attr("operation") = py::str(source_operation_name(e.operation()));
      instance.attr("errno") = py::int_(e.errno_value());
      instance.attr("bytes_transferred") = py::int_(e.bytes_transferred());
      PyErr_SetObject(source_error.ptr(), instance.ptr());
    } catch (const CloseError &e) {
      py::list faults;
      for (const auto &fault : e.faults()) {
        faults.append(stream_fault_to_python(fault));
      }
      py::object instance = py::handle(close_error.ptr())(e.what());
      instance.attr("faults") = faults;
      PyErr_SetObject(close_error.ptr(), instance.ptr());
    } catch (const SourceOpenError &e) {
      py::object instance = py::handle(source_open_error.ptr())(e.what());
      instance.attr("path") = py::str(e.path());
      instance.attr("errno") = py::int_(e.errno_value());
      PyErr_SetObject(source_open_error.ptr(), instance.ptr());
    } catch (const ConfigurationError &e) {
      configuration_error(e.what());
    } catch (const InvalidArgumentError &e) {
      invalid_argument_error(e.what());
    } catch (const ClosedError &e) {
      closed_error(e.what());
    } catch (const StreamError &e) {
      stream_error(e.what());
    }
  });

  m.def("on_fault",
        [](const py::object &callback) { register_fault_callback(make_python_fault_callback(callback)); }, py::arg("callback") = py::none(),
        "Register or clear the global StreamFault callback (None clears)");

  m.attr("SEEK_SET") = py::int_(SEEK_SET);
  m.attr("SEEK_CUR") = py::int_(SEEK_CUR);
  m.attr("SEEK_END") = py::int_(SEEK_END);

  py::class_<PyConcatenatedStream>(m, "ConcatenatedStream")
      .def(py::init<const py::iterable &, std::optional<std::string>>(), py::arg("sources"), py::arg("label") = py::none(),
           "Concatenate file-like objects (read/seek, optional close) into one seekable stream")
      .def_static("from_paths", &PyConcatenatedStream::from_paths, py::arg("paths"), py::arg("label") = py::none(),
                  "Open each path as a source and concatenate them in order")
      .def("read", &PyConcatenatedStream::read, py::arg("size") = py::none(), "Read up to size bytes (default: read until the end)")
      .def("seek", &PyConcatenatedStream::seek, py::arg("offset"), py::arg("whence") = SEEK_SET, "Move the logical cursor and return the new position")
      .def("tell", &PyConcatenatedStream::tell, "Get the logical position")
      .def_property_readonly("size", &PyConcatenatedStream::size, "Total size of all sources in bytes")
      .def_property_readonly("source_count", &PyConcatenatedStream::source_count, "Number of sources")
      .def_property_readonly("current_source", &PyConcatenatedStream::current_source, "Index of the source holding the cursor")
      .def_property_readonly("closed", &PyConcatenatedStream::closed, "Whether close() has been called")
      .def("close", &PyConcatenatedStream::close, "Close every source; raises CloseError listing failures")
      .def("readable", [](const PyConcatenatedStream &) { return true; })
      .def("seekable", [](const PyConcatenatedStream &) { return true; })
      .def("__enter__", &PyConcatenatedStream::enter, py::return_value_policy::reference_internal)
      .def("__exit__", &PyConcatenatedStream::exit)
      .def("__repr__", &PyConcatenatedStream::repr);

  m.attr("__version__") = "0.1.0";
}
