#pragma once
// Shared helpers for tempo bindings

#include <nanobind/nanobind.h>

#include <tempo.hpp>

#include <string>
#include <utility>

namespace nb = nanobind;

namespace tempo_python {

// Exception type pointers (set during module init)
extern PyObject* format_error_type;
extern PyObject* parse_error_type;
extern PyObject* literal_error_type;
extern PyObject* timezone_error_type;

/// Raise `type` with `message` as a Python exception
[[noreturn]] inline void raise_error(PyObject* type, const std::string& message) {
    PyErr_SetString(type, message.c_str());
    throw nb::python_error();
}

/// Unwrap an expected, raising `type` with the error's message on failure
template <typename T, typename E>
T unwrap(tempo::expected<T, E> result, PyObject* type) {
    if (!result.has_value()) {
        raise_error(type, result.error().message());
    }
    return std::move(*result);
}

} // namespace tempo_python
