// tempo Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointers (declared extern in py_types.hpp)
namespace tempo_python {
PyObject* format_error_type = nullptr;
PyObject* parse_error_type = nullptr;
PyObject* literal_error_type = nullptr;
PyObject* timezone_error_type = nullptr;
} // namespace tempo_python

NB_MODULE(tempo, m) {
    m.doc() = "tempo - timestamps, intervals and duration literals";

    // Error types first: core bindings raise through them
    tempo_python::bind_errors(m);
    tempo_python::bind_core(m);
}
