#pragma once
// Error bindings: error code enums and Python exception types

#include <nanobind/nanobind.h>

#include <tempo.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempo_python {

inline void bind_errors(nb::module_& m) {
    // =========================================================================
    // ParseErrorCode enum
    // =========================================================================

    nb::enum_<tempo::ParseErrorCode>(m, "ParseErrorCode", "Reasons a parse can fail")
        .value("literal_mismatch", tempo::ParseErrorCode::literal_mismatch)
        .value("expected_digits", tempo::ParseErrorCode::expected_digits)
        .value("field_overflow", tempo::ParseErrorCode::field_overflow)
        .value("fraction_too_precise", tempo::ParseErrorCode::fraction_too_precise)
        .value("invalid_offset", tempo::ParseErrorCode::invalid_offset)
        .value("unknown_name", tempo::ParseErrorCode::unknown_name)
        .value("unknown_directive", tempo::ParseErrorCode::unknown_directive)
        .value("trailing_input", tempo::ParseErrorCode::trailing_input)
        .value("unexpected_end", tempo::ParseErrorCode::unexpected_end)
        .value("missing_date", tempo::ParseErrorCode::missing_date)
        .value("invalid_date", tempo::ParseErrorCode::invalid_date)
        .value("field_out_of_range", tempo::ParseErrorCode::field_out_of_range)
        .value("no_pattern_matched", tempo::ParseErrorCode::no_pattern_matched)
        .def("__str__", [](tempo::ParseErrorCode c) {
            return std::string(tempo::parse_error_string(c));
        });

    // =========================================================================
    // Custom Exceptions
    // =========================================================================

    // All tempo errors surface as ValueError subclasses
    format_error_type =
        nb::exception<std::runtime_error>(m, "FormatError", PyExc_ValueError).ptr();
    parse_error_type =
        nb::exception<std::runtime_error>(m, "ParseError", PyExc_ValueError).ptr();
    literal_error_type =
        nb::exception<std::runtime_error>(m, "DurationLiteralError", PyExc_ValueError).ptr();
    timezone_error_type =
        nb::exception<std::runtime_error>(m, "TimeZoneError", PyExc_ValueError).ptr();
}

} // namespace tempo_python
