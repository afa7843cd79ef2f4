#pragma once
// Core bindings: Interval, Timestamp, formatting, parsing, duration literals

#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <tempo.hpp>

#include "py_types.hpp"

#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

namespace tempo_python {

inline void bind_core(nb::module_& m) {
    // =========================================================================
    // Enums
    // =========================================================================

    nb::enum_<tempo::Precision>(m, "Precision", "Most compact lossless sub-second precision")
        .value("second", tempo::Precision::second)
        .value("millisecond", tempo::Precision::millisecond)
        .value("microsecond", tempo::Precision::microsecond)
        .value("nanosecond", tempo::Precision::nanosecond)
        .def("__str__",
             [](tempo::Precision p) { return std::string(tempo::precision_string(p)); });

    m.attr("NANOSECONDS_PER_SECOND") = tempo::Interval::NANOSECONDS_PER_SECOND;

    // =========================================================================
    // Interval
    // =========================================================================

    nb::class_<tempo::Interval>(m, "Interval", "Signed span of time (seconds, nanoseconds)")
        .def(nb::init<int64_t, uint32_t>(), "Create from seconds and excess nanoseconds",
             "seconds"_a = 0, "nanoseconds"_a = 0)
        .def_static("from_milliseconds", &tempo::Interval::from_milliseconds, "ms"_a)
        .def_static("from_microseconds", &tempo::Interval::from_microseconds, "us"_a)
        .def_static("from_nanoseconds", &tempo::Interval::from_nanoseconds, "ns"_a)
        .def_static(
            "from_literal",
            [](std::string_view literal) {
                return unwrap(tempo::parse_duration_literal(literal), literal_error_type);
            },
            "Parse a duration literal such as '1h30m' or '-1.5s'", "literal"_a)
        .def_prop_ro("seconds", &tempo::Interval::seconds, "Whole seconds (floor)")
        .def_prop_ro("nanoseconds", &tempo::Interval::nanoseconds,
                     "Non-negative nanosecond residue")
        .def_prop_ro("precision", &tempo::Interval::precision)
        .def("as_milliseconds", &tempo::Interval::as_milliseconds)
        .def("as_microseconds", &tempo::Interval::as_microseconds)
        .def("to_seconds", &tempo::Interval::to_seconds, "Total seconds as a float")
        .def("is_zero", &tempo::Interval::is_zero)
        .def("is_negative", &tempo::Interval::is_negative)
        .def("__abs__", &tempo::Interval::abs)
        .def(nb::self + nb::self)
        .def(nb::self - nb::self)
        .def(-nb::self)
        .def(nb::self * int64_t())
        .def(int64_t() * nb::self)
        .def(nb::self / int64_t())
        .def(nb::self / nb::self)
        .def(nb::self == nb::self)
        .def(nb::self != nb::self)
        .def(nb::self < nb::self)
        .def(nb::self <= nb::self)
        .def(nb::self > nb::self)
        .def(nb::self >= nb::self)
        .def("__hash__", [](const tempo::Interval& i) { return std::hash<tempo::Interval>{}(i); })
        .def("__str__", [](const tempo::Interval& i) { return tempo::to_literal(i); })
        .def("__repr__", [](const tempo::Interval& i) {
            std::ostringstream oss;
            oss << "Interval(seconds=" << i.seconds() << ", nanoseconds=" << i.nanoseconds()
                << ")";
            return oss.str();
        });

    m.def(
        "parse_duration_literal",
        [](std::string_view literal) {
            return unwrap(tempo::parse_duration_literal(literal), literal_error_type);
        },
        "Parse a duration literal into an Interval", "literal"_a);
    m.def("to_literal", &tempo::to_literal, "Render an Interval as a duration literal",
          "interval"_a);

    // =========================================================================
    // Timestamp
    // =========================================================================

    nb::class_<tempo::Timestamp>(m, "Timestamp", "Instant since the Unix epoch")
        .def(nb::init<>())
        .def_static("from_epoch", &tempo::Timestamp::from_epoch, "seconds"_a,
                    "nanos"_a = 0)
        .def_static("now", &tempo::Timestamp::now, "Current system time")
        .def_static(
            "from_civil",
            [](int64_t year, uint8_t month, uint8_t day, uint8_t hour, uint8_t minute,
               uint8_t second, uint32_t nanos, std::optional<int32_t> utc_offset) {
                auto builder = tempo::Timestamp::ymd(year, month, day)
                                   .hms(hour, minute, second)
                                   .nanos(nanos);
                if (utc_offset) {
                    builder = builder.utc_offset(*utc_offset);
                }
                return builder.build();
            },
            "Build from calendar fields; raises ValueError on invalid fields", "year"_a,
            "month"_a, "day"_a, "hour"_a = 0, "minute"_a = 0, "second"_a = 0, "nanos"_a = 0,
            "utc_offset"_a = nb::none())
        .def_prop_ro("seconds", &tempo::Timestamp::seconds)
        .def_prop_ro("nanos", &tempo::Timestamp::nanos)
        .def_prop_ro("precision", &tempo::Timestamp::precision)
        .def_prop_ro(
            "utc_offset",
            [](const tempo::Timestamp& ts) {
                return unwrap(ts.utc_offset(), timezone_error_type);
            },
            "Offset east of UTC of the attached zone, in seconds")
        .def(
            "format",
            [](const tempo::Timestamp& ts, std::string_view pattern) {
                return unwrap(tempo::format(ts, pattern), format_error_type);
            },
            "Render with a strftime-style pattern", "pattern"_a)
        .def(nb::self + tempo::Interval())
        .def(nb::self - tempo::Interval())
        .def(nb::self - nb::self)
        .def(nb::self == nb::self)
        .def(nb::self != nb::self)
        .def(nb::self < nb::self)
        .def(nb::self <= nb::self)
        .def(nb::self > nb::self)
        .def(nb::self >= nb::self)
        .def("__hash__",
             [](const tempo::Timestamp& ts) { return std::hash<tempo::Timestamp>{}(ts); })
        .def("__str__",
             [](const tempo::Timestamp& ts) {
                 return unwrap(tempo::to_string(ts), format_error_type);
             })
        .def("__repr__", [](const tempo::Timestamp& ts) {
            std::ostringstream oss;
            oss << "Timestamp(" << ts << ")";
            return oss.str();
        });

    // =========================================================================
    // Parsing
    // =========================================================================

    m.def(
        "parse",
        [](std::string_view text, std::optional<std::string> pattern) {
            if (pattern) {
                return unwrap(tempo::parse(text, *pattern), parse_error_type);
            }
            return unwrap(tempo::parse(text), parse_error_type);
        },
        "Parse text with one pattern, or free-form when no pattern is given", "text"_a,
        "pattern"_a = nb::none());
    m.def(
        "parse_any",
        [](std::string_view text, const std::vector<std::string>& patterns) {
            std::vector<std::string_view> views(patterns.begin(), patterns.end());
            return unwrap(tempo::parse(text, std::span<const std::string_view>(views)),
                          parse_error_type);
        },
        "Parse text with the first matching pattern", "text"_a, "patterns"_a);
}

} // namespace tempo_python
