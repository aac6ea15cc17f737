// python/bindings.cpp — Pybind11 module exposing fraclib parse/format.

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

#include <pybind11/pybind11.h>

#include <frac/fraclib.hpp>

namespace py = pybind11;

namespace {

void translate_error(std::exception_ptr pointer) {
    if (!pointer) {
        return;
    }
    try {
        std::rethrow_exception(pointer);
    } catch (const frac::range_error& failure) {
        PyErr_SetString(PyExc_OverflowError, failure.what());
    } catch (const frac::error& failure) {
        PyErr_SetString(PyExc_ValueError, failure.what());
    }
}

std::int64_t parse_bytes(const py::bytes& data, unsigned frac, int radix) {
    const std::string_view view = data;
    return frac::parse(view, frac, radix);
}

} // namespace

PYBIND11_MODULE(fraclib, module) {
    module.doc() = "Pybind11 bindings for fraclib fixed-fraction integer parsing and formatting";
    module.attr("MIN_RADIX") = frac::core::detail::MIN_RADIX;
    module.attr("MAX_RADIX") = frac::core::detail::MAX_RADIX;

    py::register_exception_translator(&translate_error);

    // bytes first: the std::string caster also accepts bytes.
    module.def("parse",
               &parse_bytes,
               py::arg("data"),
               py::arg("frac"),
               py::arg("radix") = 10,
               "Parse fractional text given as bytes");
    module.def("parse",
               [](const std::string& text, unsigned frac, int radix) {
                   return frac::parse(text, frac, radix);
               },
               py::arg("text"),
               py::arg("frac"),
               py::arg("radix") = 10,
               "Parse a fractional string into an integer scaled by radix**frac");
    module.def("format",
               [](std::int64_t value, unsigned frac, int radix) {
                   return frac::format(value, frac, radix);
               },
               py::arg("value"),
               py::arg("frac"),
               py::arg("radix") = 10,
               "Format a scaled integer as its minimal fractional string");

    module.def("parse_bin", &frac::parse_bin, py::arg("text"), py::arg("frac"));
    module.def("parse_oct", &frac::parse_oct, py::arg("text"), py::arg("frac"));
    module.def("parse_dec", &frac::parse_dec, py::arg("text"), py::arg("frac"));
    module.def("parse_hex", &frac::parse_hex, py::arg("text"), py::arg("frac"));
    module.def("format_bin", &frac::format_bin, py::arg("value"), py::arg("frac"));
    module.def("format_oct", &frac::format_oct, py::arg("value"), py::arg("frac"));
    module.def("format_dec", &frac::format_dec, py::arg("value"), py::arg("frac"));
    module.def("format_hex", &frac::format_hex, py::arg("value"), py::arg("frac"));
}
