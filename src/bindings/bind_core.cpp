#include "bindings_common.hpp"

#include "jmatrix/core/DebugTrace.hpp"
#include "jmatrix/core/ErrorCode.hpp"
#include "jmatrix/core/Errors.hpp"
#include "jmatrix/core/RaiseConfig.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace jmatrix;

void bind_core_classes(py::module_& m) {
    // Translators run in reverse registration order, so the base goes first.
    auto& base = py::register_exception<JMatrixError>(m, "JMatrixError", PyExc_RuntimeError);
    py::register_exception<InvalidSizeError>(m, "InvalidSizeError", base.ptr());
    py::register_exception<InvalidTypeOrShapeError>(m, "InvalidTypeOrShapeError", base.ptr());
    py::register_exception<NullContainerError>(m, "NullContainerError", base.ptr());
    py::register_exception<InvalidIndexError>(m, "InvalidIndexError", base.ptr());
    py::register_exception<UnknownCodeError>(m, "UnknownCodeError", base.ptr());

    py::class_<ErrorCode>(m, "ErrorCode")
        .def_property_readonly("errno", &ErrorCode::get_errno)
        .def_property_readonly("errno_str", &ErrorCode::get_errno_str)
        .def_property_readonly("code", [](const ErrorCode& ec) { return std::string(ec.get_code()); })
        .def_property_readonly("message", [](const ErrorCode& ec) { return std::string(ec.get_message()); })
        .def_static("values", []() {
            const auto& all = ErrorCode::values();
            return std::vector<ErrorCode>(all.begin(), all.end());
        })
        .def_static("from_code", [](const std::string& code) { return ErrorCode::from_code(code); }, py::arg("code"))
        .def(py::self == py::self)
        .def("__hash__", &ErrorCode::get_errno)
        .def("__str__", &ErrorCode::to_string)
        .def("__repr__", [](const ErrorCode& ec) { return "<ErrorCode " + ec.to_string() + ">"; });

    // int -> errno lookup, str -> strict mnemonic lookup, anything else -> None.
    m.def(
        "error_code_of",
        [](const py::object& value) -> std::optional<ErrorCode> {
            if (py::isinstance<py::bool_>(value)) return std::nullopt;
            if (py::isinstance<py::int_>(value)) {
                // Integers beyond int64 cannot name any error number.
                try {
                    return ErrorCode::value_of(value.cast<int64_t>());
                } catch (const py::cast_error&) {
                    return std::nullopt;
                }
            }
            if (py::isinstance<py::str>(value)) return ErrorCode::value_of(value.cast<std::string>());
            return std::nullopt;
        },
        py::arg("value"));

    m.def(
        "set_raise_mode",
        [](const std::string& mode) { set_raise_mode(parse_raise_mode(mode)); },
        py::arg("mode"));
    m.def("get_raise_mode", []() { return std::string(raise_mode_name(get_raise_mode())); });
    m.def("reset_raise_mode", &reset_raise_mode);

    m.def("_debug_last_error", &debug_trace::get_last_error);
    m.def("_debug_clear", &debug_trace::clear);
}
