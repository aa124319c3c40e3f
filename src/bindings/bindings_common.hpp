#pragma once
#include <pybind11/pybind11.h>
#include <pybind11/operators.h>
#include <pybind11/stl.h>

namespace py = pybind11;

void bind_core_classes(py::module_& m);
void bind_matrix_classes(py::module_& m);
