#include "bindings_common.hpp"

#include "jmatrix/core/Types.hpp"
#include "jmatrix/math/LinearAlgebra.hpp"
#include "jmatrix/matrix/DenseMatrix.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace jmatrix;

namespace {

using Index2D = std::pair<int64_t, int64_t>;

template <typename T>
void bind_dense_matrix(py::module_& m, const char* name) {
    using Matrix = DenseMatrix<T>;

    py::class_<Matrix>(m, name)
        .def(py::init<>())
        .def(py::init<int64_t, int64_t>(), py::arg("rows"), py::arg("cols"))
        .def(py::init<int64_t, int64_t, T>(), py::arg("rows"), py::arg("cols"), py::arg("value"))
        .def(py::init<const Entries<T>&>(), py::arg("data"))
        .def_static("identity", &Matrix::identity, py::arg("n"))
        .def_static("filled", &Matrix::filled, py::arg("n"), py::arg("value"))
        .def_property_readonly_static("dtype", [](const py::object&) { return std::string(Matrix::dtype()); })
        .def("create", py::overload_cast<const Entries<T>&>(&Matrix::create), py::arg("data"))
        .def("create", py::overload_cast<int64_t, int64_t>(&Matrix::create), py::arg("rows"), py::arg("cols"))
        .def("entries", [](const Matrix& self) { return self.entries(); })
        .def("size", [](const Matrix& self) -> std::optional<std::pair<uint64_t, uint64_t>> {
            const auto shape = self.get_size();
            if (!shape) return std::nullopt;
            return std::make_pair(shape->rows, shape->cols);
        })
        .def_property_readonly("rows", &Matrix::rows)
        .def_property_readonly("cols", &Matrix::cols)
        .def("is_null", &Matrix::is_null)
        .def("is_square", &Matrix::is_square)
        .def("is_diagonal", &Matrix::is_diagonal)
        .def("is_identity", &Matrix::is_identity)
        .def("is_upper_triangular", &Matrix::is_upper_triangular)
        .def("is_lower_triangular", &Matrix::is_lower_triangular)
        .def("is_sparse", &Matrix::is_sparse)
        .def("clear", &Matrix::clear)
        .def("sort", &Matrix::sort)
        .def("add_row", &Matrix::add_row, py::arg("values"))
        .def("add_column", &Matrix::add_column, py::arg("values"))
        .def("insert_row", &Matrix::insert_row, py::arg("row"), py::arg("values"))
        .def("insert_column", &Matrix::insert_column, py::arg("col"), py::arg("values"))
        .def("drop_row", &Matrix::drop_row, py::arg("row"))
        .def("drop_column", &Matrix::drop_column, py::arg("col"))
        .def("swap_rows", &Matrix::swap_rows, py::arg("row1"), py::arg("row2"))
        .def("swap_columns", &Matrix::swap_columns, py::arg("col1"), py::arg("col2"))
        .def("minor_matrix", &Matrix::minor_matrix, py::arg("row"), py::arg("col"))
        .def("deep_copy", &Matrix::deep_copy)
        .def("__copy__", &Matrix::deep_copy)
        .def("__deepcopy__", [](const Matrix& self, const py::dict&) { return self.deep_copy(); }, py::arg("memo"))
        .def(py::self == py::self)
        .def("__getitem__", [](const Matrix& self, Index2D idx) { return self.get(idx.first, idx.second); })
        .def("__setitem__", [](Matrix& self, Index2D idx, T value) { self.set(idx.first, idx.second, value); })
        .def("__str__", &Matrix::to_string)
        .def("__repr__", [name](const Matrix& self) {
            return std::string(name) + "(" + self.to_string() + ")";
        });

    m.def("add", &jmatrix::add<T>, py::arg("a"), py::arg("b"));
    m.def("subtract", &jmatrix::subtract<T>, py::arg("a"), py::arg("b"));
    m.def("matmul", &jmatrix::matmul<T>, py::arg("a"), py::arg("b"));
    m.def("multiply_scalar", &jmatrix::multiply_scalar<T>, py::arg("m"), py::arg("scalar"));
    m.def("transpose", &jmatrix::transpose<T>, py::arg("m"));
    m.def("trace", &jmatrix::trace<T>, py::arg("m"));
    m.def("determinant", &jmatrix::determinant<T>, py::arg("m"));
}

}

void bind_matrix_classes(py::module_& m) {
    bind_dense_matrix<double>(m, "FloatMatrix");
    bind_dense_matrix<float>(m, "Float32Matrix");
}
