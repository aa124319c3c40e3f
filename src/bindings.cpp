#include "bindings/bindings_common.hpp"

PYBIND11_MODULE(_jmatrix, m) {
    m.doc() = "JMatrix: dense matrices with structured error codes";

    bind_core_classes(m);
    bind_matrix_classes(m);
}
