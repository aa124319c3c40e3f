#pragma once

#include "jmatrix/core/Errors.hpp"
#include "jmatrix/matrix/ArrayChecker.hpp"
#include "jmatrix/matrix/DenseMatrix.hpp"

#include <string>

namespace jmatrix::checker {

// Matrix-level preconditions. An empty message selects the default text for
// the check.

template <typename T>
void require_non_null(const DenseMatrix<T>& m, const std::string& message = "") {
    if (m.is_null()) {
        raise_error(NullContainerError(message));
    }
}

template <typename T>
void require_square(const DenseMatrix<T>& m, const std::string& message = "") {
    require_non_null(m);
    if (!m.is_square()) {
        raise_error(InvalidSizeError(message.empty()
            ? "Matrix is non-square type. Please ensure the matrix has the same number of rows and columns."
            : message));
    }
}

template <typename T>
void require_same_dimensions(const DenseMatrix<T>& a, const DenseMatrix<T>& b, const std::string& message = "") {
    if (a.rows() != b.rows() || a.cols() != b.cols()) {
        raise_error(InvalidSizeError(message.empty() ? "Matrices must have the same dimensions" : message));
    }
}

template <typename T>
void require_multipliable(const DenseMatrix<T>& a, const DenseMatrix<T>& b) {
    if (a.cols() != b.rows()) {
        raise_error(InvalidSizeError(
            "Cannot multiply a " + std::to_string(a.rows()) + "x" + std::to_string(a.cols()) +
            " matrix by a " + std::to_string(b.rows()) + "x" + std::to_string(b.cols()) + " matrix"));
    }
}

} // namespace jmatrix::checker
