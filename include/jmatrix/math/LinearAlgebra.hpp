#pragma once

#include "jmatrix/matrix/DenseMatrix.hpp"

namespace jmatrix {

// Arithmetic over dense matrices. Every operation returns a new matrix and
// leaves its operands untouched. Null operands throw NullContainerError;
// incompatible shapes throw InvalidSizeError.
// Instantiated for double and float only.

template <typename T>
DenseMatrix<T> add(const DenseMatrix<T>& a, const DenseMatrix<T>& b);

template <typename T>
DenseMatrix<T> subtract(const DenseMatrix<T>& a, const DenseMatrix<T>& b);

template <typename T>
DenseMatrix<T> matmul(const DenseMatrix<T>& a, const DenseMatrix<T>& b);

template <typename T>
DenseMatrix<T> multiply_scalar(const DenseMatrix<T>& m, T scalar);

template <typename T>
DenseMatrix<T> transpose(const DenseMatrix<T>& m);

// Requires a square matrix.
template <typename T>
T trace(const DenseMatrix<T>& m);

// LU-based; the determinant of the empty 0 x 0 matrix is 1.
template <typename T>
T determinant(const DenseMatrix<T>& m);

} // namespace jmatrix
