#include "jmatrix/math/LinearAlgebra.hpp"
#include "jmatrix/matrix/MatrixChecker.hpp"

#include <Eigen/Dense>

#include <vector>

namespace jmatrix {

namespace {

template <typename T>
using EigenMatrix = Eigen::Matrix<T, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

template <typename T>
EigenMatrix<T> to_eigen(const DenseMatrix<T>& m) {
    const auto& entries = *m.entries();
    const Eigen::Index rows = static_cast<Eigen::Index>(m.rows());
    const Eigen::Index cols = static_cast<Eigen::Index>(m.cols());
    EigenMatrix<T> out(rows, cols);
    for (Eigen::Index i = 0; i < rows; ++i) {
        for (Eigen::Index j = 0; j < cols; ++j) {
            out(i, j) = entries[i][j];
        }
    }
    return out;
}

template <typename T>
DenseMatrix<T> from_eigen(const EigenMatrix<T>& m) {
    // Operands never have empty rows, so an empty result is always 0 x 0.
    if (m.rows() == 0 || m.cols() == 0) {
        return DenseMatrix<T>::identity(0);
    }
    Entries<T> data(static_cast<size_t>(m.rows()), std::vector<T>(static_cast<size_t>(m.cols())));
    for (Eigen::Index i = 0; i < m.rows(); ++i) {
        for (Eigen::Index j = 0; j < m.cols(); ++j) {
            data[i][j] = m(i, j);
        }
    }
    return DenseMatrix<T>(data);
}

}

template <typename T>
DenseMatrix<T> add(const DenseMatrix<T>& a, const DenseMatrix<T>& b) {
    checker::require_non_null(a);
    checker::require_non_null(b);
    checker::require_same_dimensions(a, b);
    return from_eigen<T>(to_eigen(a) + to_eigen(b));
}

template <typename T>
DenseMatrix<T> subtract(const DenseMatrix<T>& a, const DenseMatrix<T>& b) {
    checker::require_non_null(a);
    checker::require_non_null(b);
    checker::require_same_dimensions(a, b);
    return from_eigen<T>(to_eigen(a) - to_eigen(b));
}

template <typename T>
DenseMatrix<T> matmul(const DenseMatrix<T>& a, const DenseMatrix<T>& b) {
    checker::require_non_null(a);
    checker::require_non_null(b);
    checker::require_multipliable(a, b);
    return from_eigen<T>(to_eigen(a) * to_eigen(b));
}

template <typename T>
DenseMatrix<T> multiply_scalar(const DenseMatrix<T>& m, T scalar) {
    checker::require_non_null(m);
    return from_eigen<T>(to_eigen(m) * scalar);
}

template <typename T>
DenseMatrix<T> transpose(const DenseMatrix<T>& m) {
    checker::require_non_null(m);
    return from_eigen<T>(to_eigen(m).transpose());
}

template <typename T>
T trace(const DenseMatrix<T>& m) {
    checker::require_square(m);
    return to_eigen(m).trace();
}

template <typename T>
T determinant(const DenseMatrix<T>& m) {
    checker::require_square(m);
    return to_eigen(m).determinant();
}

template DenseMatrix<double> add<double>(const DenseMatrix<double>&, const DenseMatrix<double>&);
template DenseMatrix<double> subtract<double>(const DenseMatrix<double>&, const DenseMatrix<double>&);
template DenseMatrix<double> matmul<double>(const DenseMatrix<double>&, const DenseMatrix<double>&);
template DenseMatrix<double> multiply_scalar<double>(const DenseMatrix<double>&, double);
template DenseMatrix<double> transpose<double>(const DenseMatrix<double>&);
template double trace<double>(const DenseMatrix<double>&);
template double determinant<double>(const DenseMatrix<double>&);

template DenseMatrix<float> add<float>(const DenseMatrix<float>&, const DenseMatrix<float>&);
template DenseMatrix<float> subtract<float>(const DenseMatrix<float>&, const DenseMatrix<float>&);
template DenseMatrix<float> matmul<float>(const DenseMatrix<float>&, const DenseMatrix<float>&);
template DenseMatrix<float> multiply_scalar<float>(const DenseMatrix<float>&, float);
template DenseMatrix<float> transpose<float>(const DenseMatrix<float>&);
template float trace<float>(const DenseMatrix<float>&);
template float determinant<float>(const DenseMatrix<float>&);

} // namespace jmatrix
