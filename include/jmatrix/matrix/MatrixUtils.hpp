#pragma once

#include "jmatrix/core/Types.hpp"
#include "jmatrix/matrix/DenseMatrix.hpp"

namespace jmatrix::utils {

template <typename T>
bool is_null_entries(const DenseMatrix<T>& m) {
    return m.is_null();
}

// False whenever either side is null.
template <typename T>
bool is_equal_size(const DenseMatrix<T>& a, const DenseMatrix<T>& b) {
    const auto sa = a.get_size();
    const auto sb = b.get_size();
    return sa && sb && *sa == *sb;
}

template <typename T>
bool is_equal_size(const Entries<T>& a, const Entries<T>& b) {
    if (a.empty() || b.empty()) return false;
    return a.size() == b.size() && a.front().size() == b.front().size();
}

// Exact cell-by-cell comparison; empty arrays never compare equal.
template <typename T>
bool is_equal(const Entries<T>& a, const Entries<T>& b) {
    return is_equal_size(a, b) && a == b;
}

} // namespace jmatrix::utils
