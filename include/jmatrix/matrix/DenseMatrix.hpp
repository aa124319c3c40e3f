#pragma once

#include "jmatrix/core/Errors.hpp"
#include "jmatrix/core/MatrixTraits.hpp"
#include "jmatrix/core/Types.hpp"
#include "jmatrix/matrix/ArrayChecker.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace jmatrix {

// Dense rows x cols matrix with value semantics. A default-constructed matrix
// holds no entries at all (the null state), which is distinct from an
// allocated matrix full of zeros.
template <typename T>
class DenseMatrix {
    static_assert(std::is_floating_point_v<T>, "DenseMatrix requires a floating point type");

public:
    DenseMatrix() = default;

    // Zero matrix.
    DenseMatrix(int64_t rows, int64_t cols) {
        create(rows, cols);
    }

    DenseMatrix(int64_t rows, int64_t cols, T value) {
        checker::require_valid_dimensions(rows, cols);
        entries_ = Entries<T>(static_cast<size_t>(rows), std::vector<T>(static_cast<size_t>(cols), value));
    }

    // Deep copy of data; throws InvalidTypeOrShapeError for empty or jagged input.
    explicit DenseMatrix(const Entries<T>& data) {
        create(data);
    }

    // Square n x n matrix with every cell set to value.
    static DenseMatrix filled(int64_t n, T value) {
        return DenseMatrix(n, n, value);
    }

    static DenseMatrix identity(int64_t n) {
        if (n < 0) {
            raise_error(InvalidSizeError("Size of identity matrix cannot be negative value."));
        }
        const size_t size = static_cast<size_t>(n);
        Entries<T> data(size, std::vector<T>(size, static_cast<T>(0)));
        for (size_t i = 0; i < size; ++i) {
            data[i][i] = static_cast<T>(1);
        }
        return adopt(std::move(data));
    }

    static constexpr const char* dtype() { return MatrixTraits<T>::name; }

    // Replaces any previous entries.
    void create(const Entries<T>& data) {
        checker::require_rectangular(data);
        entries_ = data;
    }

    void create(int64_t rows, int64_t cols) {
        checker::require_valid_dimensions(rows, cols);
        entries_ = Entries<T>(static_cast<size_t>(rows), std::vector<T>(static_cast<size_t>(cols), static_cast<T>(0)));
    }

    const std::optional<Entries<T>>& entries() const { return entries_; }

    std::optional<MatrixShape> get_size() const {
        if (!entries_) return std::nullopt;
        return MatrixShape{rows(), cols()};
    }

    bool is_null() const { return !entries_.has_value(); }

    // Counters; both are 0 for a null matrix.
    uint64_t rows() const { return entries_ ? entries_->size() : 0; }
    uint64_t cols() const { return (entries_ && !entries_->empty()) ? entries_->front().size() : 0; }

    T get(int64_t row, int64_t col) const {
        const auto [r, c] = resolve_index(row, col);
        return (*entries_)[r][c];
    }

    void set(int64_t row, int64_t col, T value) {
        const auto [r, c] = resolve_index(row, col);
        (*entries_)[r][c] = value;
    }

    void clear() {
        require_entries();
        for (auto& row : *entries_) {
            std::fill(row.begin(), row.end(), static_cast<T>(0));
        }
    }

    // Sorts every row in ascending order, in place.
    void sort() {
        require_entries();
        for (auto& row : *entries_) {
            std::sort(row.begin(), row.end());
        }
    }

    // Structural edits return a new matrix and leave this one untouched.
    // Indices may be negative; for insertion, -1 is the slot after the last
    // row or column. A row or column longer than the matrix is truncated.

    DenseMatrix add_row(const std::vector<T>& values) const {
        return insert_row(static_cast<int64_t>(rows()), values);
    }

    DenseMatrix add_column(const std::vector<T>& values) const {
        return insert_column(static_cast<int64_t>(cols()), values);
    }

    DenseMatrix insert_row(int64_t row, const std::vector<T>& values) const {
        require_entries();
        const size_t at = resolve_insert(row, rows(), "row");
        // An empty 0 x 0 matrix takes its width from the first row.
        const size_t width = rows() == 0 ? values.size() : static_cast<size_t>(cols());
        require_line(values, width, "column");

        Entries<T> data = *entries_;
        data.insert(data.begin() + at, std::vector<T>(values.begin(), values.begin() + width));
        return adopt(std::move(data));
    }

    DenseMatrix insert_column(int64_t col, const std::vector<T>& values) const {
        require_entries();
        const size_t at = resolve_insert(col, cols(), "column");
        const size_t height = rows() == 0 ? values.size() : static_cast<size_t>(rows());
        require_line(values, height, "row");

        Entries<T> data = rows() == 0 ? Entries<T>(height) : *entries_;
        for (size_t r = 0; r < height; ++r) {
            data[r].insert(data[r].begin() + at, values[r]);
        }
        return adopt(std::move(data));
    }

    DenseMatrix drop_row(int64_t row) const {
        require_entries();
        const size_t at = resolve_axis(row, rows(), "row");
        if (rows() == 1) {
            raise_error(InvalidSizeError("Cannot drop the only row of the matrix."));
        }
        Entries<T> data = *entries_;
        data.erase(data.begin() + at);
        return adopt(std::move(data));
    }

    DenseMatrix drop_column(int64_t col) const {
        require_entries();
        const size_t at = resolve_axis(col, cols(), "column");
        if (cols() == 1) {
            raise_error(InvalidSizeError("Cannot drop the only column of the matrix."));
        }
        Entries<T> data = *entries_;
        for (auto& r : data) {
            r.erase(r.begin() + at);
        }
        return adopt(std::move(data));
    }

    DenseMatrix swap_rows(int64_t row1, int64_t row2) const {
        require_entries();
        const size_t a = resolve_axis(row1, rows(), "row");
        const size_t b = resolve_axis(row2, rows(), "row");
        Entries<T> data = *entries_;
        std::swap(data[a], data[b]);
        return adopt(std::move(data));
    }

    DenseMatrix swap_columns(int64_t col1, int64_t col2) const {
        require_entries();
        const size_t a = resolve_axis(col1, cols(), "column");
        const size_t b = resolve_axis(col2, cols(), "column");
        Entries<T> data = *entries_;
        for (auto& r : data) {
            std::swap(r[a], r[b]);
        }
        return adopt(std::move(data));
    }

    // Square matrix with the given row and column removed. The minor of a
    // 1 x 1 matrix is the empty 0 x 0 matrix.
    DenseMatrix minor_matrix(int64_t row, int64_t col) const {
        require_entries();
        if (!is_square()) {
            raise_error(InvalidSizeError(
                "Matrix is non-square type. Please ensure the matrix has the same number of rows and columns."));
        }
        if (rows() == 1) {
            resolve_axis(row, rows(), "row");
            resolve_axis(col, cols(), "column");
            return adopt(Entries<T>{});
        }
        return drop_row(row).drop_column(col);
    }

    bool is_square() const {
        return entries_ && rows() == cols();
    }

    bool is_diagonal() const {
        return matches_pattern([](uint64_t i, uint64_t j) { return i == j; });
    }

    bool is_upper_triangular() const {
        return matches_pattern([](uint64_t i, uint64_t j) { return i <= j; });
    }

    bool is_lower_triangular() const {
        return matches_pattern([](uint64_t i, uint64_t j) { return i >= j; });
    }

    // At most max(rows, cols) cells are non-zero, treating magnitudes up to
    // ZERO_THRESHOLD as zero.
    bool is_sparse() const {
        require_entries();
        uint64_t non_zero = 0;
        for (const auto& row : *entries_) {
            for (T v : row) {
                if (std::abs(v) > static_cast<T>(ZERO_THRESHOLD)) ++non_zero;
            }
        }
        return non_zero <= std::max(rows(), cols());
    }

    bool is_identity() const {
        if (!is_diagonal()) return false;
        for (uint64_t i = 0; i < rows(); ++i) {
            if ((*entries_)[i][i] != static_cast<T>(1)) return false;
        }
        return true;
    }

    DenseMatrix deep_copy() const {
        DenseMatrix out;
        if (entries_) {
            out.entries_ = *entries_;
        }
        return out;
    }

    // Null equals null; otherwise shapes and every cell must match exactly.
    bool equals(const DenseMatrix& other) const {
        if (!entries_ || !other.entries_) {
            return !entries_ && !other.entries_;
        }
        return *entries_ == *other.entries_;
    }

    bool operator==(const DenseMatrix& other) const { return equals(other); }

    std::string to_string() const {
        if (!entries_) return "null";
        std::ostringstream oss;
        oss << "[";
        for (size_t r = 0; r < entries_->size(); ++r) {
            if (r > 0) oss << ", ";
            oss << "[";
            const auto& row = (*entries_)[r];
            for (size_t c = 0; c < row.size(); ++c) {
                if (c > 0) oss << ", ";
                oss << row[c];
            }
            oss << "]";
        }
        oss << "]";
        return oss.str();
    }

    static constexpr double ZERO_THRESHOLD = 1e-6;

private:
    static DenseMatrix adopt(Entries<T> data) {
        DenseMatrix out;
        out.entries_ = std::move(data);
        return out;
    }

    void require_entries() const {
        if (!entries_) {
            raise_error(NullContainerError("Matrix is null. Please ensure the matrix is initialized."));
        }
    }

    std::string size_string() const {
        return std::to_string(rows()) + "x" + std::to_string(cols());
    }

    // Negative indices count from the end.
    size_t resolve_axis(int64_t index, uint64_t extent, const char* axis) const {
        const int64_t n = static_cast<int64_t>(extent);
        const int64_t i = index < 0 ? index + n : index;
        if (i < 0 || i >= n) {
            raise_error(InvalidIndexError("Invalid " + std::string(axis) + " index: " + std::to_string(index) +
                                          " (matrix size: " + size_string() + ")"));
        }
        return static_cast<size_t>(i);
    }

    // Insertion slots run from 0 to extent inclusive; -1 is the last slot.
    size_t resolve_insert(int64_t index, uint64_t extent, const char* axis) const {
        const int64_t n = static_cast<int64_t>(extent);
        const int64_t i = index < 0 ? index + n + 1 : index;
        if (i < 0 || i > n) {
            raise_error(InvalidIndexError("Invalid " + std::string(axis) + " index: " + std::to_string(index) +
                                          " (matrix size: " + size_string() + ")"));
        }
        return static_cast<size_t>(i);
    }

    std::pair<size_t, size_t> resolve_index(int64_t row, int64_t col) const {
        require_entries();
        const size_t r = resolve_axis(row, rows(), "row");
        const size_t c = resolve_axis(col, cols(), "column");
        return {r, c};
    }

    static void require_line(const std::vector<T>& values, size_t expected, const char* axis) {
        if (values.empty()) {
            raise_error(InvalidTypeOrShapeError("Given array is empty. Cannot insert it into the matrix."));
        }
        if (values.size() < expected) {
            raise_error(InvalidSizeError("The length of array is less than matrix " + std::string(axis) +
                                         " count: " + std::to_string(values.size()) + " < " +
                                         std::to_string(expected)));
        }
    }

    // True iff square and every cell where keep(i, j) is false is exactly zero.
    template <typename Pred>
    bool matches_pattern(Pred keep) const {
        if (!is_square()) return false;
        const uint64_t n = rows();
        for (uint64_t i = 0; i < n; ++i) {
            for (uint64_t j = 0; j < n; ++j) {
                if (!keep(i, j) && (*entries_)[i][j] != static_cast<T>(0)) return false;
            }
        }
        return true;
    }

    std::optional<Entries<T>> entries_;
};

template <typename T>
std::ostream& operator<<(std::ostream& os, const DenseMatrix<T>& m) {
    return os << m.to_string();
}

using FloatMatrix = DenseMatrix<double>;
using Float32Matrix = DenseMatrix<float>;

} // namespace jmatrix
