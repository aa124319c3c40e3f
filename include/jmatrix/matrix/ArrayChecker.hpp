#pragma once

#include "jmatrix/core/Errors.hpp"
#include "jmatrix/core/Types.hpp"

#include <cstdint>
#include <string>

namespace jmatrix::checker {

// Both dimensions must be strictly positive.
inline void require_valid_dimensions(int64_t rows, int64_t cols) {
    if (rows < 0) {
        raise_error(InvalidSizeError("Value for number of rows cannot be negative value."));
    }
    if (cols < 0) {
        raise_error(InvalidSizeError("Value for number of columns cannot be negative value."));
    }
    if (rows == 0 || cols == 0) {
        raise_error(InvalidSizeError("Cannot create a matrix with zero size between rows and columns."));
    }
}

// Rejects an empty outer array, empty rows and rows of unequal length.
template <typename T>
void require_rectangular(const Entries<T>& data) {
    if (data.empty()) {
        raise_error(InvalidTypeOrShapeError(
            "Given two-dimensional array is null. Please ensure the array has valid elements."));
    }
    const size_t cols = data.front().size();
    if (cols == 0) {
        raise_error(InvalidTypeOrShapeError(
            "Given two-dimensional array has empty rows. Please ensure the array has valid elements."));
    }
    for (size_t r = 1; r < data.size(); ++r) {
        if (data[r].size() != cols) {
            raise_error(InvalidTypeOrShapeError(
                "Given two-dimensional array is jagged: row " + std::to_string(r) + " has " +
                std::to_string(data[r].size()) + " columns, expected " + std::to_string(cols)));
        }
    }
}

} // namespace jmatrix::checker
