#pragma once

#include <cstdint>
#include <vector>

namespace jmatrix {

// Row-major nested storage; every inner vector has the same length.
template <typename T>
using Entries = std::vector<std::vector<T>>;

struct MatrixShape {
    uint64_t rows = 0;
    uint64_t cols = 0;

    bool operator==(const MatrixShape& other) const = default;
};

} // namespace jmatrix
