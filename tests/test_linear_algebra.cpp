#include <gtest/gtest.h>
#include "jmatrix/core/RaiseConfig.hpp"
#include "jmatrix/math/LinearAlgebra.hpp"

using namespace jmatrix;

class LinearAlgebraTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_raise_mode(RaiseMode::Manual);
        a = FloatMatrix(a_data);
        b = FloatMatrix(b_data);
    }

    void TearDown() override {
        reset_raise_mode();
    }

    const Entries<double> a_data = {
        {1, 2},
        {3, 4},
    };
    const Entries<double> b_data = {
        {5, 6},
        {7, 8},
    };
    FloatMatrix a;
    FloatMatrix b;
};

TEST_F(LinearAlgebraTest, AddAndSubtract) {
    const Entries<double> sum = {
        {6, 8},
        {10, 12},
    };
    const Entries<double> diff = {
        {-4, -4},
        {-4, -4},
    };
    EXPECT_EQ(add(a, b), FloatMatrix(sum));
    EXPECT_EQ(subtract(a, b), FloatMatrix(diff));

    // Operands are left untouched.
    EXPECT_EQ(*a.entries(), a_data);
    EXPECT_EQ(*b.entries(), b_data);
}

TEST_F(LinearAlgebraTest, Matmul) {
    const Entries<double> product = {
        {19, 22},
        {43, 50},
    };
    EXPECT_EQ(matmul(a, b), FloatMatrix(product));
    EXPECT_EQ(matmul(a, FloatMatrix::identity(2)), a);

    const Entries<double> row = {{1, 2, 3}};
    const Entries<double> col = {{4}, {5}, {6}};
    FloatMatrix dot = matmul(FloatMatrix(row), FloatMatrix(col));
    EXPECT_EQ(*dot.get_size(), (MatrixShape{1, 1}));
    EXPECT_EQ(dot.get(0, 0), 32.0);

    FloatMatrix outer = matmul(FloatMatrix(col), FloatMatrix(row));
    EXPECT_EQ(*outer.get_size(), (MatrixShape{3, 3}));
    EXPECT_EQ(outer.get(2, 2), 18.0);
}

TEST_F(LinearAlgebraTest, ScalarAndTranspose) {
    const Entries<double> doubled = {
        {2, 4},
        {6, 8},
    };
    EXPECT_EQ(multiply_scalar(a, 2.0), FloatMatrix(doubled));

    const Entries<double> wide = {
        {1, 2, 3},
        {4, 5, 6},
    };
    FloatMatrix t = transpose(FloatMatrix(wide));
    EXPECT_EQ(*t.get_size(), (MatrixShape{3, 2}));
    EXPECT_EQ(t.get(2, 0), 3.0);
    EXPECT_EQ(t.get(0, 1), 4.0);
    EXPECT_EQ(transpose(t), FloatMatrix(wide));
}

TEST_F(LinearAlgebraTest, Trace) {
    EXPECT_EQ(trace(a), 5.0);
    EXPECT_EQ(trace(FloatMatrix::identity(7)), 7.0);
    EXPECT_EQ(trace(FloatMatrix::identity(0)), 0.0);
}

TEST_F(LinearAlgebraTest, Determinant) {
    EXPECT_DOUBLE_EQ(determinant(a), -2.0);
    EXPECT_DOUBLE_EQ(determinant(FloatMatrix::identity(5)), 1.0);
    EXPECT_DOUBLE_EQ(determinant(FloatMatrix::filled(3, 4.0)), 0.0);

    const Entries<double> upper = {
        {2, 1, 7},
        {0, 3, -4},
        {0, 0, 5},
    };
    EXPECT_NEAR(determinant(FloatMatrix(upper)), 30.0, 1e-9);
    EXPECT_DOUBLE_EQ(determinant(FloatMatrix::identity(0)), 1.0);

    EXPECT_THROW(determinant(FloatMatrix(2, 3)), InvalidSizeError);
    EXPECT_THROW(determinant(FloatMatrix()), NullContainerError);
}

TEST_F(LinearAlgebraTest, TransposeTwiceRestoresShape) {
    const Entries<double> column = {{1}, {2}, {3}};
    FloatMatrix m(column);
    FloatMatrix t = transpose(m);
    EXPECT_EQ(*t.get_size(), (MatrixShape{1, 3}));
    EXPECT_EQ(transpose(t), m);
}

TEST_F(LinearAlgebraTest, IdentityOfSizeZeroRoundTrips) {
    FloatMatrix empty = FloatMatrix::identity(0);
    FloatMatrix t = transpose(empty);
    EXPECT_FALSE(t.is_null());
    EXPECT_EQ(*t.get_size(), (MatrixShape{0, 0}));
    EXPECT_EQ(transpose(t), empty);
}

TEST_F(LinearAlgebraTest, RejectsBadOperands) {
    FloatMatrix null_matrix;
    EXPECT_THROW(add(a, null_matrix), NullContainerError);
    EXPECT_THROW(matmul(null_matrix, b), NullContainerError);
    EXPECT_THROW(transpose(null_matrix), NullContainerError);
    EXPECT_THROW(trace(null_matrix), NullContainerError);

    FloatMatrix wide(2, 3);
    EXPECT_THROW(add(a, wide), InvalidSizeError);
    EXPECT_THROW(subtract(wide, a), InvalidSizeError);
    EXPECT_THROW(matmul(wide, a), InvalidSizeError);
    EXPECT_THROW(trace(wide), InvalidSizeError);
    EXPECT_NO_THROW(matmul(a, wide));
}

TEST_F(LinearAlgebraTest, SinglePrecision) {
    Float32Matrix i3 = Float32Matrix::identity(3);
    Float32Matrix scaled = multiply_scalar(i3, 2.5f);
    EXPECT_EQ(scaled.get(1, 1), 2.5f);
    EXPECT_EQ(trace(scaled), 7.5f);
    EXPECT_TRUE(add(i3, i3).is_diagonal());
}
