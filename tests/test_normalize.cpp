// Tests for per-axis parameter and axis normalization

#include "ndfourier_test_utils.hpp"

#include <vector>

using namespace ndfourier;

// ============================================================================
// Axis normalization
// ============================================================================

TEST(NormalizeAxis, NonNegativeAxesAreUnchanged) {
    for (size_t ndim = 1; ndim <= 5; ++ndim) {
        for (int axis = 0; axis < static_cast<int>(ndim); ++axis) {
            EXPECT_EQ(normalize_axis(axis, ndim), static_cast<size_t>(axis));
        }
    }
}

TEST(NormalizeAxis, NegativeAxesCountFromTheEnd) {
    for (size_t ndim = 1; ndim <= 5; ++ndim) {
        const int rank = static_cast<int>(ndim);
        for (int axis = -rank; axis < 0; ++axis) {
            EXPECT_EQ(normalize_axis(axis, ndim),
                      static_cast<size_t>(rank + axis));
        }
    }
    EXPECT_EQ(normalize_axis(-1, 3), 2u);
    EXPECT_EQ(normalize_axis(-3, 3), 0u);
}

TEST(NormalizeAxis, OutOfRangeThrows) {
    EXPECT_THROW(normalize_axis(3, 3), IndexError);
    EXPECT_THROW(normalize_axis(-4, 3), IndexError);
    EXPECT_THROW(normalize_axis(100, 2), IndexError);
    // A 0-d array has no valid axis at all
    EXPECT_THROW(normalize_axis(0, 0), IndexError);
    EXPECT_THROW(normalize_axis(-1, 0), IndexError);
}

TEST(NormalizeAxis, ErrorMessageNamesAxisAndRank) {
    try {
        normalize_axis(5, 2);
        FAIL() << "expected IndexError";
    } catch (const IndexError &e) {
        EXPECT_NE(e.message().find("axis 5"), std::string::npos);
        EXPECT_NE(e.message().find("2 dimensions"), std::string::npos);
    }
}

// ============================================================================
// Sequence normalization
// ============================================================================

TEST(NormalizeSequence, ScalarIsBroadcastToEveryAxis) {
    for (size_t ndim = 1; ndim <= 6; ++ndim) {
        auto values = normalize_sequence(2.5, ndim);
        ASSERT_EQ(values.size(), ndim);
        for (double v : values) {
            EXPECT_EQ(v, 2.5);
        }
    }
}

TEST(NormalizeSequence, IntegerScalarIsBroadcastAsFloat64) {
    auto values = normalize_sequence(3, 2);
    EXPECT_EQ(values, (std::vector<double>{3.0, 3.0}));
    EXPECT_EQ(normalize_sequence(int64_t{-2}, 1), std::vector<double>{-2.0});
}

TEST(NormalizeSequence, ScalarOnZeroDimensionsIsEmpty) {
    EXPECT_TRUE(normalize_sequence(1.0, 0).empty());
}

TEST(NormalizeSequence, SequenceOfMatchingLengthIsKept) {
    auto values = normalize_sequence(std::vector<double>{1.0, 2.0, 3.0}, 3);
    EXPECT_EQ(values, (std::vector<double>{1.0, 2.0, 3.0}));
}

TEST(NormalizeSequence, SequenceLengthMismatchThrows) {
    EXPECT_THROW(normalize_sequence(std::vector<double>{1.0, 2.0}, 3),
                 ValueError);
    EXPECT_THROW(normalize_sequence(std::vector<double>{1.0, 2.0, 3.0, 4.0}, 3),
                 ValueError);
    EXPECT_THROW(normalize_sequence(std::vector<double>{}, 1), ValueError);
}

TEST(NormalizeSequence, ResultDoesNotAliasCallerSequence) {
    std::vector<double> sigma = {1.0, 2.0};
    auto values = normalize_sequence(sigma, 2);
    sigma[0] = 99.0;
    EXPECT_EQ(values[0], 1.0);
}

TEST(NormalizeSequence, TensorParameterIsConvertedToFloat64) {
    std::vector<int32_t> sizes = {3, 5};
    auto t = Tensor::from_vector(sizes);
    auto values = normalize_sequence(t, 2);
    EXPECT_EQ(values, (std::vector<double>{3.0, 5.0}));
}

TEST(NormalizeSequence, StridedTensorParameterIsCopiedInOrder) {
    // Column 1 of a 3x2 matrix is a view with a gap between elements
    std::vector<double> data = {0.0, 1.5, 0.0, 2.5, 0.0, 3.5};
    auto matrix = Tensor::from_data(data.data(), {3, 2});
    Tensor second_column(matrix.storage(), {3}, {matrix.strides()[0]},
                         DType::Float64, sizeof(double));
    ASSERT_FALSE(second_column.is_contiguous());

    auto values = normalize_sequence(second_column, 3);
    EXPECT_EQ(values, (std::vector<double>{1.5, 2.5, 3.5}));
}

TEST(NormalizeSequence, TensorParameterLengthMismatchThrows) {
    auto t = Tensor::ones({4}, DType::Float32);
    EXPECT_THROW(normalize_sequence(t, 3), ValueError);
}

TEST(NormalizeSequence, TensorParameterMustBeOneDimensional) {
    auto t = Tensor::ones({2, 2});
    EXPECT_THROW(normalize_sequence(t, 4), ShapeError);
}

TEST(NormalizeSequence, ComplexTensorParameterThrows) {
    auto t = Tensor::ones({2}, DType::Complex128);
    EXPECT_THROW(normalize_sequence(t, 2), TypeError);
}
