// Tests for the array container

#include "ndfourier_test_utils.hpp"

#include <vector>

using namespace ndfourier;
using namespace ndfourier::testing;

TEST(TensorBasic, Creation) {
    auto t1 = Tensor({3, 4}, DType::Float32);
    EXPECT_EQ(t1.ndim(), 2u);
    EXPECT_EQ(t1.shape()[0], 3u);
    EXPECT_EQ(t1.shape()[1], 4u);
    EXPECT_EQ(t1.size(), 12u);
    EXPECT_EQ(t1.dtype(), DType::Float32);
    EXPECT_EQ(t1.strides(), (Strides{16, 4}));
    EXPECT_TRUE(t1.is_contiguous());
    EXPECT_TRUE(t1.flags().owndata);

    auto t2 = Tensor({2, 3, 4});
    EXPECT_EQ(t2.dtype(), DType::Float64);
    EXPECT_EQ(t2.nbytes(), 24u * 8u);
}

TEST(TensorBasic, ZerosAndOnes) {
    auto z = Tensor::zeros({2, 3}, DType::Complex128);
    ExpectAllZero(z);

    auto o = Tensor::ones({2, 2}, DType::Complex64);
    ExpectTensorNear(o, std::vector<complex128_t>(4, {1.0, 0.0}), 0.0);

    auto i = Tensor::ones({3}, DType::Int32);
    const int32_t *data = i.typed_data<int32_t>();
    for (size_t k = 0; k < i.size(); ++k) {
        EXPECT_EQ(data[k], 1);
    }
}

TEST(TensorBasic, ZeroSizedAndScalarShapes) {
    auto empty = Tensor::zeros({0, 4});
    EXPECT_EQ(empty.size(), 0u);
    EXPECT_TRUE(empty.empty());

    auto scalar = Tensor::ones(Shape{}, DType::Float32);
    EXPECT_EQ(scalar.ndim(), 0u);
    EXPECT_EQ(scalar.size(), 1u);
    EXPECT_EQ(scalar.item<float>({}), 1.0f);
}

TEST(TensorBasic, ItemAndSetItem) {
    auto t = Tensor::zeros({2, 3});
    t.set_item<double>({0, 1}, 5.0);
    EXPECT_EQ(t.item<double>({0, 1}), 5.0);
    EXPECT_EQ(t.typed_data<double>()[1], 5.0);

    EXPECT_THROW(t.item<double>({2, 0}), IndexError);
    EXPECT_THROW(t.item<double>({0}), ShapeError);
    EXPECT_THROW(t.set_item<float>({0, 0}, 1.0f), TypeError);
}

TEST(TensorBasic, ItemRejectsMismatchedType) {
    auto t = Tensor::ones({2, 2}, DType::Float32);
    EXPECT_EQ(t.item<float>({1, 1}), 1.0f);
    EXPECT_THROW(t.item<double>({1, 1}), TypeError);
    EXPECT_THROW(t.item<int32_t>({0, 0}), TypeError);

    auto spectrum = Tensor::ones({2}, DType::Complex64);
    EXPECT_THROW(spectrum.item<complex128_t>({0}), TypeError);
}

TEST(TensorBasic, CopiesShareStorageUntilCloned) {
    auto a = Tensor::zeros({4});
    Tensor alias = a;
    alias.set_item<double>({2}, 1.0);
    EXPECT_EQ(a.item<double>({2}), 1.0);
    EXPECT_TRUE(alias.shares_storage(a));

    auto copy = a.copy();
    copy.set_item<double>({2}, 9.0);
    EXPECT_EQ(a.item<double>({2}), 1.0);
    EXPECT_FALSE(copy.shares_storage(a));
}

TEST(TensorBasic, TransposeIsStridedView) {
    std::vector<float> data = {0, 1, 2, 3, 4, 5};
    auto t = Tensor::from_data(data.data(), {2, 3});
    auto tt = t.transpose();

    EXPECT_EQ(tt.shape(), (Shape{3, 2}));
    EXPECT_FALSE(tt.is_contiguous());
    EXPECT_TRUE(tt.shares_storage(t));
    EXPECT_EQ(tt.item<float>({2, 1}), 5.0f);
    EXPECT_EQ(tt.item<float>({1, 0}), 1.0f);

    auto c = tt.ascontiguousarray();
    EXPECT_TRUE(c.is_contiguous());
    ExpectTensorNear(c, std::vector<double>{0, 3, 1, 4, 2, 5}, 0.0);
}

TEST(TensorBasic, TransposeWithAxes) {
    auto t = Tensor::zeros({2, 3, 4});
    auto p = t.transpose({2, 0, -2});
    EXPECT_EQ(p.shape(), (Shape{4, 2, 3}));
    EXPECT_THROW(t.transpose({0, 1}), ValueError);
    EXPECT_THROW(t.transpose({0, 1, 3}), IndexError);
}

TEST(TensorBasic, FillFollowsStrides) {
    auto t = Tensor::zeros({2, 3});
    auto view = t.transpose();
    view.fill<double>(2.0);
    ExpectTensorNear(t, std::vector<double>(6, 2.0), 0.0);
}

TEST(TensorBasic, ViewMustFitStorage) {
    auto t = Tensor::zeros({4});
    EXPECT_THROW(Tensor(t.storage(), {5}, {8}, DType::Float64), MemoryError);
    EXPECT_NO_THROW(Tensor(t.storage(), {2}, {16}, DType::Float64, 8));
}

TEST(TensorBasic, Repr) {
    auto t = Tensor::zeros({4, 5}, DType::Complex64);
    EXPECT_EQ(t.repr(), "Tensor(shape=[4, 5], dtype=complex64)");
    EXPECT_EQ(t.transpose().repr(),
              "Tensor(shape=[5, 4], dtype=complex64, strided)");
}

TEST(ShapeUtils, StridesAndContiguity) {
    EXPECT_EQ(ShapeUtils::calculate_strides({2, 3, 4}, 8),
              (Strides{96, 32, 8}));
    EXPECT_TRUE(ShapeUtils::is_contiguous({2, 3}, {12, 4}, 4));
    EXPECT_FALSE(ShapeUtils::is_contiguous({2, 3}, {4, 8}, 4));
    // Length-1 axes may carry any stride
    EXPECT_TRUE(ShapeUtils::is_contiguous({1, 3}, {0, 4}, 4));
    EXPECT_EQ(ShapeUtils::unravel_index(7, {2, 4}),
              (std::vector<size_t>{1, 3}));
    EXPECT_EQ(ShapeUtils::to_string({}), "[]");
}

TEST(DTypeTraits, SizesAndCategories) {
    EXPECT_EQ(dtype_size(DType::Complex64), 8u);
    EXPECT_EQ(dtype_size(DType::Complex128), 16u);
    EXPECT_TRUE(is_complex_dtype(DType::Complex64));
    EXPECT_TRUE(is_floating_dtype(DType::Float32));
    EXPECT_TRUE(is_integer_dtype(DType::Bool));
    EXPECT_FALSE(is_integer_dtype(DType::Float64));
    EXPECT_EQ(dtype_of_v<complex128_t>, DType::Complex128);
    EXPECT_EQ(dtype_name(DType::UInt16), "uint16");
}
