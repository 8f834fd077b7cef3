#include "ndfourier/tensor.hpp"

#include <cstring>
#include <sstream>

#include "ndfourier/dispatch.hpp"

namespace ndfourier {

size_t Tensor::calculate_storage_size() const { return size() * itemsize(); }

void Tensor::validate_indices(const std::vector<size_t>& indices) const {
  if (indices.size() != ndim()) {
    throw ShapeError::expected_rank(ndim(), indices.size(), "index");
  }
  for (size_t i = 0; i < indices.size(); ++i) {
    if (indices[i] >= shape_[i]) {
      throw IndexError::out_of_bounds(indices[i], shape_[i],
                                      static_cast<int>(i));
    }
  }
}

void Tensor::update_contiguity_flags() {
  flags_.c_contiguous =
      ShapeUtils::is_contiguous(shape_, strides_, dtype_size(dtype_));
}

Tensor::Tensor()
    : storage_(nullptr),
      shape_(),
      strides_(),
      dtype_(DType::Float64),
      offset_(0),
      flags_() {
  flags_.owndata = false;
}

Tensor::Tensor(const Shape& shape, DType dtype)
    : shape_(shape), dtype_(dtype), offset_(0), flags_() {
  strides_ = ShapeUtils::calculate_strides(shape_, dtype_size(dtype_));
  storage_ = make_storage(calculate_storage_size());

  update_contiguity_flags();
  flags_.owndata = true;
}

Tensor::Tensor(std::initializer_list<size_t> shape, DType dtype)
    : Tensor(Shape(shape), dtype) {}

Tensor::Tensor(std::shared_ptr<Storage> storage, const Shape& shape,
               const Strides& strides, DType dtype, size_t offset)
    : storage_(storage),
      shape_(shape),
      strides_(strides),
      dtype_(dtype),
      offset_(offset),
      flags_() {
  if (!storage_) {
    throw RuntimeError::internal("tensor view created over null storage");
  }

  if (shape_.size() != strides_.size()) {
    throw ShapeError::expected_rank(shape_.size(), strides_.size(),
                                    "strides");
  }

  size_t required_size = 0;
  if (ShapeUtils::size(shape_) > 0) {
    for (size_t i = 0; i < shape_.size(); ++i) {
      if (shape_[i] > 1) {
        required_size += (shape_[i] - 1) * strides_[i];
      }
    }
    required_size += dtype_size(dtype_);
  }

  if (offset_ + required_size > storage_->size_bytes()) {
    throw MemoryError::storage_too_small(offset_ + required_size,
                                         storage_->size_bytes());
  }

  update_contiguity_flags();
  flags_.owndata = false;
}

Tensor::Tensor(const Tensor& other)
    : storage_(other.storage_),
      shape_(other.shape_),
      strides_(other.strides_),
      dtype_(other.dtype_),
      offset_(other.offset_),
      flags_(other.flags_) {}

Tensor& Tensor::operator=(const Tensor& other) {
  if (this != &other) {
    storage_ = other.storage_;
    shape_ = other.shape_;
    strides_ = other.strides_;
    dtype_ = other.dtype_;
    offset_ = other.offset_;
    flags_ = other.flags_;
  }
  return *this;
}

Tensor::Tensor(Tensor&& other) noexcept
    : storage_(std::move(other.storage_)),
      shape_(std::move(other.shape_)),
      strides_(std::move(other.strides_)),
      dtype_(other.dtype_),
      offset_(other.offset_),
      flags_(other.flags_) {}

Tensor& Tensor::operator=(Tensor&& other) noexcept {
  if (this != &other) {
    storage_ = std::move(other.storage_);
    shape_ = std::move(other.shape_);
    strides_ = std::move(other.strides_);
    dtype_ = other.dtype_;
    offset_ = other.offset_;
    flags_ = other.flags_;
  }
  return *this;
}

void* Tensor::data() {
  if (!storage_) {
    throw RuntimeError::internal("data access on an undefined tensor");
  }
  return static_cast<uint8_t*>(storage_->data()) + offset_;
}

const void* Tensor::data() const {
  if (!storage_) {
    throw RuntimeError::internal("data access on an undefined tensor");
  }
  return static_cast<const uint8_t*>(storage_->data()) + offset_;
}

Tensor Tensor::ascontiguousarray() const {
  if (is_contiguous()) {
    return *this;
  }

  auto new_tensor = Tensor(shape_, dtype_);
  auto* dst = static_cast<uint8_t*>(new_tensor.data());
  const auto* src = static_cast<const uint8_t*>(data());
  const size_t item = itemsize();

  for_each_offset([&](size_t src_offset) {
    std::memcpy(dst, src + src_offset, item);
    dst += item;
  });

  return new_tensor;
}

Tensor Tensor::transpose() const {
  if (ndim() < 2) {
    return *this;
  }

  Shape new_shape = shape_;
  Strides new_strides = strides_;

  std::swap(new_shape[ndim() - 2], new_shape[ndim() - 1]);
  std::swap(new_strides[ndim() - 2], new_strides[ndim() - 1]);

  return Tensor(storage_, new_shape, new_strides, dtype_, offset_);
}

Tensor Tensor::transpose(const std::vector<int>& axes) const {
  if (axes.size() != ndim()) {
    throw ValueError::length_mismatch(ndim(), axes.size(), "axes");
  }

  Shape new_shape(ndim());
  Strides new_strides(ndim());

  for (size_t i = 0; i < axes.size(); ++i) {
    int axis = axes[i];
    if (axis < 0) axis += static_cast<int>(ndim());
    if (axis < 0 || axis >= static_cast<int>(ndim())) {
      throw IndexError::axis_out_of_range(axes[i], ndim());
    }

    new_shape[i] = shape_[axis];
    new_strides[i] = strides_[axis];
  }

  return Tensor(storage_, new_shape, new_strides, dtype_, offset_);
}

Tensor Tensor::copy() const {
  if (!is_contiguous()) {
    return ascontiguousarray();
  }
  auto new_tensor = Tensor(shape_, dtype_);
  if (nbytes() > 0) {
    std::memcpy(new_tensor.data(), data(), nbytes());
  }
  return new_tensor;
}

std::string Tensor::repr() const {
  std::ostringstream oss;
  oss << "Tensor(shape=" << ShapeUtils::to_string(shape_)
      << ", dtype=" << dtype_name()
      << (is_contiguous() ? "" : ", strided") << ")";
  return oss.str();
}

bool Tensor::same_shape(const Tensor& other) const {
  return ShapeUtils::shapes_equal(shape_, other.shape_);
}

bool Tensor::shares_storage(const Tensor& other) const {
  return storage_ != nullptr && storage_ == other.storage_;
}

Tensor Tensor::zeros(const Shape& shape, DType dtype) {
  // Storage is value-initialized on allocation
  return Tensor(shape, dtype);
}

Tensor Tensor::zeros(std::initializer_list<size_t> shape, DType dtype) {
  return zeros(Shape(shape), dtype);
}

Tensor Tensor::ones(const Shape& shape, DType dtype) {
  auto tensor = Tensor(shape, dtype);
  dispatch(dtype, [&](auto type_class) {
    using T = typename decltype(type_class)::value_type;
    tensor.fill<T>(T(1));
  });
  return tensor;
}

Tensor Tensor::ones(std::initializer_list<size_t> shape, DType dtype) {
  return ones(Shape(shape), dtype);
}

Tensor Tensor::empty(const Shape& shape, DType dtype) {
  return Tensor(shape, dtype);
}

Tensor Tensor::empty(std::initializer_list<size_t> shape, DType dtype) {
  return empty(Shape(shape), dtype);
}

}  // namespace ndfourier
