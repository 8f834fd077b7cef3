#pragma once

#include <algorithm>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "dtype.hpp"
#include "error.hpp"
#include "shape.hpp"
#include "storage.hpp"

namespace ndfourier {

struct TensorFlags {
  bool c_contiguous = true;
  bool owndata = true;
};

class Tensor {
 private:
  std::shared_ptr<Storage> storage_;
  Shape shape_;
  Strides strides_;
  DType dtype_;
  size_t offset_;
  TensorFlags flags_;

  size_t calculate_storage_size() const;
  void validate_indices(const std::vector<size_t>& indices) const;
  void update_contiguity_flags();

  // Visits the byte offset (relative to data()) of every element in
  // row-major logical order
  template <typename Fn>
  void for_each_offset(Fn&& fn) const {
    const size_t n = size();
    if (n == 0) return;
    std::vector<size_t> indices(ndim(), 0);
    size_t byte_offset = 0;
    for (size_t i = 0; i < n; ++i) {
      fn(byte_offset);
      for (int d = static_cast<int>(ndim()) - 1; d >= 0; --d) {
        if (++indices[d] < shape_[d]) {
          byte_offset += strides_[d];
          break;
        }
        byte_offset -= (shape_[d] - 1) * strides_[d];
        indices[d] = 0;
      }
    }
  }

 public:
  // Constructors
  Tensor();
  Tensor(const Shape& shape, DType dtype = DType::Float64);
  Tensor(std::initializer_list<size_t> shape, DType dtype = DType::Float64);
  Tensor(std::shared_ptr<Storage> storage, const Shape& shape,
         const Strides& strides, DType dtype, size_t offset = 0);

  Tensor(const Tensor& other);
  Tensor& operator=(const Tensor& other);
  Tensor(Tensor&& other) noexcept;
  Tensor& operator=(Tensor&& other) noexcept;

  // Core attributes
  const Shape& shape() const { return shape_; }
  size_t ndim() const { return shape_.size(); }
  size_t size() const { return ShapeUtils::size(shape_); }
  const Strides& strides() const { return strides_; }
  size_t itemsize() const { return dtype_size(dtype_); }
  size_t nbytes() const { return size() * itemsize(); }
  DType dtype() const { return dtype_; }
  std::string dtype_name() const { return ndfourier::dtype_name(dtype_); }
  const TensorFlags& flags() const { return flags_; }
  bool is_contiguous() const { return flags_.c_contiguous; }
  std::shared_ptr<Storage> storage() const { return storage_; }
  bool empty() const { return size() == 0; }

  // Data access
  void* data();
  const void* data() const;

  template <typename T>
  T* typed_data() {
    return reinterpret_cast<T*>(data());
  }

  template <typename T>
  const T* typed_data() const {
    return reinterpret_cast<const T*>(data());
  }

  template <typename T>
  T item(const std::vector<size_t>& indices) const {
    validate_indices(indices);
    if (dtype_of_v<T> != dtype_) {
      throw TypeError::dtype_mismatch(dtype_name(),
                                      ndfourier::dtype_name(dtype_of_v<T>));
    }
    size_t byte_offset = ShapeUtils::linear_index(indices, strides_);
    T value;
    std::memcpy(&value, static_cast<const uint8_t*>(data()) + byte_offset,
                sizeof(T));
    return value;
  }

  template <typename T>
  void set_item(const std::vector<size_t>& indices, const T& value) {
    validate_indices(indices);
    if (dtype_of_v<T> != dtype_) {
      throw TypeError::dtype_mismatch(dtype_name(),
                                      ndfourier::dtype_name(dtype_of_v<T>));
    }
    size_t byte_offset = ShapeUtils::linear_index(indices, strides_);
    std::memcpy(static_cast<uint8_t*>(data()) + byte_offset, &value,
                sizeof(T));
  }

  template <typename T>
  void fill(const T& value) {
    if (dtype_of_v<T> != dtype_) {
      throw TypeError::dtype_mismatch(dtype_name(),
                                      ndfourier::dtype_name(dtype_of_v<T>));
    }
    if (is_contiguous()) {
      T* data_ptr = typed_data<T>();
      std::fill(data_ptr, data_ptr + size(), value);
      return;
    }
    auto* base = static_cast<uint8_t*>(data());
    for_each_offset([&](size_t byte_offset) {
      std::memcpy(base + byte_offset, &value, sizeof(T));
    });
  }

  // Memory layout operations
  Tensor ascontiguousarray() const;

  // Shape manipulation (views sharing storage)
  Tensor transpose() const;
  Tensor transpose(const std::vector<int>& axes) const;

  // Memory operations
  Tensor copy() const;

  // Utility methods
  std::string repr() const;
  bool same_shape(const Tensor& other) const;
  bool shares_storage(const Tensor& other) const;

  // Static factory methods
  static Tensor zeros(const Shape& shape, DType dtype = DType::Float64);
  static Tensor zeros(std::initializer_list<size_t> shape,
                      DType dtype = DType::Float64);
  static Tensor ones(const Shape& shape, DType dtype = DType::Float64);
  static Tensor ones(std::initializer_list<size_t> shape,
                     DType dtype = DType::Float64);
  static Tensor empty(const Shape& shape, DType dtype = DType::Float64);
  static Tensor empty(std::initializer_list<size_t> shape,
                      DType dtype = DType::Float64);

  template <typename T>
  static Tensor full(const Shape& shape, const T& value) {
    auto tensor = Tensor(shape, dtype_of_v<T>);
    tensor.fill(value);
    return tensor;
  }

  template <typename T>
  static Tensor from_data(const T* data, const Shape& shape) {
    auto tensor = Tensor(shape, dtype_of_v<T>);
    std::memcpy(tensor.typed_data<T>(), data, tensor.nbytes());
    return tensor;
  }

  template <typename T>
  static Tensor from_vector(const std::vector<T>& values) {
    return from_data(values.data(), {values.size()});
  }
};

}  // namespace ndfourier
