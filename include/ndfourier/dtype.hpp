#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ndfourier {

using complex64_t = std::complex<float>;
using complex128_t = std::complex<double>;

// Data type enumeration matching NumPy's dtype system
enum class DType : uint8_t {
  // Boolean
  Bool,

  // Signed integers
  Int8,
  Int16,
  Int32,
  Int64,

  // Unsigned integers
  UInt8,
  UInt16,
  UInt32,
  UInt64,

  // Floating point
  Float32,
  Float64,

  // Complex
  Complex64,
  Complex128
};

// Get size in bytes for each dtype
constexpr size_t dtype_size(DType dtype) {
  switch (dtype) {
    case DType::Bool:
    case DType::Int8:
    case DType::UInt8:
      return 1;
    case DType::Int16:
    case DType::UInt16:
      return 2;
    case DType::Int32:
    case DType::UInt32:
    case DType::Float32:
      return 4;
    case DType::Int64:
    case DType::UInt64:
    case DType::Float64:
    case DType::Complex64:
      return 8;
    case DType::Complex128:
      return 16;
  }
  return 0;
}

constexpr bool is_complex_dtype(DType dtype) {
  return dtype == DType::Complex64 || dtype == DType::Complex128;
}

constexpr bool is_floating_dtype(DType dtype) {
  return dtype == DType::Float32 || dtype == DType::Float64;
}

constexpr bool is_integer_dtype(DType dtype) {
  return !is_complex_dtype(dtype) && !is_floating_dtype(dtype);
}

// Get string representation
std::string dtype_name(DType dtype);

// Type traits for automatic dtype deduction
template <typename T>
struct dtype_of;

template <>
struct dtype_of<bool> {
  static constexpr DType value = DType::Bool;
};
template <>
struct dtype_of<int8_t> {
  static constexpr DType value = DType::Int8;
};
template <>
struct dtype_of<int16_t> {
  static constexpr DType value = DType::Int16;
};
template <>
struct dtype_of<int32_t> {
  static constexpr DType value = DType::Int32;
};
template <>
struct dtype_of<int64_t> {
  static constexpr DType value = DType::Int64;
};
template <>
struct dtype_of<uint8_t> {
  static constexpr DType value = DType::UInt8;
};
template <>
struct dtype_of<uint16_t> {
  static constexpr DType value = DType::UInt16;
};
template <>
struct dtype_of<uint32_t> {
  static constexpr DType value = DType::UInt32;
};
template <>
struct dtype_of<uint64_t> {
  static constexpr DType value = DType::UInt64;
};
template <>
struct dtype_of<float> {
  static constexpr DType value = DType::Float32;
};
template <>
struct dtype_of<double> {
  static constexpr DType value = DType::Float64;
};
template <>
struct dtype_of<complex64_t> {
  static constexpr DType value = DType::Complex64;
};
template <>
struct dtype_of<complex128_t> {
  static constexpr DType value = DType::Complex128;
};

template <typename T>
constexpr DType dtype_of_v = dtype_of<T>::value;

// ============================================================================
// Type classes used by dtype dispatch
// ============================================================================

template <typename T, DType D>
struct DTypeClass {
  using value_type = T;
  static constexpr DType dtype = D;
};

#define NDFOURIER_DTYPE_CLASS(Name, T)                       \
  struct Name : DTypeClass<T, DType::Name> {                 \
    static const char* name() { return #Name; }              \
  }

NDFOURIER_DTYPE_CLASS(Bool, bool);
NDFOURIER_DTYPE_CLASS(Int8, int8_t);
NDFOURIER_DTYPE_CLASS(Int16, int16_t);
NDFOURIER_DTYPE_CLASS(Int32, int32_t);
NDFOURIER_DTYPE_CLASS(Int64, int64_t);
NDFOURIER_DTYPE_CLASS(UInt8, uint8_t);
NDFOURIER_DTYPE_CLASS(UInt16, uint16_t);
NDFOURIER_DTYPE_CLASS(UInt32, uint32_t);
NDFOURIER_DTYPE_CLASS(UInt64, uint64_t);
NDFOURIER_DTYPE_CLASS(Float32, float);
NDFOURIER_DTYPE_CLASS(Float64, double);
NDFOURIER_DTYPE_CLASS(Complex64, complex64_t);
NDFOURIER_DTYPE_CLASS(Complex128, complex128_t);

#undef NDFOURIER_DTYPE_CLASS

}  // namespace ndfourier
