#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ndfourier {

using Shape = std::vector<size_t>;
using Strides = std::vector<size_t>;

class ShapeUtils {
 public:
  static size_t size(const Shape& shape);

  // Row-major byte strides for a contiguous array of the given shape
  static Strides calculate_strides(const Shape& shape, size_t itemsize);

  static bool is_contiguous(const Shape& shape, const Strides& strides,
                            size_t itemsize);

  static bool shapes_equal(const Shape& shape1, const Shape& shape2);

  static size_t linear_index(const std::vector<size_t>& indices,
                             const Strides& strides);

  static std::vector<size_t> unravel_index(size_t linear_idx,
                                           const Shape& shape);

  // "[4, 4]"
  static std::string to_string(const Shape& shape);
};

}  // namespace ndfourier
