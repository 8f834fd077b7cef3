#include "ndfourier/shape.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <sstream>

#include "ndfourier/error.hpp"

namespace ndfourier {

size_t ShapeUtils::size(const Shape& shape) {
    // A 0-d array holds a single element
    return std::accumulate(shape.begin(), shape.end(), size_t(1),
                           std::multiplies<size_t>());
}

Strides ShapeUtils::calculate_strides(const Shape& shape, size_t itemsize) {
    if (shape.empty()) return {};

    Strides strides(shape.size());
    strides.back() = itemsize;
    for (int i = static_cast<int>(shape.size()) - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * std::max<size_t>(shape[i + 1], 1);
    }
    return strides;
}

bool ShapeUtils::is_contiguous(const Shape& shape, const Strides& strides,
                               size_t itemsize) {
    if (shape.empty()) return true;
    if (shape.size() != strides.size()) return false;

    auto expected_strides = calculate_strides(shape, itemsize);
    for (size_t i = 0; i < shape.size(); ++i) {
        // Strides of length-1 axes never affect addressing
        if (shape[i] > 1 && strides[i] != expected_strides[i]) {
            return false;
        }
    }
    return true;
}

bool ShapeUtils::shapes_equal(const Shape& shape1, const Shape& shape2) {
    return shape1 == shape2;
}

size_t ShapeUtils::linear_index(const std::vector<size_t>& indices,
                                const Strides& strides) {
    if (indices.size() != strides.size()) {
        throw ShapeError::expected_rank(strides.size(), indices.size(),
                                        "index");
    }

    size_t linear_idx = 0;
    for (size_t i = 0; i < indices.size(); ++i) {
        linear_idx += indices[i] * strides[i];
    }

    return linear_idx;
}

std::vector<size_t> ShapeUtils::unravel_index(size_t linear_idx,
                                              const Shape& shape) {
    std::vector<size_t> indices(shape.size());

    for (int i = static_cast<int>(shape.size()) - 1; i >= 0; --i) {
        indices[i] = linear_idx % shape[i];
        linear_idx /= shape[i];
    }

    return indices;
}

std::string ShapeUtils::to_string(const Shape& shape) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << shape[i];
    }
    oss << "]";
    return oss.str();
}

}  // namespace ndfourier
