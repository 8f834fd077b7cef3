#include "ndfourier/normalize.hpp"

#include <cstdint>
#include <type_traits>

#include "ndfourier/dispatch.hpp"
#include "ndfourier/error.hpp"

namespace ndfourier {

namespace {

std::vector<double> tensor_to_sequence(const Tensor &values, size_t ndim) {
    if (values.ndim() != 1) {
        throw ShapeError::expected_rank(1, values.ndim(),
                                        "per-axis parameter array");
    }
    if (is_complex_dtype(values.dtype())) {
        throw TypeError::unsupported_dtype(values.dtype_name(),
                                           "per-axis filter parameter");
    }
    if (values.size() != ndim) {
        throw ValueError::length_mismatch(ndim, values.size(),
                                          "per-axis parameter");
    }

    // Read element by element through the strides: the result is a fresh
    // contiguous buffer whatever the layout of the source
    std::vector<double> result(ndim);
    dispatch(values.dtype(), [&](auto type_class) {
        using T = typename decltype(type_class)::value_type;
        if constexpr (!is_complex_dtype(decltype(type_class)::dtype)) {
            for (size_t i = 0; i < ndim; ++i) {
                result[i] = static_cast<double>(values.item<T>({i}));
            }
        }
    });
    return result;
}

} // namespace

size_t normalize_axis(int axis, size_t ndim) {
    const auto rank = static_cast<int64_t>(ndim);
    if (axis < -rank || axis >= rank) {
        throw IndexError::axis_out_of_range(axis, ndim);
    }
    return static_cast<size_t>(axis < 0 ? axis + rank : axis);
}

std::vector<double> normalize_sequence(const ParamArg &param, size_t ndim) {
    return std::visit(
        [ndim](const auto &value) -> std::vector<double> {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, double>) {
                return std::vector<double>(ndim, value);
            } else if constexpr (std::is_same_v<V, int64_t>) {
                return std::vector<double>(ndim, static_cast<double>(value));
            } else if constexpr (std::is_same_v<V, std::vector<double>>) {
                if (value.size() != ndim) {
                    throw ValueError::length_mismatch(ndim, value.size(),
                                                      "per-axis parameter");
                }
                return value;
            } else {
                return tensor_to_sequence(value, ndim);
            }
        },
        param);
}

} // namespace ndfourier
