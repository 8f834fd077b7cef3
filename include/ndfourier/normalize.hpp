#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "tensor.hpp"

namespace ndfourier {

/**
 * A per-axis filter parameter (sigma, size or shift).
 *
 * - double or int64_t: one value applied to every axis
 * - std::vector<double>: one value per axis
 * - Tensor: a 1-D real array with one value per axis; it may be a strided
 *   view and of any real dtype
 */
using ParamArg = std::variant<double, int64_t, std::vector<double>, Tensor>;

/**
 * Maps an axis in [-ndim, ndim) onto [0, ndim).
 * @throws IndexError if the axis is out of range
 */
size_t normalize_axis(int axis, size_t ndim);

/**
 * Expands a filter parameter into exactly ndim contiguous float64 values.
 * A scalar is broadcast to every axis. Sequences are copied, so the result
 * never aliases caller memory.
 * @throws ValueError if a sequence does not hold exactly ndim values
 * @throws ShapeError if a tensor parameter is not 1-D
 * @throws TypeError if a tensor parameter has a complex dtype
 */
std::vector<double> normalize_sequence(const ParamArg &param, size_t ndim);

} // namespace ndfourier
