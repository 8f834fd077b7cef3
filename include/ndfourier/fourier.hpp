#pragma once

#include <cstdint>
#include <optional>

#include "normalize.hpp"
#include "output.hpp"
#include "tensor.hpp"

namespace ndfourier {

// Selects the real-valued weight applied by the filter kernel
enum class FilterKind : int { Gaussian = 0, Uniform = 1, Ellipsoid = 2 };

const char *filter_kind_name(FilterKind kind);

namespace fourier {

// Every filter below multiplies an array holding a discrete Fourier transform
// by the transform of a kernel.
//
// n < 0 means input is the result of a complex transform. n >= 0 means input
// is the half-spectrum of a real transform along `axis`, and n is the length
// of that axis before the transform.
//
// The result goes into a new array, which is returned, or into the array
// passed as `output`, in which case std::nullopt is returned.

/**
 * Multi-dimensional Gaussian Fourier filter.
 * @param input Spectrum to filter
 * @param sigma Standard deviation of the Gaussian kernel, one value or one
 *        per axis
 * @param n Length of the real-transform axis before transformation, or
 *        negative for a complex transform
 * @param axis Axis of the real transform (default: last axis)
 * @param output Absent, a result dtype, or a buffer of input's shape
 */
std::optional<Tensor> fourier_gaussian(const Tensor &input,
                                       const ParamArg &sigma, int64_t n = -1,
                                       int axis = -1,
                                       const OutputArg &output = {});

/**
 * Multi-dimensional uniform Fourier filter: multiplies by the transform of
 * a box of the given size.
 */
std::optional<Tensor> fourier_uniform(const Tensor &input,
                                      const ParamArg &size, int64_t n = -1,
                                      int axis = -1,
                                      const OutputArg &output = {});

/**
 * Multi-dimensional ellipsoid Fourier filter: multiplies by the transform of
 * an ellipsoid with the given axis lengths.
 * Implemented for arrays of rank 1, 2 or 3; other ranks throw ShapeError
 * from the kernel.
 */
std::optional<Tensor> fourier_ellipsoid(const Tensor &input,
                                        const ParamArg &size, int64_t n = -1,
                                        int axis = -1,
                                        const OutputArg &output = {});

/**
 * Multi-dimensional Fourier shift filter: multiplies by the linear phase
 * ramp of a (sub-pixel) shift. The result is always complex.
 */
std::optional<Tensor> fourier_shift(const Tensor &input,
                                    const ParamArg &shift, int64_t n = -1,
                                    int axis = -1,
                                    const OutputArg &output = {});

} // namespace fourier
} // namespace ndfourier
