#pragma once

#include <cstdint>
#include <vector>

#include "ndfourier/fourier.hpp"
#include "ndfourier/tensor.hpp"

namespace ndfourier {
namespace backends {
namespace cpu {

// Multiplies every element of a spectrum by a real Fourier-domain weight and
// writes the product to output. parameters holds one value per axis (sigma
// for Gaussian, box/ellipsoid size otherwise). n and axis describe a real
// half-spectrum as in fourier::fourier_gaussian; axis must already be
// normalized. output may share storage with input in any layout, including
// a transposed or offset view of it.
//
// Throws ShapeError for an ellipsoid of rank other than 1, 2 or 3, and
// TypeError when output is neither float32/64 nor complex64/128, or when a
// complex input would be written to a real output. Nothing is written when
// it throws.
void fourier_filter(const Tensor &input, const std::vector<double> &parameters,
                    int64_t n, size_t axis, Tensor &output, FilterKind kind);

// Multiplies every element of a spectrum by the phase ramp of a spatial
// shift. output must be complex.
void fourier_shift(const Tensor &input, const std::vector<double> &shifts,
                   int64_t n, size_t axis, Tensor &output);

} // namespace cpu
} // namespace backends
} // namespace ndfourier
