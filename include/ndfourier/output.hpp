#pragma once

#include <variant>

#include "dtype.hpp"
#include "tensor.hpp"

namespace ndfourier {

/**
 * Where a filter writes its result.
 *
 * - std::monostate: allocate a new array with a default dtype
 * - DType: allocate a new array of that dtype
 * - Tensor: write into this caller-owned array; nothing is returned
 */
using OutputArg = std::variant<std::monostate, DType, Tensor>;

// Resolved output of a filter call
struct OutputSpec {
    Tensor buffer;
    // True when buffer was allocated here and must be handed back
    bool return_buffer = false;
};

/**
 * Resolves the output of a filter whose weights are real.
 * Absent output keeps the input dtype for float32/complex64/complex128 and
 * falls back to float64; requested dtypes must be float32, float64,
 * complex64 or complex128.
 * @throws TypeError if the requested dtype is not allowed
 * @throws ShapeError if a supplied buffer's shape differs from input's
 */
OutputSpec provision_output(const OutputArg &output, const Tensor &input);

/**
 * Resolves the output of a filter whose weights are complex.
 * Absent output keeps complex64/complex128 inputs and otherwise uses
 * complex128; requested dtypes must be complex64 or complex128.
 * @throws TypeError if the requested dtype is not allowed
 * @throws ShapeError if a supplied buffer's shape differs from input's
 */
OutputSpec provision_complex_output(const OutputArg &output,
                                    const Tensor &input);

} // namespace ndfourier
