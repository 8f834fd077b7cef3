#include "ndfourier/output.hpp"

#include <algorithm>
#include <array>
#include <type_traits>

#include "ndfourier/error.hpp"

namespace ndfourier {

namespace {

// Input dtypes a real-weighted filter keeps for its result
constexpr std::array<DType, 3> kRealFilterKeptDTypes = {
    DType::Complex64, DType::Complex128, DType::Float32};
constexpr DType kRealFilterDefaultDType = DType::Float64;
// Output dtypes a caller may request from a real-weighted filter
constexpr std::array<DType, 4> kRealFilterOutputDTypes = {
    DType::Complex64, DType::Complex128, DType::Float32, DType::Float64};

constexpr std::array<DType, 2> kComplexFilterKeptDTypes = {
    DType::Complex64, DType::Complex128};
constexpr DType kComplexFilterDefaultDType = DType::Complex128;
constexpr std::array<DType, 2> kComplexFilterOutputDTypes = {
    DType::Complex64, DType::Complex128};

template <size_t N>
bool contains(const std::array<DType, N> &dtypes, DType dtype) {
    return std::find(dtypes.begin(), dtypes.end(), dtype) != dtypes.end();
}

template <size_t K, size_t A>
OutputSpec resolve_output(const OutputArg &output, const Tensor &input,
                          const std::array<DType, K> &kept,
                          DType fallback, const std::array<DType, A> &allowed,
                          const char *operation) {
    return std::visit(
        [&](const auto &arg) -> OutputSpec {
            using V = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<V, std::monostate>) {
                DType dtype =
                    contains(kept, input.dtype()) ? input.dtype() : fallback;
                return {Tensor::zeros(input.shape(), dtype), true};
            } else if constexpr (std::is_same_v<V, DType>) {
                if (!contains(allowed, arg)) {
                    throw TypeError::unsupported_dtype(dtype_name(arg),
                                                       operation);
                }
                return {Tensor::zeros(input.shape(), arg), true};
            } else {
                if (!arg.same_shape(input)) {
                    throw ShapeError::mismatch(input.shape(), arg.shape());
                }
                return {arg, false};
            }
        },
        output);
}

} // namespace

OutputSpec provision_output(const OutputArg &output, const Tensor &input) {
    return resolve_output(output, input, kRealFilterKeptDTypes,
                          kRealFilterDefaultDType, kRealFilterOutputDTypes,
                          "Fourier filter output");
}

OutputSpec provision_complex_output(const OutputArg &output,
                                    const Tensor &input) {
    return resolve_output(output, input, kComplexFilterKeptDTypes,
                          kComplexFilterDefaultDType,
                          kComplexFilterOutputDTypes,
                          "Fourier shift output");
}

} // namespace ndfourier
