#include "ndfourier/fourier.hpp"

#include <sstream>
#include <string>

#include "backends/cpu/fourier_kernels.hpp"
#include "ndfourier/debug.hpp"

namespace ndfourier {

const char *filter_kind_name(FilterKind kind) {
    switch (kind) {
    case FilterKind::Gaussian:
        return "Gaussian Fourier filter";
    case FilterKind::Uniform:
        return "uniform Fourier filter";
    case FilterKind::Ellipsoid:
        return "ellipsoid Fourier filter";
    }
    return "Fourier filter";
}

namespace fourier {

namespace {

std::string describe(const Tensor &input, const OutputSpec &spec, int64_t n,
                     size_t axis) {
    std::ostringstream oss;
    oss << ShapeUtils::to_string(input.shape()) << " " << input.dtype_name()
        << " -> " << spec.buffer.dtype_name()
        << (spec.return_buffer ? "" : " (in place)");
    if (n >= 0) {
        oss << " n=" << n << " axis=" << axis;
    }
    return oss.str();
}

std::optional<Tensor> finish(OutputSpec &spec) {
    if (spec.return_buffer) {
        return std::move(spec.buffer);
    }
    return std::nullopt;
}

std::optional<Tensor> run_filter(const char *op_name, FilterKind kind,
                                 const Tensor &input, const ParamArg &param,
                                 int64_t n, int axis,
                                 const OutputArg &output) {
    trace::ScopedTrace scope(op_name);

    std::vector<double> parameters = normalize_sequence(param, input.ndim());
    size_t normalized_axis = normalize_axis(axis, input.ndim());
    OutputSpec spec = provision_output(output, input);

    backends::cpu::fourier_filter(input, parameters, n, normalized_axis,
                                  spec.buffer, kind);

    scope.set_description(describe(input, spec, n, normalized_axis));
    scope.set_memory(spec.return_buffer ? spec.buffer.nbytes() : 0,
                     spec.return_buffer);
    return finish(spec);
}

} // namespace

std::optional<Tensor> fourier_gaussian(const Tensor &input,
                                       const ParamArg &sigma, int64_t n,
                                       int axis, const OutputArg &output) {
    return run_filter("fourier_gaussian", FilterKind::Gaussian, input, sigma,
                      n, axis, output);
}

std::optional<Tensor> fourier_uniform(const Tensor &input,
                                      const ParamArg &size, int64_t n,
                                      int axis, const OutputArg &output) {
    return run_filter("fourier_uniform", FilterKind::Uniform, input, size, n,
                      axis, output);
}

std::optional<Tensor> fourier_ellipsoid(const Tensor &input,
                                        const ParamArg &size, int64_t n,
                                        int axis, const OutputArg &output) {
    return run_filter("fourier_ellipsoid", FilterKind::Ellipsoid, input, size,
                      n, axis, output);
}

std::optional<Tensor> fourier_shift(const Tensor &input,
                                    const ParamArg &shift, int64_t n,
                                    int axis, const OutputArg &output) {
    trace::ScopedTrace scope("fourier_shift");

    std::vector<double> shifts = normalize_sequence(shift, input.ndim());
    size_t normalized_axis = normalize_axis(axis, input.ndim());
    OutputSpec spec = provision_complex_output(output, input);

    backends::cpu::fourier_shift(input, shifts, n, normalized_axis,
                                 spec.buffer);

    scope.set_description(describe(input, spec, n, normalized_axis));
    scope.set_memory(spec.return_buffer ? spec.buffer.nbytes() : 0,
                     spec.return_buffer);
    return finish(spec);
}

} // namespace fourier
} // namespace ndfourier
