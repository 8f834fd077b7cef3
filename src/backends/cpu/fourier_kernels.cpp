#include "fourier_kernels.hpp"

#include <cmath>
#include <complex>
#include <cstring>
#include <string>
#include <type_traits>

#include "ndfourier/dispatch.hpp"
#include "ndfourier/error.hpp"

namespace ndfourier {
namespace backends {
namespace cpu {

namespace {

// ============================================================================
// Element access
// ============================================================================

using Loader = complex128_t (*)(const uint8_t *);
using Storer = void (*)(uint8_t *, const complex128_t &);

template <typename T> complex128_t load_as_complex(const uint8_t *src) {
    T value;
    std::memcpy(&value, src, sizeof(T));
    if constexpr (std::is_same_v<T, complex64_t> ||
                  std::is_same_v<T, complex128_t>) {
        return complex128_t(value.real(), value.imag());
    } else {
        return complex128_t(static_cast<double>(value), 0.0);
    }
}

template <typename T> void store_real(uint8_t *dst, const complex128_t &v) {
    T value = static_cast<T>(v.real());
    std::memcpy(dst, &value, sizeof(T));
}

template <typename T> void store_complex(uint8_t *dst, const complex128_t &v) {
    using R = typename T::value_type;
    T value(static_cast<R>(v.real()), static_cast<R>(v.imag()));
    std::memcpy(dst, &value, sizeof(T));
}

Loader select_loader(DType dtype) {
    return dispatch(dtype, [](auto type_class) -> Loader {
        using T = typename decltype(type_class)::value_type;
        return &load_as_complex<T>;
    });
}

Storer select_complex_storer(DType dtype, const std::string &op) {
    return dispatch_complex(dtype, op, [](auto type_class) -> Storer {
        using T = typename decltype(type_class)::value_type;
        return &store_complex<T>;
    });
}

Storer select_real_storer(DType dtype, const std::string &op) {
    return dispatch_float(dtype, op, [](auto type_class) -> Storer {
        using T = typename decltype(type_class)::value_type;
        return &store_real<T>;
    });
}

// ============================================================================
// Frequency geometry
// ============================================================================

// Length of axis k before the transform
double logical_length(const Tensor &input, size_t k, int64_t n, size_t axis) {
    if (k == axis && n >= 0) {
        return static_cast<double>(n);
    }
    return static_cast<double>(input.shape()[k]);
}

// Signed frequency index of every position along axis k. A real transform
// only stores the non-negative half, so indices there run 0, 1, 2, ...
std::vector<double> frequency_indices(const Tensor &input, size_t k,
                                      int64_t n, size_t axis) {
    const size_t dim = input.shape()[k];
    std::vector<double> freqs(dim);
    if (k == axis && n >= 0) {
        for (size_t h = 0; h < dim; ++h) {
            freqs[h] = static_cast<double>(h);
        }
        return freqs;
    }
    const int64_t len = static_cast<int64_t>(dim);
    for (int64_t h = 0; h < len; ++h) {
        freqs[h] = static_cast<double>(h < (len + 1) / 2 ? h : h - len);
    }
    return freqs;
}

// Builds one table per axis mapping position -> fn(frequency, length,
// parameter). Axes whose logical length is zero get the table value `idle`.
template <typename Fn>
std::vector<std::vector<double>>
axis_tables(const Tensor &input, const std::vector<double> &parameters,
            int64_t n, size_t axis, double idle, Fn &&fn) {
    std::vector<std::vector<double>> tables(input.ndim());
    for (size_t k = 0; k < input.ndim(); ++k) {
        const double length = logical_length(input, k, n, axis);
        auto freqs = frequency_indices(input, k, n, axis);
        tables[k].resize(freqs.size());
        for (size_t h = 0; h < freqs.size(); ++h) {
            tables[k][h] =
                length > 0.0 ? fn(freqs[h], length, parameters[k]) : idle;
        }
    }
    return tables;
}

inline double sinc(double x) { return x != 0.0 ? std::sin(x) / x : 1.0; }

// Bessel function of the first kind, order 1, for r >= 0.
// Below 25 the trapezoidal rule over one period of Bessel's integral
//   J1(r) = 1/(2 pi) * integral_0^{2 pi} cos(t - r sin t) dt
// is exact up to J_{N-1}(r) for N nodes. Above it the Hankel asymptotic
// series is summed until its terms stop shrinking.
double bessel_j1(double r) {
    if (r < 25.0) {
        const int nodes = 2 * static_cast<int>(std::ceil(r)) + 32;
        double sum = 0.0;
        for (int j = 0; j < nodes; ++j) {
            const double t = 2.0 * M_PI * j / nodes;
            sum += std::cos(t - r * std::sin(t));
        }
        return sum / nodes;
    }

    const double mu = 4.0;
    double p = 1.0;
    double q = 0.0;
    double term = 1.0;
    for (int k = 1; k < 64; ++k) {
        const double odd = 2.0 * k - 1.0;
        const double next = term * (mu - odd * odd) / (k * 8.0 * r);
        if (std::abs(next) >= std::abs(term)) {
            break;
        }
        term = next;
        const double signed_term = (k / 2) % 2 == 0 ? term : -term;
        if (k % 2 == 0) {
            p += signed_term;
        } else {
            q += signed_term;
        }
        if (std::abs(term) < 1e-17) {
            break;
        }
    }
    const double chi = r - 0.75 * M_PI;
    return std::sqrt(2.0 / (M_PI * r)) * (p * std::cos(chi) - q * std::sin(chi));
}

// ============================================================================
// N-dimensional strided loop
// ============================================================================

// Calls out = fn(indices, in) for every element, walking input and output
// with their own strides in row-major logical order
template <typename Fn>
void transform_elements(const Tensor &input, Tensor &output, Loader load,
                        Storer store, Fn &&fn) {
    const size_t total = input.size();
    if (total == 0) {
        return;
    }

    const Shape &shape = input.shape();
    const Strides &in_strides = input.strides();
    const Strides &out_strides = output.strides();
    const auto *src = static_cast<const uint8_t *>(input.data());
    auto *dst = static_cast<uint8_t *>(output.data());
    const int ndim = static_cast<int>(shape.size());

    std::vector<size_t> indices(shape.size(), 0);
    size_t in_offset = 0;
    size_t out_offset = 0;

    for (size_t i = 0; i < total; ++i) {
        store(dst + out_offset, fn(indices, load(src + in_offset)));

        for (int d = ndim - 1; d >= 0; --d) {
            if (++indices[d] < shape[d]) {
                in_offset += in_strides[d];
                out_offset += out_strides[d];
                break;
            }
            in_offset -= (shape[d] - 1) * in_strides[d];
            out_offset -= (shape[d] - 1) * out_strides[d];
            indices[d] = 0;
        }
    }
}

// An output overlapping the input with another layout would overwrite
// elements before they are read, so such calls read from a copy
Tensor readable_input(const Tensor &input, const Tensor &output) {
    const bool same_layout = output.data() == input.data() &&
                             output.strides() == input.strides() &&
                             output.dtype() == input.dtype();
    if (output.shares_storage(input) && !same_layout) {
        return input.copy();
    }
    return input;
}

void check_arguments(const Tensor &input, const std::vector<double> &values,
                     size_t axis, const Tensor &output) {
    if (values.size() != input.ndim()) {
        throw ValueError::length_mismatch(input.ndim(), values.size(),
                                          "per-axis parameter");
    }
    if (axis >= input.ndim()) {
        throw IndexError::axis_out_of_range(static_cast<int>(axis),
                                            input.ndim());
    }
    if (!output.same_shape(input)) {
        throw ShapeError::mismatch(input.shape(), output.shape());
    }
}

} // namespace

// ============================================================================
// Real-weighted filters
// ============================================================================

void fourier_filter(const Tensor &input, const std::vector<double> &parameters,
                    int64_t n, size_t axis, Tensor &output, FilterKind kind) {
    const std::string op = filter_kind_name(kind);
    check_arguments(input, parameters, axis, output);

    const size_t rank = input.ndim();
    if (kind == FilterKind::Ellipsoid && (rank < 1 || rank > 3)) {
        throw ShapeError::unsupported_rank(rank, op);
    }

    Storer store;
    if (is_complex_dtype(output.dtype())) {
        store = select_complex_storer(output.dtype(), op);
    } else {
        if (is_complex_dtype(input.dtype())) {
            throw TypeError::dtype_mismatch("complex64 or complex128 output "
                                            "for complex input",
                                            output.dtype_name());
        }
        store = select_real_storer(output.dtype(), op);
    }
    Loader load = select_loader(input.dtype());
    const Tensor source = readable_input(input, output);

    switch (kind) {
    case FilterKind::Gaussian: {
        auto tables = axis_tables(
            input, parameters, n, axis, 1.0,
            [](double f, double length, double sigma) {
                const double scale =
                    -2.0 * M_PI * M_PI * sigma * sigma / (length * length);
                return std::exp(scale * f * f);
            });
        transform_elements(source, output, load, store,
                           [&](const std::vector<size_t> &idx,
                               const complex128_t &value) {
                               double weight = 1.0;
                               for (size_t k = 0; k < rank; ++k)
                                   weight *= tables[k][idx[k]];
                               return value * weight;
                           });
        break;
    }
    case FilterKind::Uniform: {
        auto tables = axis_tables(
            input, parameters, n, axis, 1.0,
            [](double f, double length, double size) {
                return sinc(M_PI * size * f / length);
            });
        transform_elements(source, output, load, store,
                           [&](const std::vector<size_t> &idx,
                               const complex128_t &value) {
                               double weight = 1.0;
                               for (size_t k = 0; k < rank; ++k)
                                   weight *= tables[k][idx[k]];
                               return value * weight;
                           });
        break;
    }
    case FilterKind::Ellipsoid: {
        // Scaled radial coordinate along each axis
        auto tables = axis_tables(
            input, parameters, n, axis, 0.0,
            [](double f, double length, double size) {
                return M_PI * size * f / length;
            });
        transform_elements(
            source, output, load, store,
            [&](const std::vector<size_t> &idx, const complex128_t &value) {
                if (rank == 1) {
                    return value * sinc(tables[0][idx[0]]);
                }
                double r2 = 0.0;
                for (size_t k = 0; k < rank; ++k)
                    r2 += tables[k][idx[k]] * tables[k][idx[k]];
                const double r = std::sqrt(r2);
                double weight = 1.0;
                if (r > 0.0) {
                    if (rank == 2) {
                        weight = 2.0 * bessel_j1(r) / r;
                    } else {
                        weight =
                            3.0 * (std::sin(r) - r * std::cos(r)) / (r * r * r);
                    }
                }
                return value * weight;
            });
        break;
    }
    }
}

// ============================================================================
// Shift
// ============================================================================

void fourier_shift(const Tensor &input, const std::vector<double> &shifts,
                   int64_t n, size_t axis, Tensor &output) {
    check_arguments(input, shifts, axis, output);
    Storer store = select_complex_storer(output.dtype(), "Fourier shift");
    Loader load = select_loader(input.dtype());
    const Tensor source = readable_input(input, output);

    const size_t rank = input.ndim();
    auto phases =
        axis_tables(input, shifts, n, axis, 0.0,
                    [](double f, double length, double shift) {
                        return -2.0 * M_PI * shift * f / length;
                    });

    transform_elements(source, output, load, store,
                       [&](const std::vector<size_t> &idx,
                           const complex128_t &value) {
                           double phase = 0.0;
                           for (size_t k = 0; k < rank; ++k)
                               phase += phases[k][idx[k]];
                           return value * std::polar(1.0, phase);
                       });
}

} // namespace cpu
} // namespace backends
} // namespace ndfourier
