// Fourier Filter Benchmarks
// Measures the per-element cost of the Gaussian, uniform, ellipsoid and shift
// filters on 2-D and 3-D spectra, allocating and in place.
//
// Usage:
//   cmake -S . -B build -DNDFOURIER_BUILD_BENCHMARKS=ON
//   cmake --build build && ./build/bench_fourier_filters

#include "benchmark_utils.hpp"

namespace {

using namespace ndfourier;
using bench::random_complex_spectrum;
using bench::random_real_spectrum;

// ============================================================================
// Real spectra (float64)
// ============================================================================

static void BM_Gaussian2D_Float64(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_real_spectrum({n, n});

    for (auto _ : state) {
        auto result = fourier::fourier_gaussian(input, 2.0);
        benchmark::DoNotOptimize(result->data());
    }

    state.SetLabel(bench::shape_name(input.shape()));
    bench::set_filter_counters(state, input, sizeof(double));
}

static void BM_Uniform2D_Float64(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_real_spectrum({n, n});

    for (auto _ : state) {
        auto result = fourier::fourier_uniform(input, 5.0);
        benchmark::DoNotOptimize(result->data());
    }

    bench::set_filter_counters(state, input, sizeof(double));
}

static void BM_Ellipsoid2D_Float64(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_real_spectrum({n, n});

    for (auto _ : state) {
        auto result = fourier::fourier_ellipsoid(input, 5.0);
        benchmark::DoNotOptimize(result->data());
    }

    bench::set_filter_counters(state, input, sizeof(double));
}

// ============================================================================
// Complex spectra (complex128)
// ============================================================================

static void BM_Gaussian2D_Complex128_InPlace(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto spectrum = random_complex_spectrum({n, n});

    for (auto _ : state) {
        fourier::fourier_gaussian(spectrum, 0.0, -1, -1, spectrum);
        benchmark::DoNotOptimize(spectrum.data());
    }

    bench::set_filter_counters(state, spectrum, sizeof(complex128_t));
}

static void BM_Shift2D_Complex128(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_complex_spectrum({n, n});

    for (auto _ : state) {
        auto result = fourier::fourier_shift(input, 1.5);
        benchmark::DoNotOptimize(result->data());
    }

    bench::set_filter_counters(state, input, sizeof(complex128_t));
}

static void BM_Shift2D_RealHalfSpectrum(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_complex_spectrum({n, n / 2 + 1});

    for (auto _ : state) {
        auto result =
            fourier::fourier_shift(input, 1.5, static_cast<int64_t>(n));
        benchmark::DoNotOptimize(result->data());
    }

    bench::set_filter_counters(state, input, sizeof(complex128_t));
}

// ============================================================================
// 3-D spectra
// ============================================================================

static void BM_Ellipsoid3D_Complex128(benchmark::State &state) {
    const auto n = static_cast<size_t>(state.range(0));
    auto input = random_complex_spectrum({n, n, n});

    for (auto _ : state) {
        auto result = fourier::fourier_ellipsoid(
            input, std::vector<double>{2.0, 3.0, 4.0});
        benchmark::DoNotOptimize(result->data());
    }

    bench::set_filter_counters(state, input, sizeof(complex128_t));
}

} // namespace

BENCHMARK(BM_Gaussian2D_Float64)->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Uniform2D_Float64)->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Ellipsoid2D_Float64)->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Gaussian2D_Complex128_InPlace)
    ->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Shift2D_Complex128)->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Shift2D_RealHalfSpectrum)->Apply(ndfourier::bench::image_args);
BENCHMARK(BM_Ellipsoid3D_Complex128)->Apply(ndfourier::bench::volume_args);
