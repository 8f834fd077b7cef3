#pragma once

#include <benchmark/benchmark.h>

#include <ndfourier/ndfourier.hpp>
#include <complex>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace ndfourier::bench {

// ============================================================================
// Standard Spectrum Sizes for Benchmarking
// ============================================================================

// Square image sizes: small ones are overhead-dominated
constexpr int kImageSizes[] = {64, 128, 256, 512, 1024};

// Volume edge lengths for 3-D spectra
constexpr int kVolumeSizes[] = {16, 32, 64, 128};

// ============================================================================
// Input Generation
// ============================================================================

/// Random real spectrum with values in [-1, 1)
inline Tensor random_real_spectrum(const Shape &shape, uint64_t seed = 42) {
    std::vector<double> data(ShapeUtils::size(shape));
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    for (auto &v : data) {
        v = dist(rng);
    }
    return Tensor::from_data(data.data(), shape);
}

/// Random complex spectrum with both parts in [-1, 1)
inline Tensor random_complex_spectrum(const Shape &shape, uint64_t seed = 42) {
    std::vector<complex128_t> data(ShapeUtils::size(shape));
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> dist(-1.0, 1.0);
    for (auto &v : data) {
        v = complex128_t(dist(rng), dist(rng));
    }
    return Tensor::from_data(data.data(), shape);
}

// ============================================================================
// Benchmark Registration Helpers
// ============================================================================

/// Generate arguments for square 2-D spectra
inline void image_args(benchmark::internal::Benchmark *b) {
    for (int size : kImageSizes) {
        b->Arg(size);
    }
}

/// Generate arguments for cubic 3-D spectra
inline void volume_args(benchmark::internal::Benchmark *b) {
    for (int size : kVolumeSizes) {
        b->Arg(size);
    }
}

// ============================================================================
// Benchmark State Helpers
// ============================================================================

/// Bytes read and written plus element throughput for one filter pass
inline void set_filter_counters(benchmark::State &state, const Tensor &input,
                                size_t output_itemsize) {
    const auto elements = static_cast<int64_t>(input.size());
    state.SetItemsProcessed(state.iterations() * elements);
    state.SetBytesProcessed(
        state.iterations() * elements *
        static_cast<int64_t>(input.itemsize() + output_itemsize));
}

/// Descriptive label for a spectrum shape, e.g. "256x256"
inline std::string shape_name(const Shape &shape) {
    std::string name;
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            name += "x";
        name += std::to_string(shape[i]);
    }
    return name;
}

}  // namespace ndfourier::bench
