#include <ndfourier/ndfourier.hpp>
#include <iomanip>
#include <iostream>

using namespace ndfourier;

void print_row(const Tensor& t, size_t row) {
  std::cout << "  ";
  for (size_t j = 0; j < t.shape()[1]; ++j) {
    auto v = t.item<complex128_t>({row, j});
    std::cout << std::fixed << std::setprecision(4) << "(" << v.real() << ", "
              << v.imag() << ") ";
  }
  std::cout << "\n";
}

int main() {
  trace::enable();

  // A flat spectrum: every frequency has unit amplitude
  auto spectrum = Tensor::ones({4, 4});

  // Gaussian smoothing returns a new float64 array
  auto smoothed = fourier::fourier_gaussian(spectrum, 1.0);
  std::cout << smoothed->repr() << "\n";
  std::cout << "  weight at (0, 1): " << smoothed->item<double>({0, 1})
            << "\n";

  // Per-axis box sizes, written into a caller-provided buffer
  auto boxed = Tensor::zeros({4, 4}, DType::Float32);
  fourier::fourier_uniform(spectrum, std::vector<double>{2.0, 1.0}, -1, -1,
                           boxed);
  std::cout << boxed.repr() << "\n";

  // A sub-pixel shift always produces a complex spectrum
  auto shifted = fourier::fourier_shift(spectrum, 0.5);
  std::cout << shifted->repr() << "\n";
  print_row(*shifted, 1);

  // Half-spectrum of a real transform: 3 stored bins of a length-4 axis
  auto half = Tensor::ones({4, 3}, DType::Complex64);
  fourier::fourier_ellipsoid(half, 2.0, 4, -1, half);
  std::cout << half.repr() << " filtered in place\n";

  try {
    fourier::fourier_ellipsoid(Tensor::ones({2, 2, 2, 2}), 1.0);
  } catch (const NdfourierError& e) {
    std::cout << "Error: " << e.what() << "\n";
  }

  std::cout << trace::dump();
  return 0;
}
