#include "ndfourier/storage.hpp"

#include "backends/cpu/cpu_storage.hpp"

namespace ndfourier {

std::unique_ptr<Storage> make_storage(size_t size_bytes) {
  return backends::cpu::make_cpu_storage(size_bytes);
}

}  // namespace ndfourier
