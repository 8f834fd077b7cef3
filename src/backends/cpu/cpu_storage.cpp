#include "cpu_storage.hpp"

#include <algorithm>

namespace ndfourier {
namespace backends {
namespace cpu {

// ============================================================================
// CPUStorage Implementation
// ============================================================================

// Value-initialized so freshly provisioned outputs start out as zeros
CPUStorage::CPUStorage(size_t size_bytes)
    : data_(new uint8_t[std::max<size_t>(size_bytes, 1)](),
            std::default_delete<uint8_t[]>()),
      size_bytes_(size_bytes) {}

void* CPUStorage::data() { return data_.get(); }

const void* CPUStorage::data() const { return data_.get(); }

size_t CPUStorage::size_bytes() const { return size_bytes_; }

// ============================================================================
// Factory functions
// ============================================================================

std::unique_ptr<Storage> make_cpu_storage(size_t size_bytes) {
  return std::make_unique<CPUStorage>(size_bytes);
}

}  // namespace cpu
}  // namespace backends
}  // namespace ndfourier
