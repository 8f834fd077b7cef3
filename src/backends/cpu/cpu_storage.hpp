#pragma once

#include "ndfourier/storage.hpp"

#include <cstdint>
#include <memory>

namespace ndfourier {
namespace backends {
namespace cpu {

// CPU storage implementation
class CPUStorage : public Storage {
private:
    std::shared_ptr<uint8_t[]> data_;
    size_t size_bytes_;

public:
    // Create new zero-filled CPU storage
    explicit CPUStorage(size_t size_bytes);

    void* data() override;
    const void* data() const override;
    size_t size_bytes() const override;
};

// CPU backend factory function
std::unique_ptr<Storage> make_cpu_storage(size_t size_bytes);

} // namespace cpu
} // namespace backends
} // namespace ndfourier
