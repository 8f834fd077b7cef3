#pragma once

#include <cstddef>
#include <memory>

namespace ndfourier {

// Abstract base class for array storage
class Storage {
 public:
  virtual ~Storage() = default;

  // Get raw data pointer
  virtual void* data() = 0;
  virtual const void* data() const = 0;

  // Get size in bytes
  virtual size_t size_bytes() const = 0;
};

// Allocates zero-initialized host storage
std::unique_ptr<Storage> make_storage(size_t size_bytes);

}  // namespace ndfourier
