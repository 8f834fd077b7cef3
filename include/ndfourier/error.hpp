#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <vector>

namespace ndfourier {

// ============================================================================
// Base ndfourier Exception
// ============================================================================

class NdfourierError : public std::exception {
  public:
    explicit NdfourierError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Shape-related errors
// ============================================================================

class ShapeError : public NdfourierError {
  public:
    explicit ShapeError(const std::string &message)
        : NdfourierError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        std::ostringstream oss;
        oss << "expected shape [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << expected[i];
        }
        oss << "] but got [";
        for (size_t i = 0; i < got.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << got[i];
        }
        oss << "]";
        return ShapeError(oss.str());
    }

    static ShapeError unsupported_rank(size_t ndim,
                                       const std::string &operation) {
        return ShapeError(operation + " is not implemented for rank " +
                          std::to_string(ndim) + " arrays");
    }

    static ShapeError expected_rank(size_t expected, size_t got,
                                    const std::string &what) {
        return ShapeError(what + " must have " + std::to_string(expected) +
                          " dimension(s) but has " + std::to_string(got));
    }
};

// ============================================================================
// Type-related errors
// ============================================================================

class TypeError : public NdfourierError {
  public:
    explicit TypeError(const std::string &message)
        : NdfourierError("TypeError: " + message) {}

    static TypeError unsupported_dtype(const std::string &dtype,
                                       const std::string &operation) {
        return TypeError("unsupported dtype '" + dtype + "' for " + operation);
    }

    static TypeError dtype_mismatch(const std::string &expected,
                                    const std::string &got) {
        return TypeError("expected dtype " + expected + " but got " + got);
    }
};

// ============================================================================
// Value-related errors
// ============================================================================

class ValueError : public NdfourierError {
  public:
    explicit ValueError(const std::string &message)
        : NdfourierError("ValueError: " + message) {}

    static ValueError length_mismatch(size_t expected, size_t got,
                                      const std::string &what) {
        return ValueError(what + " must have length " +
                          std::to_string(expected) +
                          " (one value per axis) but has length " +
                          std::to_string(got));
    }
};

// ============================================================================
// Index-related errors
// ============================================================================

class IndexError : public NdfourierError {
  public:
    explicit IndexError(const std::string &message)
        : NdfourierError("IndexError: " + message) {}

    static IndexError out_of_bounds(size_t index, size_t size, int dim = -1) {
        std::ostringstream oss;
        oss << "index " << index << " out of bounds for ";
        if (dim >= 0)
            oss << "dimension " << dim << " with ";
        oss << "size " << size;
        return IndexError(oss.str());
    }

    static IndexError axis_out_of_range(int axis, size_t ndim) {
        return IndexError("axis " + std::to_string(axis) +
                          " out of bounds for array with " +
                          std::to_string(ndim) + " dimensions");
    }
};

// ============================================================================
// Memory-related errors
// ============================================================================

class MemoryError : public NdfourierError {
  public:
    explicit MemoryError(const std::string &message)
        : NdfourierError("MemoryError: " + message) {}

    static MemoryError storage_too_small(size_t required, size_t available) {
        return MemoryError("storage has " + std::to_string(available) +
                           " bytes but " + std::to_string(required) +
                           " required");
    }
};

// ============================================================================
// Runtime/internal errors
// ============================================================================

class RuntimeError : public NdfourierError {
  public:
    explicit RuntimeError(const std::string &message)
        : NdfourierError("RuntimeError: " + message) {}

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

} // namespace ndfourier
