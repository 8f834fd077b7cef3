#pragma once

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace ndfourier {
namespace trace {

struct TraceEvent {
    std::string op_name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
    size_t memory_bytes;
    bool materialized; // Did this op allocate new memory?
};

// Process-wide recorder for filter invocations. Starts enabled when the
// NDFOURIER_TRACE environment variable is set to "1".
class Tracer {
  public:
    static Tracer &instance();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    void record(const std::string &op_name, const std::string &desc,
                std::chrono::nanoseconds duration, size_t memory_bytes,
                bool materialized);

    std::string dump() const;

    std::vector<TraceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

  private:
    Tracer();
    std::atomic<bool> enabled_{false};
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

inline void enable() { Tracer::instance().enable(); }
inline void disable() { Tracer::instance().disable(); }
inline void clear() { Tracer::instance().clear(); }
inline std::string dump() { return Tracer::instance().dump(); }
inline bool is_enabled() { return Tracer::instance().is_enabled(); }

class ScopedTrace {
  public:
    ScopedTrace(const std::string &op_name, const std::string &desc = "",
                size_t memory_bytes = 0, bool materialized = false);
    ~ScopedTrace();

    ScopedTrace(const ScopedTrace &) = delete;
    ScopedTrace &operator=(const ScopedTrace &) = delete;

    void set_description(const std::string &desc) { desc_ = desc; }
    void set_memory(size_t memory_bytes, bool materialized) {
        memory_bytes_ = memory_bytes;
        materialized_ = materialized;
    }

  private:
    std::string op_name_;
    std::string desc_;
    std::chrono::steady_clock::time_point start_;
    size_t memory_bytes_;
    bool materialized_;
};

} // namespace trace
} // namespace ndfourier
