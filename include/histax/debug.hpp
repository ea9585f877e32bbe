#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace histax {

namespace trace {

struct TraceEvent {
    std::string op_name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
    size_t memory_bytes;
    bool materialized; // Did this op allocate a full dense grid?
};

// Records grid construction and broadcasting. Disabled unless enable() is
// called or HISTAX_TRACE=1 is set in the environment.
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

    // Snapshot, safe to call while other threads record.
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

    // For ops whose allocation is only known after the work is done
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

// ============================================================================
// SIMD/Backend Diagnostics
// ============================================================================

namespace cpu_info {

// Get SIMD architecture name (e.g., "neon64", "avx2", "sse4.2")
const char *simd_arch_name();

// Get SIMD info as a compact string
std::string simd_info_string();

} // namespace cpu_info

} // namespace histax
