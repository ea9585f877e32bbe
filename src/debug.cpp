#include "histax/debug.hpp"
#include "histax/system.hpp"
#include "backends/cpu/cpu_reduce.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace histax {
namespace trace {

Tracer::Tracer() : enabled_(system::trace_requested()) {}

Tracer &Tracer::instance() {
    static Tracer tracer;
    return tracer;
}

void Tracer::record(const std::string &op_name, const std::string &desc,
                    std::chrono::nanoseconds duration, size_t memory_bytes,
                    bool materialized) {
    if (!enabled_)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({op_name, desc, std::chrono::steady_clock::now(),
                       duration, memory_bytes, materialized});
}

std::string Tracer::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    // Bytes per layout, split by op name in first-seen order
    struct Tally {
        std::string op_name;
        size_t calls = 0;
        size_t sparse_bytes = 0;
        size_t dense_bytes = 0;
        std::chrono::nanoseconds time{0};
    };
    std::vector<Tally> tallies;
    size_t sparse_total = 0;
    size_t dense_total = 0;

    oss << "=== Histax Trace (" << events_.size() << " events) ===\n";
    oss << std::left << std::setw(28) << "Operation" << std::setw(12)
        << "Time(us)" << std::setw(8) << "Layout" << std::setw(12) << "Bytes"
        << "Description\n";
    oss << std::string(80, '-') << "\n";

    for (const auto &event : events_) {
        oss << std::left << std::setw(28) << event.op_name << std::setw(12)
            << std::fixed << std::setprecision(2)
            << event.duration.count() / 1000.0 << std::setw(8)
            << (event.materialized          ? "dense"
                : event.memory_bytes > 0 ? "sparse"
                                         : "-")
            << std::setw(12)
            << event.memory_bytes << event.description << "\n";

        auto it = std::find_if(
            tallies.begin(), tallies.end(),
            [&event](const Tally &t) { return t.op_name == event.op_name; });
        if (it == tallies.end()) {
            tallies.push_back({event.op_name});
            it = tallies.end() - 1;
        }
        it->calls++;
        it->time += event.duration;
        if (event.materialized) {
            it->dense_bytes += event.memory_bytes;
            dense_total += event.memory_bytes;
        } else {
            it->sparse_bytes += event.memory_bytes;
            sparse_total += event.memory_bytes;
        }
    }

    oss << std::string(80, '-') << "\n";
    oss << std::left << std::setw(28) << "Per operation" << std::setw(8)
        << "Calls" << std::setw(14) << "Sparse(B)" << std::setw(14)
        << "Dense(B)" << "Time(us)\n";
    for (const auto &t : tallies) {
        oss << std::left << std::setw(28) << t.op_name << std::setw(8)
            << t.calls << std::setw(14) << t.sparse_bytes << std::setw(14)
            << t.dense_bytes << std::fixed << std::setprecision(2)
            << t.time.count() / 1000.0 << "\n";
    }

    oss << std::string(80, '-') << "\n";
    oss << "Sparse bytes: " << sparse_total << "\n";
    oss << "Dense bytes: " << dense_total << "\n";
    if (sparse_total > 0) {
        oss << "Dense/sparse ratio: " << std::fixed << std::setprecision(2)
            << static_cast<double>(dense_total) / sparse_total << "\n";
    }

    return oss.str();
}

ScopedTrace::ScopedTrace(const std::string &op_name, const std::string &desc,
                         size_t memory_bytes, bool materialized)
    : op_name_(op_name), desc_(desc), memory_bytes_(memory_bytes),
      materialized_(materialized) {
    if (Tracer::instance().is_enabled()) {
        start_ = std::chrono::steady_clock::now();
    }
}

ScopedTrace::~ScopedTrace() {
    if (Tracer::instance().is_enabled()) {
        auto end = std::chrono::steady_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
        Tracer::instance().record(op_name_, desc_, duration, memory_bytes_,
                                  materialized_);
    }
}

} // namespace trace

namespace cpu_info {

const char *simd_arch_name() {
    return backends::cpu::simd::get_simd_info().arch_name;
}

std::string simd_info_string() {
    return backends::cpu::simd::simd_info_string();
}

} // namespace cpu_info

} // namespace histax
