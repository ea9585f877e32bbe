#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <limits>
#include <string>
#include <xsimd/xsimd.hpp>

#include "histax/error.hpp"
#include "histax/reduction.hpp"

namespace histax {
namespace backends {
namespace cpu {
namespace simd {

// ============================================================================
// SIMD Architecture Info
// ============================================================================

struct SimdInfo {
    const char *arch_name; // Architecture name (e.g., "neon64", "avx2")
    size_t alignment;      // Required alignment in bytes
    size_t float64_width;  // Vector width for double (elements)
};

inline SimdInfo get_simd_info() {
    using arch = xsimd::default_arch;
    return SimdInfo{
        arch::name(),
        arch::alignment(),
        xsimd::batch<double>::size,
    };
}

inline std::string simd_info_string() {
    auto info = get_simd_info();
    char buf[256];
    std::snprintf(buf, sizeof(buf), "SIMD: %s (align=%zu, f64x%zu)",
                  info.arch_name, info.alignment, info.float64_width);
    return std::string(buf);
}

// ============================================================================
// Contiguous double reductions
// ============================================================================

using batch_type = xsimd::batch<double>;
inline constexpr size_t kWidth = batch_type::size;

inline bool contains_nan(const double *p, size_t n) {
    return std::any_of(p, p + n, [](double v) { return std::isnan(v); });
}

inline double reduce_sum(const double *p, size_t n) {
    size_t i = 0;
    double result = 0.0;
    if (n >= kWidth) {
        auto acc = batch_type::broadcast(0.0);
        for (; i + kWidth <= n; i += kWidth) {
            acc += batch_type::load_unaligned(p + i);
        }
        result = xsimd::reduce_add(acc);
    }
    for (; i < n; ++i) {
        result += p[i];
    }
    return result;
}

inline double reduce_prod(const double *p, size_t n) {
    size_t i = 0;
    double result = 1.0;
    if (n >= kWidth) {
        auto acc = batch_type::broadcast(1.0);
        for (; i + kWidth <= n; i += kWidth) {
            acc *= batch_type::load_unaligned(p + i);
        }
        double lanes[kWidth];
        acc.store_unaligned(lanes);
        for (size_t k = 0; k < kWidth; ++k) {
            result *= lanes[k];
        }
    }
    for (; i < n; ++i) {
        result *= p[i];
    }
    return result;
}

// Caller guarantees n > 0. NaN propagates.
inline double reduce_max(const double *p, size_t n) {
    if (contains_nan(p, n))
        return std::numeric_limits<double>::quiet_NaN();
    size_t i = 0;
    double result = -std::numeric_limits<double>::infinity();
    if (n >= kWidth) {
        auto acc = batch_type::load_unaligned(p);
        for (i = kWidth; i + kWidth <= n; i += kWidth) {
            acc = xsimd::max(acc, batch_type::load_unaligned(p + i));
        }
        result = xsimd::reduce_max(acc);
    }
    for (; i < n; ++i) {
        result = std::max(result, p[i]);
    }
    return result;
}

// Caller guarantees n > 0. NaN propagates.
inline double reduce_min(const double *p, size_t n) {
    if (contains_nan(p, n))
        return std::numeric_limits<double>::quiet_NaN();
    size_t i = 0;
    double result = std::numeric_limits<double>::infinity();
    if (n >= kWidth) {
        auto acc = batch_type::load_unaligned(p);
        for (i = kWidth; i + kWidth <= n; i += kWidth) {
            acc = xsimd::min(acc, batch_type::load_unaligned(p + i));
        }
        result = xsimd::reduce_min(acc);
    }
    for (; i < n; ++i) {
        result = std::min(result, p[i]);
    }
    return result;
}

inline bool reduce_any(const double *p, size_t n) {
    return std::any_of(p, p + n, [](double v) { return v != 0.0; });
}

inline bool reduce_all(const double *p, size_t n) {
    return std::all_of(p, p + n, [](double v) { return v != 0.0; });
}

// Any/All yield 1.0 or 0.0.
inline double reduce_contiguous(Reduction op, const double *p, size_t n) {
    switch (op) {
    case Reduction::Sum:
        return reduce_sum(p, n);
    case Reduction::Prod:
        return reduce_prod(p, n);
    case Reduction::Any:
        return reduce_any(p, n) ? 1.0 : 0.0;
    case Reduction::All:
        return reduce_all(p, n) ? 1.0 : 0.0;
    case Reduction::Min:
        if (n == 0)
            throw ValueError::empty_reduction("minimum");
        return reduce_min(p, n);
    case Reduction::Max:
        if (n == 0)
            throw ValueError::empty_reduction("maximum");
        return reduce_max(p, n);
    }
    throw RuntimeError::internal("unknown reduction");
}

} // namespace simd
} // namespace cpu
} // namespace backends
} // namespace histax
