#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace histax {

struct Slice {
    std::optional<int64_t> start;
    std::optional<int64_t> stop;
    std::optional<int64_t> step;

    Slice(std::optional<int64_t> start_val = std::nullopt,
          std::optional<int64_t> stop_val = std::nullopt,
          std::optional<int64_t> step_val = std::nullopt)
        : start(start_val), stop(stop_val), step(step_val) {}
};

// Positions selected by `slice` from a sequence of `length` elements, with
// the usual clamping and negative-index rules. A zero step throws
// IndexError.
std::vector<size_t> slice_indices(const Slice &slice, size_t length);

} // namespace histax
