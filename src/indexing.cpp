#include "histax/indexing.hpp"
#include "histax/error.hpp"

namespace histax {

std::vector<size_t> slice_indices(const Slice &slice, size_t length) {
    const int64_t n = static_cast<int64_t>(length);
    const int64_t step = slice.step.value_or(1);
    if (step == 0) {
        throw IndexError::invalid_slice("slice step cannot be zero");
    }

    // Bounds differ by direction: forward slices clamp to [0, n], reverse
    // slices clamp to [-1, n - 1].
    const int64_t lower = step > 0 ? 0 : -1;
    const int64_t upper = step > 0 ? n : n - 1;

    auto resolve = [&](std::optional<int64_t> v, int64_t fallback) {
        if (!v)
            return fallback;
        int64_t i = *v < 0 ? *v + n : *v;
        if (i < lower)
            return lower;
        if (i > upper)
            return upper;
        return i;
    };

    int64_t start = resolve(slice.start, step > 0 ? lower : upper);
    int64_t stop = resolve(slice.stop, step > 0 ? upper : lower);

    std::vector<size_t> out;
    if (step > 0) {
        for (int64_t i = start; i < stop; i += step)
            out.push_back(static_cast<size_t>(i));
    } else {
        for (int64_t i = start; i > stop; i += step)
            out.push_back(static_cast<size_t>(i));
    }
    return out;
}

} // namespace histax
