#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "array.hpp"
#include "reduction.hpp"
#include "shape.hpp"

namespace histax {

// An immutable, ordered group of broadcast-compatible arrays, typically one
// per histogram axis, handled as one value.
//
// Two operation sets are kept apart on purpose:
//  * map()/apply() forward to every member and gather the results;
//  * reduce() and the named reductions act once on the whole ensemble,
//    after all members are broadcast to their common shape and stacked.
// The names sum/any/all/min/max/prod on an ArrayTuple therefore always
// mean the ensemble reduction. Use apply(&Array::sum) for per-member sums.
class ArrayTuple {
  public:
    using value_type = Array;
    using const_iterator = std::vector<Array>::const_iterator;

    ArrayTuple() = default;
    explicit ArrayTuple(std::vector<Array> arrays);
    ArrayTuple(std::initializer_list<Array> arrays);

    // Sequence access
    size_t size() const { return arrays_.size(); }
    bool empty() const { return arrays_.empty(); }
    const Array &operator[](size_t index) const { return arrays_[index]; }
    // Bounds-checked; negative indices count from the end
    const Array &at(int64_t index) const;
    const_iterator begin() const { return arrays_.begin(); }
    const_iterator end() const { return arrays_.end(); }
    const std::vector<Array> &arrays() const { return arrays_; }

    // ------------------------------------------------------------------
    // Per-member forwarding
    // ------------------------------------------------------------------

    // New tuple of fn(member) for every member
    template <typename F> ArrayTuple map(F &&fn) const {
        std::vector<Array> out;
        out.reserve(arrays_.size());
        for (const auto &a : arrays_) {
            out.push_back(std::invoke(fn, a));
        }
        return ArrayTuple(std::move(out));
    }

    // Invokes `member` (an Array accessor or method, or any callable taking
    // an Array) on every member with the same arguments. Array results come
    // back as an ArrayTuple, anything else as a vector in member order.
    template <typename M, typename... Args>
    auto apply(M &&member, Args &&...args) const {
        using R = std::decay_t<std::invoke_result_t<M, const Array &, Args...>>;
        if constexpr (std::is_same_v<R, Array>) {
            return map([&](const Array &a) {
                return std::invoke(member, a, args...);
            });
        } else {
            std::vector<R> out;
            out.reserve(arrays_.size());
            for (const auto &a : arrays_) {
                out.push_back(std::invoke(member, a, args...));
            }
            return out;
        }
    }

    // ------------------------------------------------------------------
    // Ensemble operations
    // ------------------------------------------------------------------

    // Members materialized at the common dense shape. Same logical values.
    ArrayTuple broadcast() const;
    Shape broadcast_shape() const;

    double reduce(Reduction op) const;
    // Reduces one axis of the stacked ensemble; axis 0 runs across members
    Array reduce(Reduction op, int axis) const;

    double sum() const { return reduce(Reduction::Sum); }
    double prod() const { return reduce(Reduction::Prod); }
    double min() const { return reduce(Reduction::Min); }
    double max() const { return reduce(Reduction::Max); }
    bool any() const { return reduce(Reduction::Any) != 0.0; }
    bool all() const { return reduce(Reduction::All) != 0.0; }

    // Sorted public names usable on the tuple and its members, for
    // completion in interactive front ends
    static std::vector<std::string> member_names();

    std::string repr() const;

  private:
    Array stacked() const;

    std::vector<Array> arrays_;
};

} // namespace histax
