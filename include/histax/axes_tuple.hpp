#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include "array_tuple.hpp"
#include "axis.hpp"
#include "error.hpp"
#include "indexing.hpp"

namespace histax {

// The ordered, fixed set of axes of an N-dimensional histogram.
//
// The tuple shares its axes with the owning histogram and never copies
// them. It adds three things on top of plain sequence access:
//  * grid properties (centers/edges/widths) as sparse ArrayTuples,
//  * per-axis queries (value/bin/index) taking exactly one argument per axis,
//  * generic attribute forwarding by name (get_member/set_member).
//
// Not internally synchronized. set_member() writes into the shared axes and
// must not run concurrently with anything else touching them.
class AxesTuple {
  public:
    using value_type = std::shared_ptr<Axis>;
    using const_iterator = std::vector<value_type>::const_iterator;

    AxesTuple() = default;
    explicit AxesTuple(std::vector<std::shared_ptr<Axis>> axes);
    AxesTuple(std::initializer_list<std::shared_ptr<Axis>> axes);

    // Validates arbitrary polymorphic candidates. Throws TypeError on the
    // first null or non-Axis element; nothing is built in that case.
    template <typename T>
    static AxesTuple from(const std::vector<std::shared_ptr<T>> &items) {
        std::vector<std::shared_ptr<Axis>> axes;
        axes.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            std::shared_ptr<Axis> axis;
            if constexpr (std::is_base_of_v<Axis, T>) {
                axis = items[i];
            } else {
                static_assert(std::is_polymorphic_v<T>,
                              "candidates must be polymorphic to be checked");
                axis = std::dynamic_pointer_cast<Axis>(items[i]);
            }
            if (!axis) {
                throw TypeError::not_an_axis(
                    i, items[i] ? type_name(typeid(*items[i])) : "null");
            }
            axes.push_back(std::move(axis));
        }
        return AxesTuple(std::move(axes));
    }

    // ------------------------------------------------------------------
    // Sequence access
    // ------------------------------------------------------------------

    // Number of axes. size() is the per-axis bin count.
    size_t ndim() const { return axes_.size(); }
    bool empty() const { return axes_.empty(); }
    const std::shared_ptr<Axis> &operator[](size_t index) const;
    // Negative indices count from the end
    const std::shared_ptr<Axis> &at(int64_t index) const;
    AxesTuple operator[](const Slice &slice) const;
    const_iterator begin() const { return axes_.begin(); }
    const_iterator end() const { return axes_.end(); }

    bool operator==(const AxesTuple &other) const;
    bool operator!=(const AxesTuple &other) const { return !(*this == other); }

    // ------------------------------------------------------------------
    // Vectorized properties
    // ------------------------------------------------------------------

    std::vector<int> size() const;
    std::vector<int> extent() const;

    // Sparse ij-indexed grids: array i has shape 1 everywhere except
    // dimension i. Call broadcast() on the result for dense grids.
    ArrayTuple centers() const;
    ArrayTuple edges() const;
    ArrayTuple widths() const;

    // ------------------------------------------------------------------
    // Per-axis queries, exactly one argument per axis
    // ------------------------------------------------------------------

    std::vector<Coordinate> value(const std::vector<double> &indexes) const;
    std::vector<BinValue> bin(const std::vector<int> &indexes) const;
    std::vector<int> index(const std::vector<Coordinate> &values) const;

    template <typename... Args>
    std::vector<Coordinate> value(Args... indexes) const {
        return value(std::vector<double>{static_cast<double>(indexes)...});
    }

    template <typename... Args> std::vector<BinValue> bin(Args... indexes) const {
        return bin(std::vector<int>{static_cast<int>(indexes)...});
    }

    template <typename... Args>
    std::vector<int> index(const Args &...values) const {
        return index(std::vector<Coordinate>{make_coordinate(values)...});
    }

    // ------------------------------------------------------------------
    // Generic forwarding
    // ------------------------------------------------------------------

    // `name` read from every axis, in order
    std::vector<AttributeValue> get_member(const std::string &name) const;

    // values[i] written to axis i. Throws ArityError, before touching any
    // axis, unless there is exactly one value per axis.
    void set_member(const std::string &name,
                    const std::vector<AttributeValue> &values);

    std::string repr() const;

  private:
    // Readable name of a dynamic type, demangled where the ABI allows
    static std::string type_name(const std::type_info &type);

    void check_arity(size_t got) const;
    ArrayTuple grid(std::vector<double> (Axis::*getter)() const,
                    const char *what) const;

    std::vector<std::shared_ptr<Axis>> axes_;
};

} // namespace histax
