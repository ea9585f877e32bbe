#include "histax/axes_tuple.hpp"
#include "histax/debug.hpp"
#include "histax/grid.hpp"

#include <cstdlib>
#include <sstream>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace histax {

AxesTuple::AxesTuple(std::vector<std::shared_ptr<Axis>> axes)
    : axes_(std::move(axes)) {
    for (size_t i = 0; i < axes_.size(); ++i) {
        if (!axes_[i]) {
            throw TypeError::not_an_axis(i, "null");
        }
    }
}

std::string AxesTuple::type_name(const std::type_info &type) {
#if defined(__GNUG__)
    int status = 0;
    char *demangled =
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status);
    if (status == 0 && demangled != nullptr) {
        std::string name(demangled);
        std::free(demangled);
        return name;
    }
    std::free(demangled);
#endif
    return type.name();
}

AxesTuple::AxesTuple(std::initializer_list<std::shared_ptr<Axis>> axes)
    : AxesTuple(std::vector<std::shared_ptr<Axis>>(axes)) {}

// ============================================================================
// Sequence access
// ============================================================================

const std::shared_ptr<Axis> &AxesTuple::operator[](size_t index) const {
    if (index >= axes_.size()) {
        throw IndexError::out_of_bounds(static_cast<long long>(index),
                                        axes_.size());
    }
    return axes_[index];
}

const std::shared_ptr<Axis> &AxesTuple::at(int64_t index) const {
    int64_t n = static_cast<int64_t>(axes_.size());
    int64_t i = index < 0 ? index + n : index;
    if (i < 0 || i >= n) {
        throw IndexError::out_of_bounds(index, axes_.size());
    }
    return axes_[static_cast<size_t>(i)];
}

AxesTuple AxesTuple::operator[](const Slice &slice) const {
    std::vector<std::shared_ptr<Axis>> picked;
    for (size_t i : slice_indices(slice, axes_.size())) {
        picked.push_back(axes_[i]);
    }
    return AxesTuple(std::move(picked));
}

// Members compare by identity: two tuples are equal when they view the
// same axis objects in the same order.
bool AxesTuple::operator==(const AxesTuple &other) const {
    return axes_ == other.axes_;
}

// ============================================================================
// Vectorized properties
// ============================================================================

std::vector<int> AxesTuple::size() const {
    std::vector<int> out;
    out.reserve(axes_.size());
    for (const auto &axis : axes_) {
        out.push_back(axis->size());
    }
    return out;
}

std::vector<int> AxesTuple::extent() const {
    std::vector<int> out;
    out.reserve(axes_.size());
    for (const auto &axis : axes_) {
        out.push_back(axis->extent());
    }
    return out;
}

ArrayTuple AxesTuple::grid(std::vector<double> (Axis::*getter)() const,
                           const char *what) const {
    trace::ScopedTrace trace(std::string("AxesTuple::") + what,
                             std::to_string(axes_.size()) + " axes");
    std::vector<std::vector<double>> vectors;
    vectors.reserve(axes_.size());
    for (const auto &axis : axes_) {
        vectors.push_back(((*axis).*getter)());
    }
    return ArrayTuple(ops::meshgrid(vectors, true, ops::Indexing::IJ));
}

ArrayTuple AxesTuple::centers() const {
    return grid(&Axis::centers, "centers");
}

ArrayTuple AxesTuple::edges() const { return grid(&Axis::edges, "edges"); }

ArrayTuple AxesTuple::widths() const {
    return grid(&Axis::widths, "widths");
}

// ============================================================================
// Per-axis queries
// ============================================================================

void AxesTuple::check_arity(size_t got) const {
    if (got != axes_.size()) {
        throw ArityError::mismatch(axes_.size(), got);
    }
}

std::vector<Coordinate>
AxesTuple::value(const std::vector<double> &indexes) const {
    check_arity(indexes.size());
    std::vector<Coordinate> out;
    out.reserve(axes_.size());
    for (size_t i = 0; i < axes_.size(); ++i) {
        out.push_back(axes_[i]->value(indexes[i]));
    }
    return out;
}

std::vector<BinValue> AxesTuple::bin(const std::vector<int> &indexes) const {
    check_arity(indexes.size());
    std::vector<BinValue> out;
    out.reserve(axes_.size());
    for (size_t i = 0; i < axes_.size(); ++i) {
        out.push_back(axes_[i]->bin(indexes[i]));
    }
    return out;
}

std::vector<int> AxesTuple::index(const std::vector<Coordinate> &values) const {
    check_arity(values.size());
    std::vector<int> out;
    out.reserve(axes_.size());
    for (size_t i = 0; i < axes_.size(); ++i) {
        out.push_back(axes_[i]->index(values[i]));
    }
    return out;
}

// ============================================================================
// Generic forwarding
// ============================================================================

std::vector<AttributeValue>
AxesTuple::get_member(const std::string &name) const {
    std::vector<AttributeValue> out;
    out.reserve(axes_.size());
    for (const auto &axis : axes_) {
        out.push_back(axis->get_attribute(name));
    }
    return out;
}

void AxesTuple::set_member(const std::string &name,
                           const std::vector<AttributeValue> &values) {
    check_arity(values.size());
    for (size_t i = 0; i < axes_.size(); ++i) {
        axes_[i]->set_attribute(name, values[i]);
    }
}

std::string AxesTuple::repr() const {
    std::ostringstream oss;
    oss << "AxesTuple(";
    for (size_t i = 0; i < axes_.size(); ++i) {
        oss << (i == 0 ? "\n  " : ",\n  ") << axes_[i]->repr();
    }
    oss << (axes_.empty() ? ")" : "\n)");
    return oss.str();
}

} // namespace histax
