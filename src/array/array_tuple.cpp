#include "histax/array_tuple.hpp"
#include "histax/debug.hpp"
#include "histax/error.hpp"
#include "histax/grid.hpp"

#include <algorithm>
#include <sstream>

namespace histax {

ArrayTuple::ArrayTuple(std::vector<Array> arrays)
    : arrays_(std::move(arrays)) {}

ArrayTuple::ArrayTuple(std::initializer_list<Array> arrays)
    : arrays_(arrays) {}

const Array &ArrayTuple::at(int64_t index) const {
    int64_t n = static_cast<int64_t>(arrays_.size());
    int64_t i = index < 0 ? index + n : index;
    if (i < 0 || i >= n) {
        throw IndexError::out_of_bounds(index, arrays_.size());
    }
    return arrays_[static_cast<size_t>(i)];
}

ArrayTuple ArrayTuple::broadcast() const {
    trace::ScopedTrace trace("ArrayTuple::broadcast",
                             std::to_string(arrays_.size()) + " members");
    return ArrayTuple(ops::broadcast_arrays(arrays_));
}

Shape ArrayTuple::broadcast_shape() const {
    std::vector<Shape> shapes;
    shapes.reserve(arrays_.size());
    for (const auto &a : arrays_) {
        shapes.push_back(a.shape());
    }
    return ops::broadcast_shapes(shapes);
}

Array ArrayTuple::stacked() const {
    return ops::stack(ops::broadcast_arrays(arrays_));
}

double ArrayTuple::reduce(Reduction op) const {
    trace::ScopedTrace trace(std::string("ArrayTuple::") + reduction_name(op),
                             std::to_string(arrays_.size()) + " members");
    return stacked().reduce(op);
}

Array ArrayTuple::reduce(Reduction op, int axis) const {
    trace::ScopedTrace trace(std::string("ArrayTuple::") + reduction_name(op),
                             std::to_string(arrays_.size()) +
                                 " members, axis=" + std::to_string(axis));
    return stacked().reduce(op, axis);
}

std::vector<std::string> ArrayTuple::member_names() {
    std::vector<std::string> names = {
        // ArrayTuple
        "all", "any", "apply", "arrays", "at", "broadcast", "broadcast_shape",
        "map", "max", "member_names", "min", "prod", "reduce", "repr", "size",
        "sum",
        // Array
        "allclose", "array_equal", "broadcast_to", "empty", "is_dense",
        "is_sparse", "item", "layout", "nbytes", "ndim", "ravel", "reshape",
        "shape", "sparse_axis", "str", "strides", "to_dense", "to_vector",
        "values"};
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

std::string ArrayTuple::repr() const {
    std::ostringstream oss;
    oss << "ArrayTuple(";
    for (size_t i = 0; i < arrays_.size(); ++i) {
        oss << (i == 0 ? "\n  " : ",\n  ") << arrays_[i].repr();
    }
    oss << (arrays_.empty() ? ")" : "\n)");
    return oss.str();
}

} // namespace histax
