#include "histax/array.hpp"
#include "histax/debug.hpp"
#include "histax/error.hpp"
#include "backends/cpu/cpu_reduce.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace histax {

namespace {

std::string describe(const Shape &from, const Shape &to) {
    return ShapeUtils::to_string(from) + " -> " + ShapeUtils::to_string(to);
}

Array::Buffer make_buffer(std::vector<double> values) {
    return std::make_shared<const std::vector<double>>(std::move(values));
}

void format_values(std::ostringstream &oss, const std::vector<double> &data,
                   const Shape &shape, size_t dim, size_t &pos, int indent) {
    if (dim == shape.size()) {
        oss << data[pos++];
        return;
    }
    oss << "[";
    for (size_t i = 0; i < shape[dim]; ++i) {
        if (i > 0) {
            oss << ",";
            if (dim + 1 < shape.size()) {
                oss << "\n" << std::string(indent + 1, ' ');
            } else {
                oss << " ";
            }
        }
        format_values(oss, data, shape, dim + 1, pos, indent + 1);
    }
    oss << "]";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Array::Array() : repr_(Dense{make_buffer({})}), shape_{0} {}

Array::Array(std::variant<Sparse, Dense> repr, Shape shape)
    : repr_(std::move(repr)), shape_(std::move(shape)) {}

Array Array::sparse(std::vector<double> values, size_t axis, size_t rank) {
    if (rank == 0 || axis >= rank) {
        throw ShapeError::invalid_axis(static_cast<int>(axis),
                                       static_cast<int>(rank));
    }
    Shape shape(rank, 1);
    shape[axis] = values.size();
    return Array(Sparse{make_buffer(std::move(values)), axis, rank},
                 std::move(shape));
}

Array Array::dense(std::vector<double> values, const Shape &shape) {
    if (values.size() != ShapeUtils::size(shape)) {
        throw ShapeError::invalid_reshape(values.size(),
                                          ShapeUtils::size(shape));
    }
    return Array(Dense{make_buffer(std::move(values))}, shape);
}

Array Array::from_vector(std::vector<double> values) {
    Shape shape{values.size()};
    return Array(Dense{make_buffer(std::move(values))}, std::move(shape));
}

Array Array::full(const Shape &shape, double value) {
    return Array(
        Dense{make_buffer(std::vector<double>(ShapeUtils::size(shape), value))},
        shape);
}

Array Array::scalar(double value) { return full({}, value); }

// ============================================================================
// Attributes
// ============================================================================

Layout Array::layout() const {
    return std::holds_alternative<Sparse>(repr_) ? Layout::Sparse
                                                 : Layout::Dense;
}

const std::vector<double> &Array::buffer() const {
    return std::visit(
        [](const auto &r) -> const std::vector<double> & { return *r.data; },
        repr_);
}

Strides Array::strides() const {
    if (const auto *s = std::get_if<Sparse>(&repr_)) {
        Strides strides(s->rank, 0);
        strides[s->axis] = 1;
        return strides;
    }
    return ShapeUtils::calculate_strides(shape_);
}

size_t Array::sparse_axis() const {
    if (const auto *s = std::get_if<Sparse>(&repr_)) {
        return s->axis;
    }
    throw ValueError("sparse_axis() called on a dense array");
}

// ============================================================================
// Data access
// ============================================================================

double Array::item(const std::vector<size_t> &indices) const {
    if (indices.size() != ndim()) {
        throw IndexError("expected " + std::to_string(ndim()) +
                         " indices but got " + std::to_string(indices.size()));
    }
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] >= shape_[i]) {
            throw IndexError::out_of_bounds(
                static_cast<long long>(indices[i]), shape_[i],
                static_cast<int>(i));
        }
    }
    return buffer()[ShapeUtils::linear_index(indices, strides())];
}

double Array::item() const {
    if (size() != 1) {
        throw ValueError("can only convert an array of size 1 to a scalar");
    }
    return buffer()[0];
}

// Both layouts keep their buffer in row-major order of the logical
// elements, so the flat view is the buffer itself.
std::vector<double> Array::to_vector() const { return buffer(); }

template <typename F>
void Array::for_each_broadcast(const Shape &target, F &&fn) const {
    const auto &data = buffer();
    Strides bstrides = ShapeUtils::broadcast_strides(shape_, strides(), target);
    if (ShapeUtils::size(target) == 0)
        return;

    std::vector<size_t> coords(target.size(), 0);
    do {
        fn(data[ShapeUtils::linear_index(coords, bstrides)]);
    } while (ShapeUtils::increment_coords(coords, target));
}

// ============================================================================
// Layout conversion
// ============================================================================

Array Array::to_dense() const {
    trace::ScopedTrace trace("to_dense", ShapeUtils::to_string(shape_));
    if (const auto *s = std::get_if<Sparse>(&repr_)) {
        return Array(Dense{s->data}, shape_);
    }
    return *this;
}

Array Array::broadcast_to(const Shape &shape) const {
    if (is_dense() && shape == shape_) {
        return *this;
    }

    size_t total = ShapeUtils::size(shape);
    trace::ScopedTrace trace("broadcast_to", describe(shape_, shape),
                             total * sizeof(double), true);

    std::vector<double> out;
    out.reserve(total);
    for_each_broadcast(shape, [&out](double v) { out.push_back(v); });
    return Array(Dense{make_buffer(std::move(out))}, shape);
}

Array Array::reshape(const Shape &new_shape) const {
    if (ShapeUtils::size(new_shape) != size()) {
        throw ShapeError::invalid_reshape(size(),
                                          ShapeUtils::size(new_shape));
    }
    return Array(Dense{std::visit([](const auto &r) { return r.data; }, repr_)},
                 new_shape);
}

// ============================================================================
// Element-wise transforms
// ============================================================================

Array Array::map(const std::function<double(double)> &fn) const {
    const auto &data = buffer();
    std::vector<double> out(data.size());
    std::transform(data.begin(), data.end(), out.begin(), fn);

    if (const auto *s = std::get_if<Sparse>(&repr_)) {
        return Array(Sparse{make_buffer(std::move(out)), s->axis, s->rank},
                     shape_);
    }
    return Array(Dense{make_buffer(std::move(out))}, shape_);
}

Array Array::operator-() const {
    return map([](double v) { return -v; });
}

Array binary_op(const Array &lhs, const Array &rhs,
                const std::function<double(double, double)> &fn) {
    const auto *ls = std::get_if<Array::Sparse>(&lhs.repr_);
    const auto *rs = std::get_if<Array::Sparse>(&rhs.repr_);
    if (ls && rs && lhs.shape_ == rhs.shape_ && ls->axis == rs->axis) {
        const auto &a = *ls->data;
        const auto &b = *rs->data;
        std::vector<double> out(a.size());
        for (size_t i = 0; i < a.size(); ++i) {
            out[i] = fn(a[i], b[i]);
        }
        return Array(Array::Sparse{make_buffer(std::move(out)), ls->axis,
                                   ls->rank},
                     lhs.shape_);
    }

    Shape target = ShapeUtils::broadcast_shape(lhs.shape_, rhs.shape_);
    size_t total = ShapeUtils::size(target);
    trace::ScopedTrace trace("binary_op", describe(lhs.shape_, target),
                             total * sizeof(double), true);

    std::vector<double> a;
    std::vector<double> b;
    a.reserve(total);
    b.reserve(total);
    lhs.for_each_broadcast(target, [&a](double v) { a.push_back(v); });
    rhs.for_each_broadcast(target, [&b](double v) { b.push_back(v); });
    for (size_t i = 0; i < total; ++i) {
        a[i] = fn(a[i], b[i]);
    }
    return Array(Array::Dense{make_buffer(std::move(a))}, std::move(target));
}

Array operator+(const Array &lhs, const Array &rhs) {
    return binary_op(lhs, rhs, [](double a, double b) { return a + b; });
}
Array operator-(const Array &lhs, const Array &rhs) {
    return binary_op(lhs, rhs, [](double a, double b) { return a - b; });
}
Array operator*(const Array &lhs, const Array &rhs) {
    return binary_op(lhs, rhs, [](double a, double b) { return a * b; });
}
Array operator/(const Array &lhs, const Array &rhs) {
    return binary_op(lhs, rhs, [](double a, double b) { return a / b; });
}

Array operator+(const Array &lhs, double rhs) {
    return lhs.map([rhs](double v) { return v + rhs; });
}
Array operator-(const Array &lhs, double rhs) {
    return lhs.map([rhs](double v) { return v - rhs; });
}
Array operator*(const Array &lhs, double rhs) {
    return lhs.map([rhs](double v) { return v * rhs; });
}
Array operator/(const Array &lhs, double rhs) {
    return lhs.map([rhs](double v) { return v / rhs; });
}
Array operator+(double lhs, const Array &rhs) { return rhs + lhs; }
Array operator-(double lhs, const Array &rhs) {
    return rhs.map([lhs](double v) { return lhs - v; });
}
Array operator*(double lhs, const Array &rhs) { return rhs * lhs; }
Array operator/(double lhs, const Array &rhs) {
    return rhs.map([lhs](double v) { return lhs / v; });
}

// ============================================================================
// Reductions
// ============================================================================

double Array::reduce(Reduction op) const {
    const auto &data = buffer();
    return backends::cpu::simd::reduce_contiguous(op, data.data(),
                                                  data.size());
}

Array Array::reduce(Reduction op, int axis) const {
    size_t ax = static_cast<size_t>(ShapeUtils::normalize_axis(axis, ndim()));
    auto s = ShapeUtils::axis_outer_inner(shape_, ax);
    const double *data = buffer().data();

    Shape out_shape;
    for (size_t i = 0; i < shape_.size(); ++i) {
        if (i != ax)
            out_shape.push_back(shape_[i]);
    }

    std::vector<double> out(s.outer * s.inner);
    std::vector<double> lane(s.axis);
    for (size_t o = 0; o < s.outer; ++o) {
        for (size_t in = 0; in < s.inner; ++in) {
            const double *base = data + o * s.axis * s.inner + in;
            const double *p = base;
            if (s.inner != 1) {
                for (size_t k = 0; k < s.axis; ++k) {
                    lane[k] = base[k * s.inner];
                }
                p = lane.data();
            }
            out[o * s.inner + in] =
                backends::cpu::simd::reduce_contiguous(op, p, s.axis);
        }
    }
    return Array(Dense{make_buffer(std::move(out))}, std::move(out_shape));
}

// ============================================================================
// Comparison
// ============================================================================

bool Array::allclose(const Array &other, double rtol, double atol) const {
    if (!ShapeUtils::broadcastable(shape_, other.shape_)) {
        return false;
    }
    Shape target = ShapeUtils::broadcast_shape(shape_, other.shape_);

    std::vector<double> a;
    std::vector<double> b;
    for_each_broadcast(target, [&a](double v) { a.push_back(v); });
    other.for_each_broadcast(target, [&b](double v) { b.push_back(v); });

    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] == b[i])
            continue; // also covers matching infinities
        if (!(std::abs(a[i] - b[i]) <= atol + rtol * std::abs(b[i])))
            return false;
    }
    return true;
}

bool Array::array_equal(const Array &other) const {
    return shape_ == other.shape_ && buffer() == other.buffer();
}

// ============================================================================
// Printing
// ============================================================================

std::string Array::repr() const {
    std::ostringstream oss;
    oss << "Array(shape=" << ShapeUtils::to_string(shape_)
        << ", layout=" << (is_sparse() ? "Sparse" : "Dense");
    if (const auto *s = std::get_if<Sparse>(&repr_)) {
        oss << ", axis=" << s->axis;
    }
    oss << ", nbytes=" << nbytes() << ")";
    return oss.str();
}

std::string Array::str() const {
    std::ostringstream oss;
    size_t pos = 0;
    format_values(oss, buffer(), shape_, 0, pos, 0);
    return oss.str();
}

} // namespace histax
