#pragma once

#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "reduction.hpp"
#include "shape.hpp"

namespace histax {

enum class Layout {
    Sparse, // one full dimension, every other dimension a singleton
    Dense   // row-major buffer of the full shape
};

// Immutable N-dimensional array of doubles.
//
// A sparse array stores only the values along its single non-singleton
// dimension and stands in for the full grid through broadcasting. Both
// representations share their buffer between copies; no operation writes
// into a buffer after construction.
class Array {
  public:
    using Buffer = std::shared_ptr<const std::vector<double>>;

    struct Sparse {
        Buffer data;
        size_t axis;
        size_t rank;
    };

    struct Dense {
        Buffer data;
    };

    Array();

    // Factories
    static Array sparse(std::vector<double> values, size_t axis, size_t rank);
    static Array dense(std::vector<double> values, const Shape &shape);
    static Array from_vector(std::vector<double> values);
    static Array full(const Shape &shape, double value);
    static Array scalar(double value);

    // Core attributes
    const Shape &shape() const { return shape_; }
    size_t ndim() const { return shape_.size(); }
    size_t size() const { return ShapeUtils::size(shape_); }
    // Bytes actually held by the buffer, not the logical size
    size_t nbytes() const { return buffer().size() * sizeof(double); }
    Layout layout() const;
    bool is_sparse() const { return layout() == Layout::Sparse; }
    bool is_dense() const { return layout() == Layout::Dense; }
    bool empty() const { return size() == 0; }
    Strides strides() const;

    // Sparse: the values along the full dimension. Dense: row-major data.
    const std::vector<double> &values() const { return buffer(); }
    // Index of the full dimension of a sparse array
    size_t sparse_axis() const;

    // Data access
    double item(const std::vector<size_t> &indices) const;
    double item() const;
    std::vector<double> to_vector() const;

    // Layout conversion
    Array to_dense() const;
    Array broadcast_to(const Shape &shape) const;
    Array reshape(const Shape &new_shape) const;
    Array ravel() const { return reshape({size()}); }

    // Element-wise transforms; the result keeps this array's layout
    Array map(const std::function<double(double)> &fn) const;
    Array operator-() const;

    // Whole-array reductions
    double reduce(Reduction op) const;
    Array reduce(Reduction op, int axis) const;
    double sum() const { return reduce(Reduction::Sum); }
    double prod() const { return reduce(Reduction::Prod); }
    double min() const { return reduce(Reduction::Min); }
    double max() const { return reduce(Reduction::Max); }
    bool any() const { return reduce(Reduction::Any) != 0.0; }
    bool all() const { return reduce(Reduction::All) != 0.0; }

    // Comparison (with broadcasting for allclose)
    bool allclose(const Array &other, double rtol = 1e-5,
                  double atol = 1e-8) const;
    bool array_equal(const Array &other) const;

    std::string repr() const;
    std::string str() const;

    const std::variant<Sparse, Dense> &representation() const {
        return repr_;
    }

  private:
    Array(std::variant<Sparse, Dense> repr, Shape shape);

    const std::vector<double> &buffer() const;
    // Visits every element of this array broadcast to `target`, in
    // row-major order: fn(value)
    template <typename F>
    void for_each_broadcast(const Shape &target, F &&fn) const;

    friend Array binary_op(const Array &lhs, const Array &rhs,
                           const std::function<double(double, double)> &fn);

    std::variant<Sparse, Dense> repr_;
    Shape shape_;
};

// Element-wise arithmetic with broadcasting. Two sparse operands laid along
// the same dimension stay sparse; anything else materializes densely.
Array binary_op(const Array &lhs, const Array &rhs,
                const std::function<double(double, double)> &fn);

Array operator+(const Array &lhs, const Array &rhs);
Array operator-(const Array &lhs, const Array &rhs);
Array operator*(const Array &lhs, const Array &rhs);
Array operator/(const Array &lhs, const Array &rhs);

Array operator+(const Array &lhs, double rhs);
Array operator-(const Array &lhs, double rhs);
Array operator*(const Array &lhs, double rhs);
Array operator/(const Array &lhs, double rhs);
Array operator+(double lhs, const Array &rhs);
Array operator-(double lhs, const Array &rhs);
Array operator*(double lhs, const Array &rhs);
Array operator/(double lhs, const Array &rhs);

} // namespace histax
