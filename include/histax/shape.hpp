#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace histax {

using Shape = std::vector<size_t>;
// Strides are counted in elements, not bytes.
using Strides = std::vector<size_t>;

class ShapeUtils {
  public:
    // Product of the dimensions. The empty (rank-0) shape has size 1.
    static size_t size(const Shape &shape);

    static Strides calculate_strides(const Shape &shape);

    static bool broadcastable(const Shape &shape1, const Shape &shape2);

    static Shape broadcast_shape(const Shape &shape1, const Shape &shape2);

    // Strides that read an array of `input_shape` as if it had
    // `result_shape`: broadcast dimensions get stride 0.
    static Strides broadcast_strides(const Shape &input_shape,
                                     const Strides &input_strides,
                                     const Shape &result_shape);

    // Row-major odometer step. Returns false once every coordinate wrapped.
    static bool increment_coords(std::vector<size_t> &coords,
                                 const Shape &shape);

    static size_t linear_index(const std::vector<size_t> &indices,
                               const Strides &strides);

    static std::vector<size_t> unravel_index(size_t linear_idx,
                                             const Shape &shape);

    struct OuterInner {
        size_t outer;
        size_t axis;
        size_t inner;
    };

    static OuterInner axis_outer_inner(const Shape &shape, size_t axis);

    static int normalize_axis(int axis, size_t ndim);

    static std::string to_string(const Shape &shape);
};

} // namespace histax
