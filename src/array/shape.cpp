#include "histax/shape.hpp"
#include "histax/error.hpp"

#include <algorithm>
#include <functional>
#include <numeric>
#include <sstream>
#include <string>

namespace histax {

size_t ShapeUtils::size(const Shape &shape) {
    return std::accumulate(shape.begin(), shape.end(), size_t(1),
                           std::multiplies<size_t>());
}

Strides ShapeUtils::calculate_strides(const Shape &shape) {
    if (shape.empty())
        return {};

    // Row-major: last dimension has stride 1
    Strides strides(shape.size());
    strides.back() = 1;
    for (int i = static_cast<int>(shape.size()) - 2; i >= 0; --i) {
        strides[i] = strides[i + 1] * shape[i + 1];
    }
    return strides;
}

bool ShapeUtils::broadcastable(const Shape &shape1, const Shape &shape2) {
    size_t ndim1 = shape1.size();
    size_t ndim2 = shape2.size();
    size_t max_ndim = std::max(ndim1, ndim2);

    for (size_t i = 0; i < max_ndim; ++i) {
        size_t dim1 = (i < ndim1) ? shape1[ndim1 - 1 - i] : 1;
        size_t dim2 = (i < ndim2) ? shape2[ndim2 - 1 - i] : 1;

        if (dim1 != dim2 && dim1 != 1 && dim2 != 1) {
            return false;
        }
    }

    return true;
}

Shape ShapeUtils::broadcast_shape(const Shape &shape1, const Shape &shape2) {
    if (!broadcastable(shape1, shape2)) {
        throw ShapeError::broadcast_incompatible(to_string(shape1) + " and " +
                                                 to_string(shape2));
    }

    size_t ndim1 = shape1.size();
    size_t ndim2 = shape2.size();
    size_t max_ndim = std::max(ndim1, ndim2);

    Shape result(max_ndim);

    for (size_t i = 0; i < max_ndim; ++i) {
        size_t dim1 = (i < ndim1) ? shape1[ndim1 - 1 - i] : 1;
        size_t dim2 = (i < ndim2) ? shape2[ndim2 - 1 - i] : 1;

        // A zero-length dimension wins over a singleton
        result[max_ndim - 1 - i] = (dim1 == 1) ? dim2 : dim1;
    }

    return result;
}

Strides ShapeUtils::broadcast_strides(const Shape &input_shape,
                                      const Strides &input_strides,
                                      const Shape &result_shape) {
    if (input_shape.size() > result_shape.size()) {
        throw ShapeError::broadcast_incompatible(
            "cannot broadcast " + to_string(input_shape) + " to lower rank " +
            to_string(result_shape));
    }

    size_t offset = result_shape.size() - input_shape.size();
    Strides out(result_shape.size(), 0);

    for (size_t i = 0; i < input_shape.size(); ++i) {
        size_t in_dim = input_shape[i];
        size_t out_dim = result_shape[offset + i];
        if (in_dim == out_dim) {
            out[offset + i] = input_strides[i];
        } else if (in_dim == 1) {
            out[offset + i] = 0;
        } else {
            throw ShapeError::broadcast_incompatible(
                "cannot broadcast " + to_string(input_shape) + " to " +
                to_string(result_shape));
        }
    }

    return out;
}

bool ShapeUtils::increment_coords(std::vector<size_t> &coords,
                                  const Shape &shape) {
    for (int j = static_cast<int>(shape.size()) - 1; j >= 0; --j) {
        if (++coords[j] < shape[j]) {
            return true;
        }
        coords[j] = 0;
    }
    return false;
}

size_t ShapeUtils::linear_index(const std::vector<size_t> &indices,
                                const Strides &strides) {
    if (indices.size() != strides.size()) {
        throw IndexError("Number of indices must match number of dimensions");
    }

    size_t linear_idx = 0;
    for (size_t i = 0; i < indices.size(); ++i) {
        linear_idx += indices[i] * strides[i];
    }

    return linear_idx;
}

std::vector<size_t> ShapeUtils::unravel_index(size_t linear_idx,
                                              const Shape &shape) {
    std::vector<size_t> indices(shape.size());

    for (int i = static_cast<int>(shape.size()) - 1; i >= 0; --i) {
        indices[i] = linear_idx % shape[i];
        linear_idx /= shape[i];
    }

    return indices;
}

ShapeUtils::OuterInner ShapeUtils::axis_outer_inner(const Shape &shape,
                                                    size_t axis) {
    if (axis >= shape.size()) {
        throw ShapeError::invalid_axis(static_cast<int>(axis),
                                       static_cast<int>(shape.size()));
    }

    OuterInner s{1, shape[axis], 1};
    for (size_t i = 0; i < axis; ++i)
        s.outer *= shape[i];
    for (size_t i = axis + 1; i < shape.size(); ++i)
        s.inner *= shape[i];
    return s;
}

int ShapeUtils::normalize_axis(int axis, size_t ndim) {
    int n = static_cast<int>(ndim);
    int normalized = axis < 0 ? axis + n : axis;
    if (normalized < 0 || normalized >= n) {
        throw ShapeError::invalid_axis(axis, n);
    }
    return normalized;
}

std::string ShapeUtils::to_string(const Shape &shape) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < shape.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << shape[i];
    }
    if (shape.size() == 1)
        oss << ",";
    oss << ")";
    return oss.str();
}

} // namespace histax
