#include "histax/grid.hpp"
#include "histax/debug.hpp"
#include "histax/error.hpp"

#include <string>
#include <utility>

namespace histax {
namespace ops {

std::vector<Array> meshgrid(const std::vector<std::vector<double>> &vectors,
                            bool sparse, Indexing indexing) {
    const size_t rank = vectors.size();
    std::vector<size_t> dims(rank);
    for (size_t i = 0; i < rank; ++i)
        dims[i] = i;
    if (indexing == Indexing::XY && rank >= 2)
        std::swap(dims[0], dims[1]);

    Shape full(rank);
    size_t stored = 0;
    for (size_t i = 0; i < rank; ++i) {
        full[dims[i]] = vectors[i].size();
        stored += vectors[i].size();
    }

    trace::ScopedTrace trace(
        "meshgrid",
        ShapeUtils::to_string(full) + (sparse ? " sparse" : " dense"));

    std::vector<Array> grids;
    grids.reserve(rank);
    for (size_t i = 0; i < rank; ++i) {
        grids.push_back(Array::sparse(vectors[i], dims[i], rank));
    }

    if (sparse) {
        trace.set_memory(stored * sizeof(double), false);
        return grids;
    }

    for (auto &grid : grids) {
        grid = grid.broadcast_to(full);
    }
    trace.set_memory(rank * ShapeUtils::size(full) * sizeof(double), true);
    return grids;
}

Shape broadcast_shapes(const std::vector<Shape> &shapes) {
    Shape result;
    for (const auto &shape : shapes) {
        result = ShapeUtils::broadcast_shape(result, shape);
    }
    return result;
}

std::vector<Array> broadcast_arrays(const std::vector<Array> &arrays) {
    std::vector<Shape> shapes;
    shapes.reserve(arrays.size());
    for (const auto &a : arrays) {
        shapes.push_back(a.shape());
    }
    Shape target = broadcast_shapes(shapes);

    trace::ScopedTrace trace("broadcast_arrays",
                             std::to_string(arrays.size()) + " x " +
                                 ShapeUtils::to_string(target));

    std::vector<Array> result;
    result.reserve(arrays.size());
    size_t allocated = 0;
    for (const auto &a : arrays) {
        result.push_back(a.broadcast_to(target));
        if (result.back().values().data() != a.values().data()) {
            allocated += result.back().nbytes();
        }
    }
    trace.set_memory(allocated, allocated > 0);
    return result;
}

Array stack(const std::vector<Array> &arrays) {
    if (arrays.empty()) {
        return Array::from_vector({});
    }

    const Shape &shape = arrays.front().shape();
    std::vector<double> out;
    out.reserve(arrays.size() * arrays.front().size());
    for (const auto &a : arrays) {
        if (a.shape() != shape) {
            throw ShapeError::mismatch(shape, a.shape());
        }
        const auto &values = a.values();
        out.insert(out.end(), values.begin(), values.end());
    }

    Shape stacked{arrays.size()};
    stacked.insert(stacked.end(), shape.begin(), shape.end());
    return Array::dense(std::move(out), stacked);
}

double reduce(const Array &array, Reduction op) { return array.reduce(op); }

Array reduce(const Array &array, Reduction op, int axis) {
    return array.reduce(op, axis);
}

} // namespace ops

} // namespace histax
