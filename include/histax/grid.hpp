#pragma once

#include <vector>

#include "array.hpp"
#include "reduction.hpp"
#include "shape.hpp"

namespace histax {

namespace ops {

// ============================================================================
// Grid construction
// ============================================================================

enum class Indexing {
    IJ, // matrix indexing: input i varies along output dimension i
    XY  // Cartesian indexing: the first two output dimensions are swapped
};

// Outer-product grid over K 1-D coordinate vectors. Each output has rank K.
// With `sparse`, output i stores only its own vector and keeps every other
// dimension as a singleton, so the grid costs O(sum of lengths) memory.
std::vector<Array> meshgrid(const std::vector<std::vector<double>> &vectors,
                            bool sparse = true,
                            Indexing indexing = Indexing::IJ);

// ============================================================================
// Broadcasting utilities
// ============================================================================

// Common shape of all inputs. An empty input list yields the rank-0 shape.
Shape broadcast_shapes(const std::vector<Shape> &shapes);

// Dense copies of every input at the common broadcast shape
std::vector<Array> broadcast_arrays(const std::vector<Array> &arrays);

// Joins same-shaped arrays along a new leading dimension. An empty list
// yields a 1-D array of length 0.
Array stack(const std::vector<Array> &arrays);

// ============================================================================
// Reductions
// ============================================================================

double reduce(const Array &array, Reduction op);
Array reduce(const Array &array, Reduction op, int axis);

} // namespace ops

} // namespace histax
