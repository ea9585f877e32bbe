#pragma once

// This is the single entry-point for the histax library.
// Include this file to get access to all the core functionality.

#include "histax/error.hpp"
#include "histax/shape.hpp"
#include "histax/reduction.hpp"
#include "histax/array.hpp"
#include "histax/grid.hpp"
#include "histax/array_tuple.hpp"
#include "histax/indexing.hpp"
#include "histax/axis.hpp"
#include "histax/axis/regular.hpp"
#include "histax/axis/variable.hpp"
#include "histax/axis/integer.hpp"
#include "histax/axis/category.hpp"
#include "histax/axes_tuple.hpp"
#include "histax/debug.hpp"
#include "histax/system.hpp"
