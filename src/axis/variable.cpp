#include "histax/axis/variable.hpp"
#include "histax/error.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace histax::axis {

Variable::Variable(std::vector<double> edges, AxisOptions options)
    : Axis(options), edges_(std::move(edges)) {
    if (edges_.size() < 2) {
        throw ValueError("Variable axis needs at least two edges");
    }
    for (size_t i = 1; i < edges_.size(); ++i) {
        if (!(edges_[i - 1] < edges_[i])) {
            throw ValueError("Variable axis edges must be strictly increasing");
        }
    }
}

Coordinate Variable::value(double index) const {
    const int n = size();
    if (std::isnan(index))
        return index;
    if (index < 0)
        return -std::numeric_limits<double>::infinity();
    if (index > n)
        return std::numeric_limits<double>::infinity();
    if (index == n)
        return edges_.back();

    const auto k = static_cast<size_t>(index);
    const double z = index - static_cast<double>(k);
    return (1 - z) * edges_[k] + z * edges_[k + 1];
}

BinValue Variable::bin(int index) const {
    check_bin_index(index);
    return Interval{std::get<double>(value(index)),
                    std::get<double>(value(index + 1))};
}

int Variable::index(const Coordinate &x) const {
    const auto *v = std::get_if<double>(&x);
    if (v == nullptr) {
        throw TypeError::coordinate_kind(kind(), "numeric");
    }
    if (std::isnan(*v))
        return size();

    auto it = std::upper_bound(edges_.begin(), edges_.end(), *v);
    return static_cast<int>(it - edges_.begin()) - 1;
}

std::string Variable::repr_args() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < edges_.size(); ++i) {
        if (i > 0)
            oss << ", ";
        oss << edges_[i];
    }
    oss << "]" << flow_args();
    return oss.str();
}

} // namespace histax::axis
