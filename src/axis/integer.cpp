#include "histax/axis/integer.hpp"
#include "histax/error.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace histax::axis {

Integer::Integer(int start, int stop, AxisOptions options)
    : Axis(options), start_(start), stop_(stop) {
    if (stop <= start) {
        throw ValueError("Integer axis needs stop > start, got [" +
                         std::to_string(start) + ", " + std::to_string(stop) +
                         ")");
    }
    // size() and extent() are computed in int
    if (static_cast<int64_t>(stop) - start >
        std::numeric_limits<int>::max() - 2) {
        throw ValueError("Integer axis span [" + std::to_string(start) +
                         ", " + std::to_string(stop) + ") is too wide");
    }
}

std::vector<double> Integer::edges() const {
    std::vector<double> out;
    out.reserve(size() + 1);
    for (int64_t i = start_; i <= stop_; ++i) {
        out.push_back(static_cast<double>(i));
    }
    return out;
}

Coordinate Integer::value(double index) const { return start_ + index; }

BinValue Integer::bin(int index) const {
    check_bin_index(index);
    return static_cast<int64_t>(start_) + index;
}

int Integer::index(const Coordinate &x) const {
    const auto *v = std::get_if<double>(&x);
    if (v == nullptr) {
        throw TypeError::coordinate_kind(kind(), "numeric");
    }
    if (std::isnan(*v))
        return size();

    const double shifted = std::floor(*v) - start_;
    if (shifted < 0)
        return -1;
    if (shifted >= size())
        return size();
    return static_cast<int>(shifted);
}

std::string Integer::repr_args() const {
    return std::to_string(start_) + ", " + std::to_string(stop_) +
           flow_args();
}

} // namespace histax::axis
