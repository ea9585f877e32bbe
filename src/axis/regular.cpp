#include "histax/axis/regular.hpp"
#include "histax/error.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace histax::axis {

Regular::Regular(int bins, double start, double stop, AxisOptions options)
    : Axis(options), bins_(bins), start_(start), stop_(stop) {
    if (bins <= 0) {
        throw ValueError("Regular axis needs at least one bin, got " +
                         std::to_string(bins));
    }
    if (!std::isfinite(start) || !std::isfinite(stop) || start == stop) {
        throw ValueError("Regular axis needs distinct finite bounds");
    }
}

std::vector<double> Regular::edges() const {
    std::vector<double> out;
    out.reserve(bins_ + 1);
    for (int i = 0; i <= bins_; ++i) {
        out.push_back(std::get<double>(value(i)));
    }
    return out;
}

Coordinate Regular::value(double index) const {
    const double z = index / bins_;
    const double delta = stop_ - start_;
    if (z < 0)
        return -std::numeric_limits<double>::infinity() * delta;
    if (z > 1)
        return std::numeric_limits<double>::infinity() * delta;
    return (1 - z) * start_ + z * stop_;
}

BinValue Regular::bin(int index) const {
    check_bin_index(index);
    return Interval{std::get<double>(value(index)),
                    std::get<double>(value(index + 1))};
}

int Regular::index(const Coordinate &x) const {
    const auto *v = std::get_if<double>(&x);
    if (v == nullptr) {
        throw TypeError::coordinate_kind(kind(), "numeric");
    }

    // Normalized position; NaN fails both comparisons and lands in overflow
    const double z = (*v - start_) / (stop_ - start_);
    if (z < 0)
        return -1;
    if (!(z < 1))
        return bins_;
    int i = static_cast<int>(std::floor(z * bins_));
    return i < bins_ ? i : bins_ - 1;
}

std::string Regular::repr_args() const {
    std::ostringstream oss;
    oss << bins_ << ", " << start_ << ", " << stop_ << flow_args();
    return oss.str();
}

} // namespace histax::axis
