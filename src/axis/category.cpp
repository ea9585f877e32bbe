#include "histax/axis/category.hpp"
#include "histax/error.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <type_traits>

namespace histax::axis {

template <typename T>
Category<T>::Category(std::vector<T> categories, bool overflow)
    : Axis(AxisOptions{false, overflow}), categories_(std::move(categories)) {
    std::set<T> seen;
    for (const auto &c : categories_) {
        if (!seen.insert(c).second) {
            throw ValueError("duplicate category in " + kind() + " axis");
        }
    }
}

template <typename T> std::string Category<T>::kind() const {
    if constexpr (std::is_same_v<T, std::string>) {
        return "StrCategory";
    } else {
        return "IntCategory";
    }
}

template <typename T> std::vector<double> Category<T>::edges() const {
    std::vector<double> out(categories_.size() + 1);
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<double>(i);
    }
    return out;
}

template <typename T>
size_t Category<T>::checked_position(double index) const {
    if (std::floor(index) != index || index < 0 || index >= size()) {
        throw IndexError("category index " + std::to_string(index) +
                         " out of range for " + kind() + " axis of size " +
                         std::to_string(size()));
    }
    return static_cast<size_t>(index);
}

template <typename T> Coordinate Category<T>::value(double index) const {
    const T &c = categories_[checked_position(index)];
    if constexpr (std::is_same_v<T, std::string>) {
        return c;
    } else {
        return static_cast<double>(c);
    }
}

template <typename T> BinValue Category<T>::bin(int index) const {
    return categories_[checked_position(index)];
}

template <typename T> int Category<T>::index(const Coordinate &x) const {
    typename std::vector<T>::const_iterator it;
    if constexpr (std::is_same_v<T, std::string>) {
        const auto *s = std::get_if<std::string>(&x);
        if (s == nullptr) {
            throw TypeError::coordinate_kind(kind(), "string");
        }
        it = std::find(categories_.begin(), categories_.end(), *s);
    } else {
        const auto *v = std::get_if<double>(&x);
        if (v == nullptr) {
            throw TypeError::coordinate_kind(kind(), "numeric");
        }
        // Non-integral, NaN, or outside int64 range: never a category
        if (std::floor(*v) != *v || std::abs(*v) > 9.2e18)
            return size();
        it = std::find(categories_.begin(), categories_.end(),
                       static_cast<int64_t>(*v));
    }
    return static_cast<int>(it - categories_.begin());
}

template <typename T> std::string Category<T>::repr_args() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < categories_.size(); ++i) {
        if (i > 0)
            oss << ", ";
        if constexpr (std::is_same_v<T, std::string>) {
            oss << "'" << categories_[i] << "'";
        } else {
            oss << categories_[i];
        }
    }
    oss << "]";
    if (!options_.overflow)
        oss << ", overflow=False";
    return oss.str();
}

template class Category<int64_t>;
template class Category<std::string>;

} // namespace histax::axis
