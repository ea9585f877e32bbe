#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "histax/axis.hpp"

namespace histax::axis {

// One bin per listed category. Unknown values go to the overflow bin.
// There is never an underflow bin. Instantiated for int64_t and std::string.
template <typename T> class Category : public Axis {
  public:
    explicit Category(std::vector<T> categories, bool overflow = true);

    std::string kind() const override;
    int size() const override { return static_cast<int>(categories_.size()); }
    // Unit-width bins at 0, 1, ..., size()
    std::vector<double> edges() const override;

    // The category at an in-range integral index
    Coordinate value(double index) const override;
    BinValue bin(int index) const override;
    int index(const Coordinate &x) const override;

    const std::vector<T> &categories() const { return categories_; }

  protected:
    std::string repr_args() const override;

  private:
    size_t checked_position(double index) const;

    std::vector<T> categories_;
};

using IntCategory = Category<int64_t>;
using StrCategory = Category<std::string>;

extern template class Category<int64_t>;
extern template class Category<std::string>;

} // namespace histax::axis
