#pragma once

#include "histax/axis.hpp"

namespace histax::axis {

// One bin per integer in [start, stop).
class Integer : public Axis {
  public:
    Integer(int start, int stop, AxisOptions options = {});

    std::string kind() const override { return "Integer"; }
    int size() const override { return stop_ - start_; }
    std::vector<double> edges() const override;

    Coordinate value(double index) const override;
    BinValue bin(int index) const override;
    int index(const Coordinate &x) const override;

  protected:
    std::string repr_args() const override;

  private:
    int start_;
    int stop_;
};

} // namespace histax::axis
