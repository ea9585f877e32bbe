#pragma once

#include "histax/axis.hpp"

namespace histax::axis {

// `bins` equal-width bins spanning [start, stop).
class Regular : public Axis {
  public:
    Regular(int bins, double start, double stop, AxisOptions options = {});

    std::string kind() const override { return "Regular"; }
    int size() const override { return bins_; }
    std::vector<double> edges() const override;

    // Continuous: value(0.5) is the center of bin 0
    Coordinate value(double index) const override;
    BinValue bin(int index) const override;
    int index(const Coordinate &x) const override;

    double start() const { return start_; }
    double stop() const { return stop_; }

  protected:
    std::string repr_args() const override;

  private:
    int bins_;
    double start_;
    double stop_;
};

} // namespace histax::axis
