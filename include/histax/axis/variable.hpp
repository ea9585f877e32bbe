#pragma once

#include "histax/axis.hpp"

namespace histax::axis {

// Bins of arbitrary width given by strictly increasing edges.
class Variable : public Axis {
  public:
    explicit Variable(std::vector<double> edges, AxisOptions options = {});

    std::string kind() const override { return "Variable"; }
    int size() const override { return static_cast<int>(edges_.size()) - 1; }
    std::vector<double> edges() const override { return edges_; }

    Coordinate value(double index) const override;
    BinValue bin(int index) const override;
    int index(const Coordinate &x) const override;

  protected:
    std::string repr_args() const override;

  private:
    std::vector<double> edges_;
};

} // namespace histax::axis
