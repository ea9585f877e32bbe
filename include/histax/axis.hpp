#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace histax {

// ============================================================================
// Values exchanged with an axis
// ============================================================================

struct Interval {
    double lower;
    double upper;

    bool operator==(const Interval &other) const {
        return lower == other.lower && upper == other.upper;
    }
    bool operator!=(const Interval &other) const { return !(*this == other); }
};

// A point on an axis: numeric for continuous and integer axes, a string
// for string-category axes.
using Coordinate = std::variant<double, std::string>;

// What bin(i) returns: an interval for continuous axes, the category (or
// integer value) otherwise.
using BinValue = std::variant<Interval, int64_t, std::string>;

// Anything readable or writable through the generic attribute interface.
// std::monostate stands for "no value".
using AttributeValue = std::variant<std::monostate, bool, int64_t, double,
                                    std::string, std::vector<double>>;

std::string to_string(const Coordinate &coordinate);
std::string to_string(const BinValue &bin);
std::string to_string(const AttributeValue &value);

// Builds a Coordinate without the narrowing pitfalls of variant's
// converting constructor: any arithmetic value becomes a double.
template <typename T> Coordinate make_coordinate(T &&x) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, Coordinate>) {
        return std::forward<T>(x);
    } else if constexpr (std::is_arithmetic_v<U>) {
        return Coordinate(std::in_place_type<double>, static_cast<double>(x));
    } else {
        return Coordinate(std::in_place_type<std::string>,
                          std::string(std::forward<T>(x)));
    }
}

struct AxisOptions {
    bool underflow = true;
    bool overflow = true;
};

// ============================================================================
// Axis interface
// ============================================================================

// One dimension's binning scheme. Bin indices run from 0 to size() - 1;
// -1 is the underflow bin and size() the overflow bin.
//
// Besides the typed interface, every axis answers generic attribute reads
// and writes by name. Built-in properties are read-only; any other name is
// stored in the axis's metadata (e.g. "label").
class Axis {
  public:
    explicit Axis(AxisOptions options = {}) : options_(options) {}
    virtual ~Axis() = default;

    virtual std::string kind() const = 0;

    virtual int size() const = 0;
    int extent() const;
    bool underflow() const { return options_.underflow; }
    bool overflow() const { return options_.overflow; }

    virtual std::vector<double> edges() const = 0;
    virtual std::vector<double> centers() const;
    virtual std::vector<double> widths() const;

    virtual Coordinate value(double index) const = 0;
    virtual BinValue bin(int index) const = 0;
    virtual int index(const Coordinate &x) const = 0;

    // Generic attribute access
    virtual AttributeValue get_attribute(const std::string &name) const;
    virtual void set_attribute(const std::string &name, AttributeValue value);
    bool has_attribute(const std::string &name) const;
    std::vector<std::string> attribute_names() const;

    std::string label() const;
    void set_label(const std::string &label);
    const std::map<std::string, AttributeValue> &metadata() const {
        return metadata_;
    }

    virtual std::string repr() const;

  protected:
    // Throws IndexError unless index names a bin, flow bins included
    void check_bin_index(int index) const;
    // Extra constructor arguments for repr(), e.g. "10, 0, 1"
    virtual std::string repr_args() const = 0;
    // ", underflow=False" / ", overflow=False" where they apply
    std::string flow_args() const;

    AxisOptions options_;

  private:
    std::map<std::string, AttributeValue> metadata_;
};

} // namespace histax
