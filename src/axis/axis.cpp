#include "histax/axis.hpp"
#include "histax/error.hpp"

#include <array>
#include <sstream>

namespace histax {

namespace {

// Read-only on every axis
constexpr std::array<const char *, 8> kBuiltins = {
    "size", "extent", "kind", "underflow", "overflow",
    "edges", "centers", "widths"};

bool is_builtin(const std::string &name) {
    for (const char *b : kBuiltins) {
        if (name == b)
            return true;
    }
    return false;
}

} // namespace

// ============================================================================
// Printing helpers
// ============================================================================

std::string to_string(const Coordinate &coordinate) {
    if (const auto *s = std::get_if<std::string>(&coordinate))
        return "'" + *s + "'";
    std::ostringstream oss;
    oss << std::get<double>(coordinate);
    return oss.str();
}

std::string to_string(const BinValue &bin) {
    std::ostringstream oss;
    if (const auto *iv = std::get_if<Interval>(&bin)) {
        oss << "(" << iv->lower << ", " << iv->upper << ")";
    } else if (const auto *i = std::get_if<int64_t>(&bin)) {
        oss << *i;
    } else {
        oss << "'" << std::get<std::string>(bin) << "'";
    }
    return oss.str();
}

std::string to_string(const AttributeValue &value) {
    std::ostringstream oss;
    std::visit(
        [&oss](const auto &v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                oss << "None";
            } else if constexpr (std::is_same_v<T, bool>) {
                oss << (v ? "True" : "False");
            } else if constexpr (std::is_same_v<T, std::string>) {
                oss << "'" << v << "'";
            } else if constexpr (std::is_same_v<T, std::vector<double>>) {
                oss << "[";
                for (size_t i = 0; i < v.size(); ++i) {
                    if (i > 0)
                        oss << ", ";
                    oss << v[i];
                }
                oss << "]";
            } else {
                oss << v;
            }
        },
        value);
    return oss.str();
}

// ============================================================================
// Axis
// ============================================================================

int Axis::extent() const {
    return size() + (options_.underflow ? 1 : 0) + (options_.overflow ? 1 : 0);
}

std::vector<double> Axis::centers() const {
    auto e = edges();
    std::vector<double> out;
    if (e.size() < 2)
        return out;
    out.reserve(e.size() - 1);
    for (size_t i = 0; i + 1 < e.size(); ++i) {
        out.push_back(0.5 * (e[i] + e[i + 1]));
    }
    return out;
}

std::vector<double> Axis::widths() const {
    auto e = edges();
    std::vector<double> out;
    if (e.size() < 2)
        return out;
    out.reserve(e.size() - 1);
    for (size_t i = 0; i + 1 < e.size(); ++i) {
        out.push_back(e[i + 1] - e[i]);
    }
    return out;
}

AttributeValue Axis::get_attribute(const std::string &name) const {
    if (name == "size")
        return static_cast<int64_t>(size());
    if (name == "extent")
        return static_cast<int64_t>(extent());
    if (name == "kind")
        return kind();
    if (name == "underflow")
        return underflow();
    if (name == "overflow")
        return overflow();
    if (name == "edges")
        return edges();
    if (name == "centers")
        return centers();
    if (name == "widths")
        return widths();

    auto it = metadata_.find(name);
    if (it != metadata_.end())
        return it->second;
    if (name == "label")
        return std::string();

    throw AttributeError::missing(kind(), name);
}

void Axis::set_attribute(const std::string &name, AttributeValue value) {
    if (is_builtin(name)) {
        throw AttributeError::read_only(kind(), name);
    }
    metadata_[name] = std::move(value);
}

bool Axis::has_attribute(const std::string &name) const {
    return is_builtin(name) || name == "label" || metadata_.count(name) > 0;
}

std::vector<std::string> Axis::attribute_names() const {
    std::vector<std::string> names(kBuiltins.begin(), kBuiltins.end());
    if (metadata_.count("label") == 0)
        names.push_back("label");
    for (const auto &[key, _] : metadata_) {
        names.push_back(key);
    }
    return names;
}

std::string Axis::label() const {
    auto it = metadata_.find("label");
    if (it == metadata_.end())
        return {};
    if (const auto *s = std::get_if<std::string>(&it->second))
        return *s;
    return to_string(it->second);
}

void Axis::set_label(const std::string &label) { metadata_["label"] = label; }

void Axis::check_bin_index(int index) const {
    int lo = options_.underflow ? -1 : 0;
    int hi = size() + (options_.overflow ? 1 : 0);
    if (index < lo || index >= hi) {
        throw IndexError::out_of_bounds(index, static_cast<size_t>(size()));
    }
}

std::string Axis::flow_args() const {
    std::string out;
    if (!options_.underflow)
        out += ", underflow=False";
    if (!options_.overflow)
        out += ", overflow=False";
    return out;
}

std::string Axis::repr() const {
    std::ostringstream oss;
    oss << kind() << "(" << repr_args();
    std::string l = label();
    if (!l.empty())
        oss << ", label='" << l << "'";
    oss << ")";
    return oss.str();
}

} // namespace histax
