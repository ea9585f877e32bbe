#pragma once

#include <cstddef>
#include <exception>
#include <sstream>
#include <string>

namespace histax {

// ============================================================================
// Base Histax Exception
// ============================================================================

class HistaxError : public std::exception {
  public:
    explicit HistaxError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override { return message_.c_str(); }

    const std::string &message() const { return message_; }

  protected:
    std::string message_;
};

// ============================================================================
// Shape-related errors
// ============================================================================

class ShapeError : public HistaxError {
  public:
    explicit ShapeError(const std::string &message)
        : HistaxError("ShapeError: " + message) {}

    template <typename Container>
    static ShapeError mismatch(const Container &expected,
                               const Container &got) {
        std::ostringstream oss;
        oss << "expected shape [";
        for (size_t i = 0; i < expected.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << expected[i];
        }
        oss << "] but got [";
        for (size_t i = 0; i < got.size(); ++i) {
            if (i > 0)
                oss << ", ";
            oss << got[i];
        }
        oss << "]";
        return ShapeError(oss.str());
    }

    static ShapeError broadcast_incompatible(const std::string &details) {
        return ShapeError("shapes are not broadcastable: " + details);
    }

    static ShapeError invalid_axis(int axis, int ndim) {
        return ShapeError("axis " + std::to_string(axis) +
                          " out of bounds for array with " +
                          std::to_string(ndim) + " dimensions");
    }

    static ShapeError invalid_reshape(size_t from_size, size_t to_size) {
        return ShapeError("cannot reshape array of size " +
                          std::to_string(from_size) + " to size " +
                          std::to_string(to_size));
    }
};

// ============================================================================
// Type-related errors
// ============================================================================

class TypeError : public HistaxError {
  public:
    explicit TypeError(const std::string &message)
        : HistaxError("TypeError: " + message) {}

    static TypeError not_an_axis(size_t position, const std::string &got) {
        return TypeError("Only a sequence of Axis is supported in AxesTuple, "
                         "got " +
                         got + " at position " + std::to_string(position));
    }

    static TypeError coordinate_kind(const std::string &axis_kind,
                                     const std::string &expected) {
        return TypeError(axis_kind + " axis expects a " + expected +
                         " coordinate");
    }
};

// ============================================================================
// Value-related errors
// ============================================================================

class ValueError : public HistaxError {
  public:
    explicit ValueError(const std::string &message)
        : HistaxError("ValueError: " + message) {}

    static ValueError empty_reduction(const std::string &operation) {
        return ValueError("zero-size array to reduction operation " +
                          operation + " which has no identity");
    }
};

// ============================================================================
// Index-related errors
// ============================================================================

class IndexError : public HistaxError {
  public:
    explicit IndexError(const std::string &message)
        : HistaxError("IndexError: " + message) {}

    static IndexError out_of_bounds(long long index, size_t size,
                                    int dim = -1) {
        std::ostringstream oss;
        oss << "index " << index << " out of bounds for ";
        if (dim >= 0)
            oss << "dimension " << dim << " with ";
        oss << "size " << size;
        return IndexError(oss.str());
    }

    static IndexError invalid_slice(const std::string &details) {
        return IndexError("invalid slice: " + details);
    }

  protected:
    struct NoPrefix {};
    IndexError(NoPrefix, const std::string &message) : HistaxError(message) {}
};

// Wrong number of per-axis arguments. Catchable as IndexError.
class ArityError : public IndexError {
  public:
    explicit ArityError(const std::string &message)
        : IndexError(NoPrefix{}, "ArityError: " + message) {}

    static ArityError mismatch(size_t expected, size_t got) {
        return ArityError(
            "Must have the same number of arguments as the number of axes "
            "(expected " +
            std::to_string(expected) + ", got " + std::to_string(got) + ")");
    }
};

// ============================================================================
// Attribute-related errors
// ============================================================================

class AttributeError : public HistaxError {
  public:
    explicit AttributeError(const std::string &message)
        : HistaxError("AttributeError: " + message) {}

    static AttributeError missing(const std::string &owner,
                                  const std::string &name) {
        return AttributeError("'" + owner + "' object has no attribute '" +
                              name + "'");
    }

    static AttributeError read_only(const std::string &owner,
                                    const std::string &name) {
        return AttributeError("attribute '" + name + "' of '" + owner +
                              "' objects is not writable");
    }
};

// ============================================================================
// Runtime/internal errors
// ============================================================================

class RuntimeError : public HistaxError {
  public:
    explicit RuntimeError(const std::string &message)
        : HistaxError("RuntimeError: " + message) {}

    static RuntimeError internal(const std::string &details) {
        return RuntimeError("internal error: " + details);
    }
};

} // namespace histax
