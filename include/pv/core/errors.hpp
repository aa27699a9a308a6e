#pragma once
#include <stdexcept>
#include <string>

namespace pv {

// Incompatible shapes (join, broadcast, arithmetic, dot products, select).
struct ShapeError : public std::invalid_argument {
  explicit ShapeError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Coordinate outside the extent of the axis it addresses.
struct IndexError : public std::out_of_range {
  explicit IndexError(const std::string& msg) : std::out_of_range(msg) {}
};

// set_nd ran out of indices before reaching a leaf.
struct UpdateError : public std::invalid_argument {
  explicit UpdateError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Non-rectangular structure found by an explicit check.
struct ValidationError : public std::runtime_error {
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {}
};

// Arithmetic on a scalar that is not a number.
struct TypeError : public std::invalid_argument {
  explicit TypeError(const std::string& msg) : std::invalid_argument(msg) {}
};

// A foreign backend does not provide an optional capability.
struct UnsupportedError : public std::logic_error {
  explicit UnsupportedError(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace pv
