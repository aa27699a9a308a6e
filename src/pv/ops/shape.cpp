#include "pv/ops/shape.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include <sstream>

namespace pv {

std::size_t dimensionality(const NestedArray& a) {
  if (a.empty()) return 1;
  return 1 + dimensionality(a[0]);
}

std::size_t dimensionality(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return dimensionality(v.nested());
    case Value::Kind::Foreign: return v.foreign()->dimensionality();
    default:                   return 0;
  }
}

Shape shape(const NestedArray& a) {
  Shape s{a.size()};
  if (!a.empty()) {
    const Shape inner = shape(a[0]);
    s.insert(s.end(), inner.begin(), inner.end());
  }
  return s;
}

Shape shape(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return shape(v.nested());
    case Value::Kind::Foreign: return v.foreign()->shape();
    default:                   return {};
  }
}

std::size_t dimension_count(const NestedArray& a, std::size_t axis) {
  if (axis == 0) return a.size();
  if (a.empty()) {
    std::ostringstream oss;
    oss << "dimension_count: axis " << axis << " unknown for an empty array";
    throw ShapeError(oss.str());
  }
  return dimension_count(a[0], axis - 1);
}

std::size_t dimension_count(const Value& v, std::size_t axis) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return dimension_count(v.nested(), axis);
    case Value::Kind::Foreign: return v.foreign()->dimension_count(axis);
    default: {
      std::ostringstream oss;
      oss << "dimension_count: axis " << axis << " out of range for a scalar";
      throw ShapeError(oss.str());
    }
  }
}

std::size_t element_count(const NestedArray& a) {
  if (a.empty()) return 0;
  return a.size() * element_count(a[0]);
}

std::size_t element_count(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Nested: return element_count(v.nested());
    case Value::Kind::Foreign: {
      std::size_t n = 1;
      for (auto d : v.foreign()->shape()) n *= d;
      return n;
    }
    default: return 1;
  }
}

bool is_scalar(const Value& v) { return !v.is_array(); }

bool is_vector(const NestedArray& a) {
  return a.empty() || dimensionality(a[0]) == 0;
}

bool is_vector(const Value& v) {
  if (v.is_nested()) return is_vector(v.nested());
  return dimensionality(v) == 1;
}

Value get_0d(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Foreign: return v.foreign()->get_0d();
    case Value::Kind::Nested:
      throw ShapeError("get_0d: nested array has dimensionality " +
                       std::to_string(dimensionality(v.nested())));
    default: return v;
  }
}

Value scalar_coerce(const Value& v) {
  if (v.is_foreign() && v.foreign()->dimensionality() == 0) return v.foreign()->get_0d();
  return v;
}

double to_double(const Value& v) {
  if (v.is_number()) return v.number();
  return scalar_coerce(v).number();
}

} // namespace pv
