#include "pv/ops/broadcast.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/shape.hpp"
#include "pv/core/errors.hpp"
#include <algorithm>

namespace pv {

static bool is_suffix(const Shape& s, const Shape& of) {
  if (s.size() > of.size()) return false;
  return std::equal(s.begin(), s.end(), of.end() - s.size());
}

Value broadcast(const Value& a, const Shape& target) {
  const Shape as = shape(a);
  if (!is_suffix(as, target)) {
    throw ShapeError("broadcast: cannot broadcast shape " + shape_str(as) +
                     " to " + shape_str(target));
  }
  Value out = a;
  for (std::size_t k = target.size() - as.size(); k-- > 0;) {
    out = NestedArray(std::vector<Value>(target[k], out));
  }
  return out;
}

NestedArray broadcast(const NestedArray& a, const Shape& target) {
  return broadcast(Value(a), target).nested();
}

Value broadcast_like(const Value& a, const Value& b) {
  return broadcast(a, shape(b));
}

Value broadcast_coerce(const NestedArray& a, const Value& b) {
  return broadcast(coerce(b), shape(a));
}

std::optional<Shape> common_shape(const std::vector<Shape>& shapes) {
  if (shapes.empty()) return std::nullopt;
  const Shape* longest = &shapes[0];
  for (const auto& s : shapes)
    if (s.size() > longest->size()) longest = &s;
  for (const auto& s : shapes)
    if (!is_suffix(s, *longest)) return std::nullopt;
  return *longest;
}

std::pair<Value, Value> broadcast_compatible(const Value& a, const Value& b) {
  const std::size_t da = dimensionality(a);
  const std::size_t db = dimensionality(b);
  if (da == db) {
    const Shape sa = shape(a), sb = shape(b);
    if (sa != sb) {
      throw ShapeError("broadcast_compatible: shapes " + shape_str(sa) + " and " +
                       shape_str(sb) + " differ");
    }
    return {a, b};
  }
  if (da < db) return {broadcast(a, shape(b)), b};
  return {a, broadcast(b, shape(a))};
}

std::vector<Value> broadcast_same_shape(const std::vector<Value>& arrays) {
  std::vector<Shape> shapes;
  shapes.reserve(arrays.size());
  for (const auto& x : arrays) shapes.push_back(shape(x));
  auto target = common_shape(shapes);
  if (!target) throw ShapeError("broadcast_same_shape: operands have no common shape");
  std::vector<Value> out;
  out.reserve(arrays.size());
  for (const auto& x : arrays) out.push_back(broadcast(x, *target));
  return out;
}

} // namespace pv
