#pragma once
#include <optional>
#include <utility>
#include <vector>
#include "pv/core/value.hpp"

namespace pv {

// Broadcasting only ever adds leading dimensions: the shape of `a` must equal
// the trailing dimensions of `target`. `a` is replicated as a whole, the
// dimension closest to its own shape first. Throws ShapeError otherwise.
Value broadcast(const Value& a, const Shape& target);
NestedArray broadcast(const NestedArray& a, const Shape& target);

// Broadcast `a` to the shape of `b`.
Value broadcast_like(const Value& a, const Value& b);

// coerce(b), broadcast to the shape of `a`.
Value broadcast_coerce(const NestedArray& a, const Value& b);

// Longest shape, when every other shape is a suffix of it.
std::optional<Shape> common_shape(const std::vector<Shape>& shapes);

// Lower-dimensional operand broadcast to the other's shape. Operands of equal
// dimensionality must already have equal shapes.
std::pair<Value, Value> broadcast_compatible(const Value& a, const Value& b);

// Every operand broadcast to the common shape.
std::vector<Value> broadcast_same_shape(const std::vector<Value>& arrays);

} // namespace pv
