#pragma once
#include "pv/core/value.hpp"

namespace pv {

// Numeric equality across representations. False when `b` is not an array
// or differs in length along axis 0.
bool matrix_equals(const NestedArray& a, const Value& b);

// Scalars compare numerically (strings by content, other objects by
// identity); arrays through matrix_equals.
bool value_equals(const Value& a, const Value& b);

inline bool operator==(const NestedArray& a, const NestedArray& b) { return matrix_equals(a, Value(b)); }
inline bool operator!=(const NestedArray& a, const NestedArray& b) { return !(a == b); }
inline bool operator==(const Value& a, const Value& b) { return value_equals(a, b); }
inline bool operator!=(const Value& a, const Value& b) { return !value_equals(a, b); }

} // namespace pv
