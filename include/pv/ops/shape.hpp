#pragma once
#include <cstddef>
#include "pv/core/value.hpp"

namespace pv {

// Shape inference from nesting structure. Nothing here validates
// rectangularity: only the first element of every level is inspected.

std::size_t dimensionality(const NestedArray& a);
std::size_t dimensionality(const Value& v);

Shape shape(const NestedArray& a);
Shape shape(const Value& v);

std::size_t dimension_count(const NestedArray& a, std::size_t axis);
std::size_t dimension_count(const Value& v, std::size_t axis);

std::size_t element_count(const NestedArray& a);
std::size_t element_count(const Value& v);

bool is_scalar(const Value& v);
bool is_vector(const NestedArray& a);
bool is_vector(const Value& v);

// Scalar held by a 0-D value; scalars are returned as is.
Value get_0d(const Value& v);
// Unwraps 0-D foreign arrays, leaves everything else untouched.
Value scalar_coerce(const Value& v);
// scalar_coerce followed by Value::number().
double to_double(const Value& v);

} // namespace pv
