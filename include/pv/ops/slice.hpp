#pragma once
#include <cstddef>
#include <vector>
#include "pv/core/value.hpp"

namespace pv {

// Major slices of any array value: a NestedArray's own elements, or the
// slices a foreign array reports. Throws ShapeError for scalars.
std::vector<Value> get_major_slice_seq(const Value& v);

// Element i of the top level. Aliases the stored sub-array (no copy).
Value get_major_slice(const NestedArray& a, std::size_t i);
inline Value get_major_slice_view(const NestedArray& a, std::size_t i) { return get_major_slice(a, i); }

// Fix coordinate i on `axis`.
Value get_slice(const NestedArray& a, std::size_t axis, std::size_t i);
Value get_slice(const Value& v, std::size_t axis, std::size_t i);
inline Value get_slice_view(const NestedArray& a, std::size_t axis, std::size_t i) { return get_slice(a, axis, i); }

inline Value get_row(const NestedArray& a, std::size_t i) { return get_major_slice(a, i); }
Value get_column(const NestedArray& a, std::size_t j);
inline NestedArray get_rows(const NestedArray& a) { return a; }
NestedArray get_columns(const NestedArray& a);

// View onto [start, start+length) of the top level.
NestedArray subvector(const NestedArray& a, std::size_t start, std::size_t length);

// Circular shift by `places` (mod extent) along `axis`: element i moves to
// position (i + places) mod extent.
NestedArray rotate(const NestedArray& a, std::size_t axis, long long places);

// Gather along an axis (axis 0 by default). Indices may repeat.
NestedArray order(const NestedArray& a, const std::vector<std::size_t>& indices);
NestedArray order(const NestedArray& a, std::size_t axis, const std::vector<std::size_t>& indices);

// Same dimensionality: concatenate along axis 0. `b` one dimension lower:
// append it as a new element. Anything else throws ShapeError.
NestedArray join(const NestedArray& a, const Value& b);
// Concatenate along `axis`; extents before it must agree.
NestedArray join_along(const NestedArray& a, const Value& b, std::size_t axis);

// One index list per dimension; every axis is kept.
NestedArray select(const NestedArray& a, const std::vector<std::vector<std::size_t>>& args);

} // namespace pv
