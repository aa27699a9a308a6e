#pragma once
#include <cstddef>
#include "pv/core/value.hpp"

namespace pv {

// Reads. Out-of-range coordinates throw IndexError.
Value get_1d(const NestedArray& a, std::size_t i);
Value get_2d(const NestedArray& a, std::size_t i, std::size_t j);
Value get_nd(const NestedArray& a, const Index& idx);
Value get_nd(const Value& v, const Index& idx);

// Immutable updates: the result shares every untouched sub-array with `a`.
// A mutable foreign leaf on the path is updated in place and kept.
// set_nd with no indices throws UpdateError.
NestedArray set_1d(const NestedArray& a, std::size_t i, const Value& v);
NestedArray set_2d(const NestedArray& a, std::size_t i, std::size_t j, const Value& v);
NestedArray set_nd(const NestedArray& a, const Index& idx, const Value& v);

// Nested arrays are never mutable, whatever their leaves are.
inline bool is_mutable(const NestedArray&) { return false; }

} // namespace pv
