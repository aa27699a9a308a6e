#pragma once
#include "pv/core/value.hpp"

namespace pv {

// True for scalars. For a NestedArray, true iff every element is canonical
// and the whole structure matches its own declared shape (counts agree at
// every level, no arrays below the last level). Foreign arrays are never
// canonical.
bool is_canonical(const Value& x);

// True iff siblings have identical shapes at every level.
bool same_shapes(const NestedArray& a);

// Shape of a rectangular array; throws ValidationError otherwise.
Shape validate_shape(const NestedArray& a);
Shape validate_shape(const Value& v);

} // namespace pv
