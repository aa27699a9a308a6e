#pragma once
#include <vector>
#include "pv/core/value.hpp"

namespace pv {

// Row-major flat buffers of element_count(a) entries. The buffer is split
// into equal chunks per element, so a non-rectangular array gives an
// unspecified (but in-bounds) result unless checked mode is on, in which
// case ValidationError is thrown.
std::vector<double> to_double_array(const NestedArray& a);
std::vector<Value> to_object_array(const NestedArray& a);

} // namespace pv
