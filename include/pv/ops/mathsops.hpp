#pragma once
#include <string>
#include <vector>
#include "pv/core/value.hpp"

namespace pv {

using ScalarFn = double (*)(double);

struct MathsOp {
  const char* name;
  ScalarFn fn;
};

// abs acos asin atan cbrt ceil cos cosh exp floor log log10 round signum
// sin sinh sqrt tan tanh to-degrees to-radians
const std::vector<MathsOp>& maths_ops();
const MathsOp* find_maths_op(const std::string& name);

NestedArray map_scalar_fn(ScalarFn f, const NestedArray& a);
NestedArray map_scalar_fn_inplace(ScalarFn f, const NestedArray& a);

// Throws std::invalid_argument for names not in maths_ops().
NestedArray maths_function(const std::string& name, const NestedArray& a);
NestedArray maths_function_inplace(const std::string& name, const NestedArray& a);

// Maths variants in this codebase are named with 'v' suffix
NestedArray absv(const NestedArray& a);
NestedArray acosv(const NestedArray& a);
NestedArray asinv(const NestedArray& a);
NestedArray atanv(const NestedArray& a);
NestedArray cbrtv(const NestedArray& a);
NestedArray ceilv(const NestedArray& a);
NestedArray cosv(const NestedArray& a);
NestedArray coshv(const NestedArray& a);
NestedArray expv(const NestedArray& a);
NestedArray floorv(const NestedArray& a);
NestedArray logv(const NestedArray& a);
NestedArray log10v(const NestedArray& a);
NestedArray roundv(const NestedArray& a);
NestedArray signumv(const NestedArray& a);
NestedArray sinv(const NestedArray& a);
NestedArray sinhv(const NestedArray& a);
NestedArray sqrtv(const NestedArray& a);
NestedArray tanv(const NestedArray& a);
NestedArray tanhv(const NestedArray& a);
NestedArray to_degreesv(const NestedArray& a);
NestedArray to_radiansv(const NestedArray& a);

} // namespace pv
