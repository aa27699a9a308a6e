#include "pv/ops/mathsops.hpp"
#include "pv/ops/elementwise.hpp"
#include "pv/ops/shape.hpp"
#include <cmath>
#include <stdexcept>

namespace pv {

static constexpr double kPi = 3.14159265358979323846;

const std::vector<MathsOp>& maths_ops() {
  static const std::vector<MathsOp> ops = {
    {"abs",        +[](double x) { return std::fabs(x); }},
    {"acos",       +[](double x) { return std::acos(x); }},
    {"asin",       +[](double x) { return std::asin(x); }},
    {"atan",       +[](double x) { return std::atan(x); }},
    {"cbrt",       +[](double x) { return std::cbrt(x); }},
    {"ceil",       +[](double x) { return std::ceil(x); }},
    {"cos",        +[](double x) { return std::cos(x); }},
    {"cosh",       +[](double x) { return std::cosh(x); }},
    {"exp",        +[](double x) { return std::exp(x); }},
    {"floor",      +[](double x) { return std::floor(x); }},
    {"log",        +[](double x) { return std::log(x); }},
    {"log10",      +[](double x) { return std::log10(x); }},
    {"round",      +[](double x) { return std::round(x); }},
    {"signum",     +[](double x) { return x > 0.0 ? 1.0 : (x < 0.0 ? -1.0 : 0.0); }},
    {"sin",        +[](double x) { return std::sin(x); }},
    {"sinh",       +[](double x) { return std::sinh(x); }},
    {"sqrt",       +[](double x) { return std::sqrt(x); }},
    {"tan",        +[](double x) { return std::tan(x); }},
    {"tanh",       +[](double x) { return std::tanh(x); }},
    {"to-degrees", +[](double x) { return x * (180.0 / kPi); }},
    {"to-radians", +[](double x) { return x * (kPi / 180.0); }},
  };
  return ops;
}

const MathsOp* find_maths_op(const std::string& name) {
  for (const auto& op : maths_ops())
    if (name == op.name) return &op;
  return nullptr;
}

NestedArray map_scalar_fn(ScalarFn f, const NestedArray& a) {
  return element_map(a, [f](const Value& x) { return Value(f(to_double(x))); });
}

NestedArray map_scalar_fn_inplace(ScalarFn f, const NestedArray& a) {
  return element_map_inplace(a, [f](const Value& x) { return Value(f(to_double(x))); });
}

static ScalarFn require_op(const std::string& name) {
  const MathsOp* op = find_maths_op(name);
  if (!op) throw std::invalid_argument("maths_function: unknown function '" + name + "'");
  return op->fn;
}

NestedArray maths_function(const std::string& name, const NestedArray& a) {
  return map_scalar_fn(require_op(name), a);
}

NestedArray maths_function_inplace(const std::string& name, const NestedArray& a) {
  return map_scalar_fn_inplace(require_op(name), a);
}

NestedArray absv(const NestedArray& a)        { return maths_function("abs", a); }
NestedArray acosv(const NestedArray& a)       { return maths_function("acos", a); }
NestedArray asinv(const NestedArray& a)       { return maths_function("asin", a); }
NestedArray atanv(const NestedArray& a)       { return maths_function("atan", a); }
NestedArray cbrtv(const NestedArray& a)       { return maths_function("cbrt", a); }
NestedArray ceilv(const NestedArray& a)       { return maths_function("ceil", a); }
NestedArray cosv(const NestedArray& a)        { return maths_function("cos", a); }
NestedArray coshv(const NestedArray& a)       { return maths_function("cosh", a); }
NestedArray expv(const NestedArray& a)        { return maths_function("exp", a); }
NestedArray floorv(const NestedArray& a)      { return maths_function("floor", a); }
NestedArray logv(const NestedArray& a)        { return maths_function("log", a); }
NestedArray log10v(const NestedArray& a)      { return maths_function("log10", a); }
NestedArray roundv(const NestedArray& a)      { return maths_function("round", a); }
NestedArray signumv(const NestedArray& a)     { return maths_function("signum", a); }
NestedArray sinv(const NestedArray& a)        { return maths_function("sin", a); }
NestedArray sinhv(const NestedArray& a)       { return maths_function("sinh", a); }
NestedArray sqrtv(const NestedArray& a)       { return maths_function("sqrt", a); }
NestedArray tanv(const NestedArray& a)        { return maths_function("tan", a); }
NestedArray tanhv(const NestedArray& a)       { return maths_function("tanh", a); }
NestedArray to_degreesv(const NestedArray& a) { return maths_function("to-degrees", a); }
NestedArray to_radiansv(const NestedArray& a) { return maths_function("to-radians", a); }

} // namespace pv
