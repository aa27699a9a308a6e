#include "pv/ops/validate.hpp"
#include "pv/ops/shape.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include "pv/core/trace.hpp"
#include <optional>

namespace pv {

// v must be nested with v.size() == shape[pos]; below the last level no
// element may be an array.
static bool check_vector_shape(const Value& v, const Shape& shp, std::size_t pos) {
  if (!v.is_nested()) return false;
  const NestedArray& a = v.nested();
  if (a.size() != shp[pos]) return false;
  if (pos + 1 < shp.size()) {
    for (const auto& x : a)
      if (!check_vector_shape(x, shp, pos + 1)) return false;
    return true;
  }
  for (const auto& x : a)
    if (x.is_array()) return false;
  return true;
}

bool is_canonical(const Value& x) {
  if (!x.is_array()) return true;
  if (x.is_foreign()) return false;
  for (const auto& e : x.nested())
    if (!is_canonical(e)) return false;
  return check_vector_shape(x, shape(x), 0);
}

static std::optional<Shape> uniform_shape(const Value& v);

static std::optional<Shape> uniform_shape(const NestedArray& a) {
  if (a.empty()) return Shape{0};
  auto first = uniform_shape(a[0]);
  if (!first) return std::nullopt;
  for (std::size_t i = 1; i < a.size(); ++i) {
    auto s = uniform_shape(a[i]);
    if (!s || *s != *first) return std::nullopt;
  }
  Shape out{a.size()};
  out.insert(out.end(), first->begin(), first->end());
  return out;
}

static std::optional<Shape> uniform_shape(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return uniform_shape(v.nested());
    case Value::Kind::Foreign: return v.foreign()->shape();
    default:                   return Shape{};
  }
}

bool same_shapes(const NestedArray& a) {
  return uniform_shape(a).has_value();
}

Shape validate_shape(const NestedArray& a) {
  auto s = uniform_shape(a);
  if (!s) {
    PV_TRACE_LOG("validate_shape: non-rectangular array of length %zu", a.size());
    throw ValidationError("validate_shape: inconsistent shape for nested array");
  }
  return *s;
}

Shape validate_shape(const Value& v) {
  if (v.is_nested()) return validate_shape(v.nested());
  return shape(v);
}

} // namespace pv
