#include "pv/ops/equality.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/elementwise.hpp"
#include "pv/ops/shape.hpp"
#include "pv/ops/slice.hpp"
#include <string>

namespace pv {

bool matrix_equals(const NestedArray& a, const Value& b) {
  const std::size_t db = dimensionality(b);
  if (db == 0) return false;
  if (dimension_count(b, 0) != a.size()) return false;

  if (is_vector(a)) {
    if (db != 1) return false;
    const auto bs = element_seq(b);
    for (std::size_t i = 0; i < a.size(); ++i)
      if (!value_equals(scalar_coerce(a[i]), bs[i])) return false;
    return true;
  }

  const auto bs = get_major_slice_seq(b);
  for (std::size_t i = 0; i < a.size(); ++i)
    if (!value_equals(a[i], bs[i])) return false;
  return true;
}

bool value_equals(const Value& a, const Value& b) {
  const Value x = scalar_coerce(a), y = scalar_coerce(b);
  if (x.is_array()) {
    if (!y.is_array()) return false;
    return matrix_equals(x.is_nested() ? x.nested() : as_nested(x), y);
  }
  if (y.is_array()) return false;
  if (x.kind() != y.kind()) return false;
  switch (x.kind()) {
    case Value::Kind::Null:   return true;
    case Value::Kind::Number: return x.number() == y.number();
    case Value::Kind::Object: {
      const auto* xs = x.object_as<std::string>();
      const auto* ys = y.object_as<std::string>();
      if (xs && ys) return *xs == *ys;
      return x.identical(y);
    }
    default: return false;
  }
}

} // namespace pv
