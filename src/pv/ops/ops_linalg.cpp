// Products, norms and row operations over nested arrays.
//
//   vector_dot      : tight loop for two 1-D nested operands
//   matrix_multiply : 1-D x 2-D, 2-D x 1-D and 2-D x 2-D by dot products,
//                     everything else through inner_product
//   inner_product   : contracts the last axis of a with the first axis of b
//
// Leaves are read through to_double, so a non-numeric leaf raises TypeError.

#include <cmath>
#include <cstddef>
#include <sstream>
#include <vector>

#include "pv/ops/linalg.hpp"
#include "pv/ops/broadcast.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/elementwise.hpp"
#include "pv/ops/shape.hpp"
#include "pv/ops/slice.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/trace.hpp"

namespace pv {

// ---- helpers ----
static Value mul_scalars(const Value& x, const Value& y) {
  return Value(to_double(x) * to_double(y));
}

static Value add_scalars(const Value& x, const Value& y) {
  return Value(to_double(x) + to_double(y));
}

static Value sub_scalars(const Value& x, const Value& y) {
  return Value(to_double(x) - to_double(y));
}

static NestedArray nested_of(const Value& v) {
  return v.is_nested() ? v.nested() : as_nested(v);
}

// x * y for any mix of scalars and arrays.
static Value times(const Value& x, const Value& y) {
  const bool xa = dimensionality(x) > 0, ya = dimensionality(y) > 0;
  if (!xa && !ya) return mul_scalars(scalar_coerce(x), scalar_coerce(y));
  if (!xa) return pre_scale(x, nested_of(y));
  if (!ya) return scale(nested_of(x), y);
  return element_multiply(nested_of(x), y);
}

static Value plus(const Value& x, const Value& y) {
  const bool xa = dimensionality(x) > 0, ya = dimensionality(y) > 0;
  if (!xa && !ya) return add_scalars(scalar_coerce(x), scalar_coerce(y));
  if (xa) return matrix_add(nested_of(x), y);
  return matrix_add(nested_of(y), x);
}

static void check_inner(const char* op, std::size_t n, std::size_t m) {
  if (n == m) return;
  std::ostringstream oss;
  oss << op << ": inner dimensions differ (" << n << " vs " << m << ")";
  throw ShapeError(oss.str());
}

// ---- products ----

Value vector_dot(const NestedArray& a, const Value& b) {
  if (dimensionality(b) == 0) return scale(a, b);
  if (b.is_nested() && is_vector(a) && is_vector(b.nested())) {
    const NestedArray& bv = b.nested();
    check_inner("vector_dot", a.size(), bv.size());
    double s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) s += to_double(a[i]) * to_double(bv[i]);
    return Value(s);
  }
  return inner_product(Value(a), b);
}

Value inner_product(const Value& a, const Value& b) {
  const std::size_t da = dimensionality(a), db = dimensionality(b);
  if (da == 0 || db == 0) return times(a, b);

  if (da == 1) {
    const auto as = element_seq(a);
    const auto bs = get_major_slice_seq(b);
    check_inner("inner_product", as.size(), bs.size());
    if (db == 1) {
      double s = 0.0;
      for (std::size_t i = 0; i < as.size(); ++i) s += to_double(as[i]) * to_double(bs[i]);
      return Value(s);
    }
    if (as.empty()) {
      const Shape sb = shape(b);
      return new_nd(Shape(sb.begin() + 1, sb.end()));
    }
    Value acc = times(as[0], bs[0]);
    for (std::size_t i = 1; i < as.size(); ++i) acc = plus(acc, times(as[i], bs[i]));
    return acc;
  }

  std::vector<Value> out;
  for (const auto& row : get_major_slice_seq(a)) out.push_back(inner_product(row, b));
  return NestedArray(std::move(out));
}

double length_squared(const NestedArray& a) {
  double s = 0.0;
  for (const auto& x : element_seq(Value(a))) {
    const double v = to_double(x);
    s += v * v;
  }
  return s;
}

double length(const NestedArray& a) {
  return std::sqrt(length_squared(a));
}

NestedArray normalise(const NestedArray& a) {
  const double inv = 1.0 / length(a);
  return element_map(a, [inv](const Value& x) { return Value(to_double(x) * inv); });
}

double distance(const NestedArray& a, const Value& b) {
  return length(matrix_sub(a, b));
}

Value matrix_multiply(const NestedArray& m, const Value& a) {
  const std::size_t dm = dimensionality(m), da = dimensionality(a);
  if (da == 0) return scale(m, a);

  if (dm == 1 && da == 2) {
    // row vector times matrix: one dot product per column
    const NestedArray an = nested_of(a);
    check_inner("matrix_multiply", m.size(), an.size());
    std::vector<Value> out;
    for (const auto& col : get_columns(an)) out.push_back(vector_dot(m, col));
    return NestedArray(std::move(out));
  }

  if (dm == 2 && da == 1) {
    const Value av = nested_of(a);
    std::vector<Value> out;
    out.reserve(m.size());
    for (const auto& row : m) out.push_back(vector_dot(nested_of(row), av));
    return NestedArray(std::move(out));
  }

  if (dm == 2 && da == 2) {
    const NestedArray an = nested_of(a);
    const std::size_t rows = m.size();
    const std::size_t inner = rows ? dimension_count(m, 1) : 0;
    const std::size_t cols = an.empty() ? 0 : dimension_count(an, 1);
    check_inner("matrix_multiply", inner, an.size());

    std::vector<NestedArray> brows;
    brows.reserve(an.size());
    for (const auto& r : an) brows.push_back(nested_of(r));

    std::vector<Value> out;
    out.reserve(rows);
    for (std::size_t i = 0; i < rows; ++i) {
      const NestedArray ar = nested_of(m[i]);
      std::vector<Value> orow;
      orow.reserve(cols);
      for (std::size_t j = 0; j < cols; ++j) {
        double s = 0.0;
        for (std::size_t k = 0; k < inner; ++k) s += to_double(ar.at(k)) * to_double(brows[k].at(j));
        orow.emplace_back(s);
      }
      out.emplace_back(NestedArray(std::move(orow)));
    }
    return NestedArray(std::move(out));
  }

  PV_TRACE_LOG("matrix_multiply: generic inner product for %zu-D x %zu-D", dm, da);
  return inner_product(Value(m), a);
}

// ---- element-wise arithmetic ----

NestedArray element_multiply(const NestedArray& m, const Value& a) {
  if (dimensionality(a) == 0) return scale(m, a);
  auto ops = broadcast_compatible(Value(m), a);
  return nested_of(mapmatrix(mul_scalars, ops.first, ops.second));
}

NestedArray scale(const NestedArray& m, const Value& k) {
  if (dimensionality(k) > 0) return element_multiply(m, k);
  const double kd = to_double(k);
  return element_map(m, [kd](const Value& x) { return Value(to_double(x) * kd); });
}

NestedArray pre_scale(const Value& k, const NestedArray& m) {
  if (dimensionality(k) > 0) return nested_of(times(k, Value(m)));
  const double kd = to_double(k);
  return element_map(m, [kd](const Value& x) { return Value(kd * to_double(x)); });
}

NestedArray matrix_add(const NestedArray& m, const Value& a) {
  return element_map(m, add_scalars, a);
}

NestedArray matrix_sub(const NestedArray& m, const Value& a) {
  return element_map(m, sub_scalars, a);
}

NestedArray square(const NestedArray& m) {
  return nested_of(mapmatrix(mul_scalars, Value(m), Value(m)));
}

// ---- row operations ----

NestedArray swap_rows(const NestedArray& m, std::size_t i, std::size_t j) {
  const Value ri = m.at(i), rj = m.at(j);
  return m.assoc(i, rj).assoc(j, ri);
}

NestedArray multiply_row(const NestedArray& m, std::size_t i, const Value& factor) {
  return m.assoc(i, times(m.at(i), factor));
}

NestedArray add_row(const NestedArray& m, std::size_t i, std::size_t j, const Value& factor) {
  const Value& ri = m.at(i);
  const Value& rj = m.at(j);
  return m.assoc(i, plus(ri, times(factor, rj)));
}

} // namespace pv
