#include "pv/ops/elementwise.hpp"
#include "pv/ops/broadcast.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/indexing.hpp"
#include "pv/ops/shape.hpp"
#include "pv/ops/slice.hpp"
#include "pv/ops/validate.hpp"
#include "pv/core/config.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace pv {

namespace {

// Scalar value of an operand met at the 0-D level.
Value leaf_scalar(const Value& v) {
  if (!v.is_array()) return v;
  if (dimensionality(v) == 0) return get_0d(v);
  throw ShapeError("mapmatrix: expected a scalar operand, got shape " + shape_str(shape(v)));
}

void check_lengths(const char* op, std::size_t expect, std::size_t got) {
  if (expect == got) return;
  std::ostringstream oss;
  oss << op << ": length mismatch (" << expect << " vs " << got << ")";
  throw ShapeError(oss.str());
}

void validate_if_checked(const std::vector<Value>& ms) {
  if (!config::checked_enabled()) return;
  for (const auto& m : ms) validate_shape(m);
}

NestedArray to_nested(const Value& v) {
  return v.is_nested() ? v.nested() : as_nested(v);
}

// The single recursive walk behind every element-wise operation. `at` holds
// the coordinates of the current sub-array. With `inplace`, mutable foreign
// arrays in the first operand are updated through their own capability and
// returned as is. `plain` is set for the single-operand map that ignores
// coordinates; such leaves get the backend's non-indexed update.
Value walk(const IndexedFnN& f, const std::vector<Value>& ms, Index& at, bool inplace,
           const ElementFn* plain) {
  const Value& m1 = ms[0];
  const std::size_t d = dimensionality(m1);

  if (d == 0) {
    std::vector<Value> xs;
    xs.reserve(ms.size());
    for (const auto& m : ms) xs.push_back(leaf_scalar(m));
    return f(at, xs);
  }

  if (inplace && m1.is_foreign() && m1.foreign()->is_mutable()) {
    if (plain && ms.size() == 1) {
      m1.foreign()->element_map_inplace(*plain);
      return m1;
    }
    const Index base = at;
    m1.foreign()->element_map_indexed_inplace([&](const Index& sub, const Value& x) {
      Index full = base;
      full.insert(full.end(), sub.begin(), sub.end());
      std::vector<Value> xs{x};
      for (std::size_t k = 1; k < ms.size(); ++k) xs.push_back(scalar_coerce(get_nd(ms[k], sub)));
      return f(full, xs);
    });
    return m1;
  }

  if (d == 1) {
    std::vector<std::vector<Value>> seqs;
    seqs.reserve(ms.size());
    for (const auto& m : ms) seqs.push_back(element_seq(m));
    const std::size_t n = seqs[0].size();
    for (std::size_t k = 1; k < seqs.size(); ++k) check_lengths("mapmatrix", n, seqs[k].size());

    std::vector<Value> out;
    out.reserve(n);
    std::vector<Value> xs(ms.size());
    for (std::size_t i = 0; i < n; ++i) {
      for (std::size_t k = 0; k < seqs.size(); ++k) xs[k] = seqs[k][i];
      at.push_back(i);
      out.push_back(f(at, xs));
      at.pop_back();
    }
    return NestedArray(std::move(out));
  }

  std::vector<std::vector<Value>> slices;
  slices.reserve(ms.size());
  for (const auto& m : ms) slices.push_back(get_major_slice_seq(m));
  const std::size_t n = slices[0].size();
  for (std::size_t k = 1; k < slices.size(); ++k) check_lengths("mapmatrix", n, slices[k].size());

  std::vector<Value> out;
  out.reserve(n);
  std::vector<Value> sub(ms.size());
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t k = 0; k < slices.size(); ++k) sub[k] = slices[k][i];
    at.push_back(i);
    out.push_back(walk(f, sub, at, inplace, plain));
    at.pop_back();
  }
  return NestedArray(std::move(out));
}

Value run(const IndexedFnN& f, const std::vector<Value>& ms, bool inplace,
          const ElementFn* plain = nullptr) {
  validate_if_checked(ms);
  Index at;
  return walk(f, ms, at, inplace, plain);
}

// Every operand after the first broadcast to the first one's shape.
std::vector<Value> like_first(const NestedArray& a, const Value& b, const std::vector<Value>& more) {
  std::vector<Value> ms{Value(a), broadcast_like(b, Value(a))};
  for (const auto& m : more) ms.push_back(broadcast_like(m, Value(a)));
  return ms;
}

std::vector<Value> common(const NestedArray& a, const Value& b, const std::vector<Value>& more) {
  std::vector<Value> ms{Value(a), b};
  ms.insert(ms.end(), more.begin(), more.end());
  return broadcast_same_shape(ms);
}

IndexedFnN lift(const ElementFn& f) {
  return [f](const Index&, const std::vector<Value>& xs) { return f(xs[0]); };
}
IndexedFnN lift(const ElementFn2& f) {
  return [f](const Index&, const std::vector<Value>& xs) { return f(xs[0], xs[1]); };
}
IndexedFnN lift(const ElementFnN& f) {
  return [f](const Index&, const std::vector<Value>& xs) { return f(xs); };
}
IndexedFnN lift(const IndexedFn& f) {
  return [f](const Index& at, const std::vector<Value>& xs) { return f(at, xs[0]); };
}
IndexedFnN lift(const IndexedFn2& f) {
  return [f](const Index& at, const std::vector<Value>& xs) { return f(at, xs[0], xs[1]); };
}

} // anon

Value mapmatrix(const ElementFn& f, const Value& m) {
  return run(lift(f), {m}, false);
}

Value mapmatrix(const ElementFn2& f, const Value& m1, const Value& m2) {
  return run(lift(f), {m1, m2}, false);
}

Value mapmatrix_n(const ElementFnN& f, const std::vector<Value>& ms) {
  if (ms.empty()) throw std::invalid_argument("mapmatrix_n: no operands");
  return run(lift(f), ms, false);
}

std::vector<Value> element_seq(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Foreign: {
      const auto& fa = v.foreign();
      if (fa->dimensionality() == 0) return {fa->get_0d()};
      return fa->element_seq();
    }
    case Value::Kind::Nested: {
      const NestedArray& a = v.nested();
      std::vector<Value> out;
      if (is_vector(a)) {
        out.reserve(a.size());
        for (const auto& x : a) out.push_back(scalar_coerce(x));
        return out;
      }
      for (const auto& x : a) {
        auto s = element_seq(x);
        out.insert(out.end(), std::make_move_iterator(s.begin()), std::make_move_iterator(s.end()));
      }
      return out;
    }
    default:
      return {v};
  }
}

// ---------- pure maps ----------

NestedArray element_map(const NestedArray& a, const ElementFn& f) {
  return to_nested(run(lift(f), {Value(a)}, false));
}

NestedArray element_map(const NestedArray& a, const ElementFn2& f, const Value& b) {
  return to_nested(run(lift(f), common(a, b, {}), false));
}

NestedArray element_map(const NestedArray& a, const ElementFnN& f, const Value& b,
                        const std::vector<Value>& more) {
  return to_nested(run(lift(f), common(a, b, more), false));
}

// ---------- in-place maps ----------

NestedArray element_map_inplace(const NestedArray& a, const ElementFn& f) {
  return to_nested(run(lift(f), {Value(a)}, true, &f));
}

NestedArray element_map_inplace(const NestedArray& a, const ElementFn2& f, const Value& b) {
  return to_nested(run(lift(f), like_first(a, b, {}), true));
}

NestedArray element_map_inplace(const NestedArray& a, const ElementFnN& f, const Value& b,
                                const std::vector<Value>& more) {
  return to_nested(run(lift(f), like_first(a, b, more), true));
}

// ---------- indexed maps ----------

NestedArray element_map_indexed(const NestedArray& a, const IndexedFn& f) {
  return to_nested(run(lift(f), {Value(a)}, false));
}

NestedArray element_map_indexed(const NestedArray& a, const IndexedFn2& f, const Value& b) {
  return to_nested(run(lift(f), like_first(a, b, {}), false));
}

NestedArray element_map_indexed(const NestedArray& a, const IndexedFnN& f, const Value& b,
                                const std::vector<Value>& more) {
  return to_nested(run(f, like_first(a, b, more), false));
}

NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFn& f) {
  return to_nested(run(lift(f), {Value(a)}, true));
}

NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFn2& f, const Value& b) {
  return to_nested(run(lift(f), like_first(a, b, {}), true));
}

NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFnN& f, const Value& b,
                                        const std::vector<Value>& more) {
  return to_nested(run(f, like_first(a, b, more), true));
}

// ---------- reductions ----------

Value element_reduce(const NestedArray& a, const ReduceFn& f) {
  const auto seq = element_seq(Value(a));
  if (seq.empty()) throw ShapeError("element_reduce: empty array and no initial value");
  Value acc = seq[0];
  for (std::size_t i = 1; i < seq.size(); ++i) acc = f(acc, seq[i]);
  return acc;
}

Value element_reduce(const NestedArray& a, const ReduceFn& f, const Value& init) {
  Value acc = init;
  for (const auto& x : element_seq(Value(a))) acc = f(acc, x);
  return acc;
}

double element_sum(const NestedArray& a) {
  double s = 0.0;
  for (const auto& x : element_seq(Value(a))) s += to_double(x);
  return s;
}

} // namespace pv
