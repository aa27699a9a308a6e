#include "pv/ops/slice.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/shape.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include <sstream>

namespace pv {

std::vector<Value> get_major_slice_seq(const Value& v) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return v.nested().to_vector();
    case Value::Kind::Foreign: return v.foreign()->major_slices();
    default:
      throw ShapeError(std::string("get_major_slice_seq: no slices in a ") + kind_name(v.kind()));
  }
}

Value get_major_slice(const NestedArray& a, std::size_t i) {
  return a.at(i);
}

Value get_slice(const NestedArray& a, std::size_t axis, std::size_t i) {
  if (axis == 0) return get_major_slice(a, i);
  std::vector<Value> out;
  out.reserve(a.size());
  for (const auto& x : a) out.push_back(get_slice(x, axis - 1, i));
  return NestedArray(std::move(out));
}

Value get_slice(const Value& v, std::size_t axis, std::size_t i) {
  switch (v.kind()) {
    case Value::Kind::Nested:  return get_slice(v.nested(), axis, i);
    case Value::Kind::Foreign: return v.foreign()->get_slice(axis, i);
    default: {
      std::ostringstream oss;
      oss << "get_slice: axis " << axis << " out of range (reached a scalar)";
      throw ShapeError(oss.str());
    }
  }
}

Value get_column(const NestedArray& a, std::size_t j) {
  return get_slice(a, 1, j);
}

NestedArray get_columns(const NestedArray& a) {
  const std::size_t cols = dimension_count(a, 1);
  std::vector<Value> out;
  out.reserve(cols);
  for (std::size_t j = 0; j < cols; ++j) out.push_back(get_column(a, j));
  return NestedArray(std::move(out));
}

NestedArray subvector(const NestedArray& a, std::size_t start, std::size_t length) {
  return a.subvec(start, start + length);
}

NestedArray rotate(const NestedArray& a, std::size_t axis, long long places) {
  if (axis == 0) {
    const long long c = static_cast<long long>(a.size());
    if (c == 0) return a;
    long long sh = places % c;
    if (sh < 0) sh += c;
    if (sh == 0) return a;
    // element i moves to (i + places) mod count
    const std::size_t split = a.size() - std::size_t(sh);
    std::vector<Value> out;
    out.reserve(a.size());
    for (std::size_t i = split; i < a.size(); ++i) out.push_back(a[i]);
    for (std::size_t i = 0; i < split; ++i) out.push_back(a[i]);
    return NestedArray(std::move(out));
  }
  std::vector<Value> out;
  out.reserve(a.size());
  for (const auto& x : a) out.push_back(rotate(as_nested(x), axis - 1, places));
  return NestedArray(std::move(out));
}

NestedArray order(const NestedArray& a, const std::vector<std::size_t>& indices) {
  std::vector<Value> out;
  out.reserve(indices.size());
  for (auto i : indices) out.push_back(a.at(i));
  return NestedArray(std::move(out));
}

NestedArray order(const NestedArray& a, std::size_t axis, const std::vector<std::size_t>& indices) {
  if (axis == 0) return order(a, indices);
  std::vector<Value> out;
  out.reserve(a.size());
  for (const auto& x : a) out.push_back(order(as_nested(x), axis - 1, indices));
  return NestedArray(std::move(out));
}

NestedArray join(const NestedArray& a, const Value& b) {
  const std::size_t dims = dimensionality(a);
  const std::size_t bdims = dimensionality(b);
  if (dims == bdims) {
    std::vector<Value> out = a.to_vector();
    for (auto& s : get_major_slice_seq(b)) out.push_back(std::move(s));
    return NestedArray(std::move(out));
  }
  if (dims == bdims + 1) return a.conj(b);
  std::ostringstream oss;
  oss << "join: incompatible size, cannot join a " << bdims
      << "-dimensional array to a " << dims << "-dimensional one";
  throw ShapeError(oss.str());
}

NestedArray join_along(const NestedArray& a, const Value& b, std::size_t axis) {
  if (axis == 0) {
    if (dimensionality(a) != dimensionality(b))
      throw ShapeError("join_along: operands differ in dimensionality");
    return join(a, b);
  }
  const auto bs = get_major_slice_seq(b);
  if (bs.size() != a.size()) {
    std::ostringstream oss;
    oss << "join_along: axis-0 extents differ (" << a.size() << " vs " << bs.size() << ")";
    throw ShapeError(oss.str());
  }
  std::vector<Value> out;
  out.reserve(a.size());
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!a[i].is_array()) throw ShapeError("join_along: axis out of range");
    out.push_back(join_along(as_nested(a[i]), bs[i], axis - 1));
  }
  return NestedArray(std::move(out));
}

static NestedArray select_from(const NestedArray& a,
                               const std::vector<std::vector<std::size_t>>& args,
                               std::size_t pos) {
  const auto& picks = args[pos];
  std::vector<Value> out;
  out.reserve(picks.size());
  if (pos + 1 == args.size()) {
    if (dimensionality(a) != 1)
      throw ShapeError("select: array dimension does not match number of index lists");
    for (auto i : picks) out.push_back(a.at(i));
    return NestedArray(std::move(out));
  }
  for (auto i : picks) {
    const Value& x = a.at(i);
    if (!x.is_array())
      throw ShapeError("select: array dimension does not match number of index lists");
    out.push_back(select_from(as_nested(x), args, pos + 1));
  }
  return NestedArray(std::move(out));
}

NestedArray select(const NestedArray& a, const std::vector<std::vector<std::size_t>>& args) {
  if (args.empty()) throw ShapeError("select: no index lists given");
  return select_from(a, args, 0);
}

} // namespace pv
