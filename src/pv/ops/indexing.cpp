#include "pv/ops/indexing.hpp"
#include "pv/ops/construct.hpp"
#include "pv/ops/shape.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/foreign.hpp"
#include <sstream>

namespace pv {

static IndexError too_many_indices(const char* op, std::size_t n) {
  std::ostringstream oss;
  oss << op << ": " << n << " indices left after reaching a scalar";
  return IndexError(oss.str());
}

Value get_1d(const NestedArray& a, std::size_t i) {
  return scalar_coerce(a.at(i));
}

Value get_2d(const NestedArray& a, std::size_t i, std::size_t j) {
  const Value& row = a.at(i);
  if (row.is_nested()) return get_1d(row.nested(), j);
  return scalar_coerce(get_nd(row, Index{j}));
}

Value get_nd(const NestedArray& a, const Index& idx) {
  if (idx.empty()) return a;
  const Value& head = a.at(idx[0]);
  if (idx.size() == 1) return head;
  return get_nd(head, Index(idx.begin() + 1, idx.end()));
}

Value get_nd(const Value& v, const Index& idx) {
  if (idx.empty()) return v;
  switch (v.kind()) {
    case Value::Kind::Nested:  return get_nd(v.nested(), idx);
    case Value::Kind::Foreign: return v.foreign()->get_nd(idx);
    default: throw too_many_indices("get_nd", idx.size());
  }
}

static NestedArray set_from(const NestedArray& a, const Index& idx, std::size_t pos, const Value& v);

static Value set_in(const Value& child, const Index& idx, std::size_t pos, const Value& v) {
  switch (child.kind()) {
    case Value::Kind::Nested:
      return set_from(child.nested(), idx, pos, v);
    case Value::Kind::Foreign: {
      const auto& f = child.foreign();
      if (f->is_mutable()) {
        // Mutation propagates into the shared leaf.
        f->set_nd_inplace(Index(idx.begin() + pos, idx.end()), v);
        return child;
      }
      return set_from(as_nested(child), idx, pos, v);
    }
    default:
      throw too_many_indices("set_nd", idx.size() - pos);
  }
}

static NestedArray set_from(const NestedArray& a, const Index& idx, std::size_t pos, const Value& v) {
  if (pos >= idx.size())
    throw UpdateError("set_nd: insufficient indices to reach a leaf");
  const std::size_t i = idx[pos];
  const Value& current = a.at(i);
  if (pos + 1 == idx.size()) return a.assoc(i, v);
  return a.assoc(i, set_in(current, idx, pos + 1, v));
}

NestedArray set_1d(const NestedArray& a, std::size_t i, const Value& v) {
  (void)a.at(i);
  return a.assoc(i, v);
}

NestedArray set_2d(const NestedArray& a, std::size_t i, std::size_t j, const Value& v) {
  return set_from(a, Index{i, j}, 0, v);
}

NestedArray set_nd(const NestedArray& a, const Index& idx, const Value& v) {
  return set_from(a, idx, 0, v);
}

} // namespace pv
