#include "pv/core/foreign.hpp"
#include "pv/core/errors.hpp"
#include "pv/ops/indexing.hpp"
#include "pv/ops/slice.hpp"
#include <sstream>

namespace pv {

std::size_t ForeignArray::dimension_count(std::size_t axis) const {
  const Shape s = shape();
  if (axis >= s.size()) {
    std::ostringstream oss;
    oss << implementation_key() << ": axis " << axis << " out of range for shape " << shape_str(s);
    throw ShapeError(oss.str());
  }
  return s[axis];
}

Value ForeignArray::get_major_slice(std::size_t i) const {
  auto slices = major_slices();
  if (i >= slices.size()) {
    std::ostringstream oss;
    oss << implementation_key() << ": slice " << i << " out of range for length " << slices.size();
    throw IndexError(oss.str());
  }
  return slices[i];
}

Value ForeignArray::get_slice(std::size_t axis, std::size_t i) const {
  if (axis == 0) return get_major_slice(i);
  const Value nested = convert_to_nested_vectors();
  return pv::get_slice(nested, axis, i);
}

Value ForeignArray::get_nd(const Index& idx) const {
  if (idx.empty()) return dimensionality() == 0 ? get_0d() : convert_to_nested_vectors();
  const Value head = get_major_slice(idx[0]);
  return pv::get_nd(head, Index(idx.begin() + 1, idx.end()));
}

void ForeignArray::set_nd_inplace(const Index&, const Value&) {
  throw UnsupportedError(implementation_key() + ": set_nd_inplace on an immutable array");
}

void ForeignArray::element_map_indexed_inplace(const IndexedUpdate&) {
  throw UnsupportedError(implementation_key() + ": element_map_indexed_inplace on an immutable array");
}

void ForeignArray::element_map_inplace(const std::function<Value(const Value&)>& f) {
  element_map_indexed_inplace([&f](const Index&, const Value& x) { return f(x); });
}

} // namespace pv
