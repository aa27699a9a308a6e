#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "pv/core/value.hpp"

namespace pv {

// Capability interface for arrays of other backends that appear as leaves of
// a NestedArray or as operands of its operations. The nested backend never
// looks at their representation; it only calls the members below.
//
// Required: implementation_key, dimensionality, shape, element_seq,
// major_slices, get_0d, convert_to_nested_vectors. The rest have defaults
// derived from those. Mutating hooks are optional and throw UnsupportedError
// unless the backend is mutable.
class ForeignArray {
public:
  using IndexedUpdate = std::function<Value(const Index&, const Value&)>;

  virtual ~ForeignArray() = default;

  virtual std::string implementation_key() const = 0;
  virtual std::size_t dimensionality() const = 0;
  virtual Shape shape() const = 0;

  // Scalar leaves in row-major order.
  virtual std::vector<Value> element_seq() const = 0;
  // Sub-arrays with the axis-0 coordinate fixed (scalars for a 1-D array).
  virtual std::vector<Value> major_slices() const = 0;
  // The single value held by a 0-D array.
  virtual Value get_0d() const = 0;
  // Same contents as nested NestedArray values (a scalar for 0-D arrays).
  virtual Value convert_to_nested_vectors() const = 0;

  virtual std::size_t dimension_count(std::size_t axis) const;
  virtual Value get_major_slice(std::size_t i) const;
  virtual Value get_slice(std::size_t axis, std::size_t i) const;
  virtual Value get_nd(const Index& idx) const;

  virtual bool is_mutable() const { return false; }
  virtual void set_nd_inplace(const Index& idx, const Value& v);
  // Replaces every scalar x at coordinate idx by f(idx, x).
  virtual void element_map_indexed_inplace(const IndexedUpdate& f);
  // Replaces every scalar x by f(x). Defaults to the indexed form.
  virtual void element_map_inplace(const std::function<Value(const Value&)>& f);
};

} // namespace pv
