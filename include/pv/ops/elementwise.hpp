#pragma once
#include <functional>
#include <vector>
#include "pv/core/value.hpp"

namespace pv {

using ElementFn   = std::function<Value(const Value&)>;
using ElementFn2  = std::function<Value(const Value&, const Value&)>;
using ElementFnN  = std::function<Value(const std::vector<Value>&)>;
using IndexedFn   = std::function<Value(const Index&, const Value&)>;
using IndexedFn2  = std::function<Value(const Index&, const Value&, const Value&)>;
using IndexedFnN  = std::function<Value(const Index&, const std::vector<Value>&)>;
using ReduceFn    = std::function<Value(const Value&, const Value&)>;

// The recursive engine behind every element-wise operation. Shapes are
// assumed to match (callers broadcast first); only per-level lengths are
// compared. The first operand decides the recursion depth:
//   0-D : f on the scalar values
//   1-D : f pairwise over the element sequences of all operands
//   N-D : recurse over the major slices of all operands
// An operand that is still an array when the first one has reached its
// scalars is a ShapeError; broadcast operands first.
Value mapmatrix(const ElementFn& f, const Value& m);
Value mapmatrix(const ElementFn2& f, const Value& m1, const Value& m2);
Value mapmatrix_n(const ElementFnN& f, const std::vector<Value>& ms);

// Flattened scalar leaves in row-major order. A 1-D array is its own element
// sequence; deeper arrays chain the sequences of their major slices.
std::vector<Value> element_seq(const Value& v);

// Pure maps. Multi-operand forms broadcast to a common shape first.
NestedArray element_map(const NestedArray& a, const ElementFn& f);
NestedArray element_map(const NestedArray& a, const ElementFn2& f, const Value& b);
NestedArray element_map(const NestedArray& a, const ElementFnN& f, const Value& b,
                        const std::vector<Value>& more);

// "In place" maps. The nested structure itself cannot change, so it is
// rebuilt; mutable foreign leaves are mutated through their own capability
// and kept in the result. The mutation is visible to every other array
// sharing those leaves.
NestedArray element_map_inplace(const NestedArray& a, const ElementFn& f);
NestedArray element_map_inplace(const NestedArray& a, const ElementFn2& f, const Value& b);
NestedArray element_map_inplace(const NestedArray& a, const ElementFnN& f, const Value& b,
                                const std::vector<Value>& more);

// Like element_map, with the full coordinate path of each scalar.
NestedArray element_map_indexed(const NestedArray& a, const IndexedFn& f);
NestedArray element_map_indexed(const NestedArray& a, const IndexedFn2& f, const Value& b);
NestedArray element_map_indexed(const NestedArray& a, const IndexedFnN& f, const Value& b,
                                const std::vector<Value>& more);
NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFn& f);
NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFn2& f, const Value& b);
NestedArray element_map_indexed_inplace(const NestedArray& a, const IndexedFnN& f, const Value& b,
                                        const std::vector<Value>& more);

// Left fold over element_seq(a). Without init the first scalar seeds the
// fold; an empty array then throws ShapeError.
Value element_reduce(const NestedArray& a, const ReduceFn& f);
Value element_reduce(const NestedArray& a, const ReduceFn& f, const Value& init);

double element_sum(const NestedArray& a);

} // namespace pv
