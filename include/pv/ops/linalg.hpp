#pragma once
#include <cstddef>
#include "pv/core/value.hpp"

namespace pv {

// Dot product of two 1-D arrays. A 0-D `b` scales `a`; operands that are not
// both 1-D nested arrays go through inner_product.
Value vector_dot(const NestedArray& a, const Value& b);

// Contracts the last axis of `a` with the first axis of `b`.
Value inner_product(const Value& a, const Value& b);

double length(const NestedArray& a);
double length_squared(const NestedArray& a);
// Zero vectors produce NaN components (0 * inf); no error is raised.
NestedArray normalise(const NestedArray& a);
double distance(const NestedArray& a, const Value& b);

// scalar a -> scale; 1-D x 2-D, 2-D x 1-D, 2-D x 2-D by dot products;
// everything else falls back to inner_product.
Value matrix_multiply(const NestedArray& m, const Value& a);
inline Value vector_transform(const NestedArray& m, const Value& v) { return matrix_multiply(m, v); }

NestedArray element_multiply(const NestedArray& m, const Value& a);
NestedArray scale(const NestedArray& m, const Value& k);
NestedArray pre_scale(const Value& k, const NestedArray& m);

NestedArray matrix_add(const NestedArray& m, const Value& a);
NestedArray matrix_sub(const NestedArray& m, const Value& a);
NestedArray square(const NestedArray& m);

// Row operations (elementary row operations of Gaussian elimination).
NestedArray swap_rows(const NestedArray& m, std::size_t i, std::size_t j);
NestedArray multiply_row(const NestedArray& m, std::size_t i, const Value& factor);
// row_i += factor * row_j
NestedArray add_row(const NestedArray& m, std::size_t i, std::size_t j, const Value& factor);

} // namespace pv
