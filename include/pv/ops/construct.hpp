#pragma once
#include <any>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "pv/core/value.hpp"
#include "pv/core/foreign.hpp"

namespace pv {

// Literal helper: array({array({1,2}), array({3,4})}). Not validated.
NestedArray array(std::initializer_list<Value> elems);

// Canonical nested form of a value:
//  - canonical nested arrays are returned unchanged
//  - arrays of dimensionality > 0 (nested or foreign) are converted through
//    convert_to_nested_vectors and coerced element by element
//  - 0-D foreign arrays yield their scalar
//  - scalars (null, numbers, objects) are returned unchanged
Value coerce(const Value& x);

namespace detail {

template <class T, class = void>
struct is_iterable : std::false_type {};
template <class T>
struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                  decltype(std::end(std::declval<const T&>()))>>
  : std::true_type {};

template <class T>
struct is_foreign_ptr : std::false_type {};
template <class F>
struct is_foreign_ptr<std::shared_ptr<F>> : std::is_convertible<F*, ForeignArray*> {};

} // namespace detail

// Native input: numbers, strings, fixed-size arrays, standard containers,
// any range with begin/end. Sequences become NestedArrays element by element;
// anything else is kept as an opaque scalar.
template <class T>
Value coerce(const T& x) {
  using U = std::decay_t<T>;
  if constexpr (std::is_arithmetic<U>::value
                || std::is_same<U, std::nullptr_t>::value
                || std::is_same<U, NestedArray>::value
                || detail::is_foreign_ptr<U>::value) {
    return coerce(Value(x));
  } else if constexpr (std::is_convertible<const T&, std::string>::value) {
    return Value(std::string(x));
  } else if constexpr (detail::is_iterable<T>::value) {
    std::vector<Value> out;
    for (const auto& e : x) out.push_back(coerce(e));
    return Value(NestedArray(std::move(out)));
  } else {
    return Value::object(std::any(x));
  }
}

template <class T>
Value coerce(std::initializer_list<T> xs) {
  std::vector<Value> out;
  out.reserve(xs.size());
  for (const auto& e : xs) out.push_back(coerce(e));
  return Value(NestedArray(std::move(out)));
}

// Nested form of an array value; throws ShapeError for scalars.
NestedArray as_nested(const Value& v);

// Already-canonical arrays come back as the same handle. Otherwise every
// element is converted; elements whose conversion is identical are not
// re-stored. Throws ValidationError when converted elements disagree on shape.
NestedArray convert_to_nested_vectors(const NestedArray& a);

// coerce + explicit rectangularity check (ValidationError on ragged input).
Value construct_matrix(const Value& data);
template <class T>
Value construct_matrix(const T& data) { return construct_matrix(coerce(data)); }

NestedArray new_vector(std::size_t length);
NestedArray new_matrix(std::size_t rows, std::size_t cols);
Value new_nd(const Shape& dims);

// Every scalar leaf is gen(coordinates); gen is called in row-major order.
using GeneratorFn = std::function<Value(const Index&)>;
Value construct_from_generator(const Shape& shape, const GeneratorFn& gen);

inline NestedArray immutable_matrix(const NestedArray& a) { return a; }
inline Value coerce_param(const NestedArray& /*self*/, const Value& p) { return coerce(p); }

} // namespace pv
