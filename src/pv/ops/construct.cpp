#include "pv/ops/construct.hpp"
#include "pv/ops/shape.hpp"
#include "pv/ops/validate.hpp"
#include "pv/core/errors.hpp"
#include "pv/core/registry.hpp"
#include "pv/core/trace.hpp"
#include <sstream>

namespace pv {

NestedArray array(std::initializer_list<Value> elems) {
  return NestedArray(std::vector<Value>(elems));
}

Value coerce(const Value& x) {
  switch (x.kind()) {
    case Value::Kind::Nested:
      return convert_to_nested_vectors(x.nested());
    case Value::Kind::Foreign: {
      const auto& f = x.foreign();
      if (f->dimensionality() == 0) return coerce(f->get_0d());
      PV_TRACE_LOG("coerce: converting foreign '%s' array of shape %s",
                   f->implementation_key().c_str(), shape_str(f->shape()).c_str());
      return coerce(f->convert_to_nested_vectors());
    }
    default:
      return x;
  }
}

NestedArray as_nested(const Value& v) {
  if (v.is_nested()) return v.nested();
  if (v.is_foreign()) {
    Value c = coerce(v);
    if (c.is_nested()) return c.nested();
  }
  throw ShapeError(std::string("as_nested: expected an array, got ") + kind_name(v.kind()));
}

NestedArray convert_to_nested_vectors(const NestedArray& a) {
  if (is_canonical(Value(a))) return a;

  // Only re-store elements whose conversion produced a different value.
  NestedArray out = a;
  for (std::size_t i = 0; i < a.size(); ++i) {
    Value c = coerce(a[i]);
    if (!c.identical(a[i])) out = out.assoc(i, std::move(c));
  }

  if (!out.empty()) {
    const Shape first = shape(out[0]);
    for (std::size_t i = 1; i < out.size(); ++i) {
      if (shape(out[i]) != first) {
        PV_TRACE_LOG("convert_to_nested_vectors: element %zu has shape %s, expected %s",
                     i, shape_str(shape(out[i])).c_str(), shape_str(first).c_str());
        throw ValidationError("convert_to_nested_vectors: inconsistent shape");
      }
    }
  }
  return out;
}

Value construct_matrix(const Value& data) {
  Value out = coerce(data);
  if (out.is_nested()) validate_shape(out.nested());
  return out;
}

NestedArray new_vector(std::size_t length) {
  return NestedArray(std::vector<Value>(length, Value(0.0)));
}

NestedArray new_matrix(std::size_t rows, std::size_t cols) {
  return NestedArray(std::vector<Value>(rows, Value(new_vector(cols))));
}

Value new_nd(const Shape& dims) {
  Value out(0.0);
  for (std::size_t k = dims.size(); k-- > 0;) {
    out = NestedArray(std::vector<Value>(dims[k], out));
  }
  return out;
}

static Value generate(const Shape& shape, const GeneratorFn& gen, Index& at) {
  const std::size_t level = at.size();
  if (level == shape.size()) return gen(at);
  std::vector<Value> out;
  out.reserve(shape[level]);
  for (std::size_t i = 0; i < shape[level]; ++i) {
    at.push_back(i);
    out.push_back(generate(shape, gen, at));
    at.pop_back();
  }
  return NestedArray(std::move(out));
}

Value construct_from_generator(const Shape& shape, const GeneratorFn& gen) {
  Index at;
  at.reserve(shape.size());
  return generate(shape, gen, at);
}

namespace {

const ImplementationRegistrar register_persistent_vector{Implementation{
  "persistent-vector",
  1,
  "Nested immutable vectors used as N-dimensional arrays; other backends may "
  "appear as leaves.",
  [](const Value& data) { return construct_matrix(data); },
  [](const Shape& dims) { return new_nd(dims); }
}};

} // anon

} // namespace pv
