#include "pv/ops/export.hpp"
#include "pv/ops/elementwise.hpp"
#include "pv/ops/shape.hpp"
#include "pv/ops/validate.hpp"
#include "pv/core/config.hpp"
#include "pv/core/trace.hpp"
#include <algorithm>

namespace pv {

namespace {

double as_double(const Value& v) { return to_double(v); }
const Value& as_object(const Value& v) { return v; }

// Fill out[0, n) from `a`. A level whose length equals the chunk size and
// whose first element is a scalar is copied directly; anything else is split
// into a.size() equal chunks, one per element. Writes never leave the chunk.
template <class T, class Conv>
void fill(const NestedArray& a, T* out, std::size_t n, Conv conv) {
  if (n == 0 || a.empty()) return;
  if (a.size() == n && !a[0].is_array()) {
    for (std::size_t i = 0; i < n; ++i) out[i] = conv(scalar_coerce(a[i]));
    return;
  }
  const std::size_t chunk = n / a.size();
  for (std::size_t i = 0; i < a.size(); ++i) {
    const Value& x = a[i];
    T* dst = out + i * chunk;
    if (x.is_nested()) {
      fill(x.nested(), dst, chunk, conv);
    } else if (x.is_foreign()) {
      const auto seq = element_seq(x);
      const std::size_t m = std::min(seq.size(), chunk);
      for (std::size_t k = 0; k < m; ++k) dst[k] = conv(seq[k]);
    } else if (chunk > 0) {
      dst[0] = conv(x);
    }
  }
}

template <class T, class Conv>
std::vector<T> flatten(const NestedArray& a, Conv conv) {
  PV_TRACE_SCOPE("flatten");
  if (config::checked_enabled()) validate_shape(a);
  std::vector<T> out(element_count(a));
  fill(a, out.data(), out.size(), conv);
  return out;
}

} // anon

std::vector<double> to_double_array(const NestedArray& a) {
  return flatten<double>(a, as_double);
}

std::vector<Value> to_object_array(const NestedArray& a) {
  return flatten<Value>(a, as_object);
}

} // namespace pv
