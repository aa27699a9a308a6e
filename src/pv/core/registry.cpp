#include "pv/core/registry.hpp"
#include "pv/core/trace.hpp"
#include <algorithm>

namespace pv {

std::vector<Implementation>& implementation_registry() {
  static std::vector<Implementation> r;
  return r;
}

void register_implementation(Implementation impl) {
  auto& reg = implementation_registry();
  auto it = std::find_if(reg.begin(), reg.end(),
                         [&](const Implementation& x){ return x.key == impl.key; });
  PV_TRACE_LOG("registering implementation '%s' (min dims %zu)",
               impl.key.c_str(), impl.min_dimensionality);
  if (it != reg.end()) *it = std::move(impl);
  else reg.push_back(std::move(impl));
}

const Implementation* find_implementation(const std::string& key) {
  for (const auto& impl : implementation_registry())
    if (impl.key == key) return &impl;
  return nullptr;
}

const Implementation* implementation_for_dimensionality(std::size_t dims) {
  for (const auto& impl : implementation_registry())
    if (impl.min_dimensionality <= dims) return &impl;
  return nullptr;
}

std::vector<std::string> implementation_keys() {
  std::vector<std::string> keys;
  for (const auto& impl : implementation_registry()) keys.push_back(impl.key);
  return keys;
}

} // namespace pv
