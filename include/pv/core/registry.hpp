#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "pv/core/value.hpp"

namespace pv {

// One array backend known to the process. Filled in once at start-up by a
// static ImplementationRegistrar and only read afterwards.
struct Implementation {
  std::string key;
  std::size_t min_dimensionality = 0;   // smallest dimensionality it represents
  std::string doc;
  std::function<Value(const Value&)> construct;     // construct_matrix
  std::function<Value(const Shape&)> new_array;     // zero-filled array of a shape
};

std::vector<Implementation>& implementation_registry();

void register_implementation(Implementation impl);

// nullptr when no backend registered under `key`.
const Implementation* find_implementation(const std::string& key);

// First registered backend able to hold arrays of `dims` dimensions.
const Implementation* implementation_for_dimensionality(std::size_t dims);

std::vector<std::string> implementation_keys();

struct ImplementationRegistrar {
  explicit ImplementationRegistrar(Implementation impl) {
    register_implementation(std::move(impl));
  }
};

} // namespace pv
