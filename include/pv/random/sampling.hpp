#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "pv/core/value.hpp"
#include "pv/random/rng.hpp"

namespace pv {

// Thread-local global RNG accessor and seed control
RNG& global_rng();
void set_global_seed(uint64_t seed);
uint64_t get_global_seed();

// `count` uniform draws on [0,1).
std::vector<double> randoms(std::size_t count);
std::vector<double> randoms(std::size_t count, uint64_t seed);

// Arrays of random samples built leaf by leaf in row-major order. The size is
// a shape or a number of samples; without a seed the global RNG is used.
Value sample_uniform(const Shape& shape);
Value sample_uniform(const Shape& shape, uint64_t seed);
NestedArray sample_uniform(std::size_t count);
NestedArray sample_uniform(std::size_t count, uint64_t seed);

// Standard normal.
Value sample_normal(const Shape& shape);
Value sample_normal(const Shape& shape, uint64_t seed);
NestedArray sample_normal(std::size_t count);
NestedArray sample_normal(std::size_t count, uint64_t seed);

// Integers in [0, n).
Value sample_rand_int(const Shape& shape, long long n);
Value sample_rand_int(const Shape& shape, long long n, uint64_t seed);
NestedArray sample_rand_int(std::size_t count, long long n);

// Successes out of `trials` Bernoulli trials with probability p.
Value sample_binomial(const Shape& shape, double p, long long trials = 1);
Value sample_binomial(const Shape& shape, double p, long long trials, uint64_t seed);
NestedArray sample_binomial(std::size_t count, double p, long long trials = 1);

} // namespace pv
