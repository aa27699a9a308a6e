#include "pv/random/sampling.hpp"
#include "pv/ops/construct.hpp"
#include <stdexcept>

namespace pv {

static thread_local RNG tl_rng{/*default seed*/ 88172645463393265ull};
static uint64_t last_seed = 88172645463393265ull;

RNG& global_rng() { return tl_rng; }

void set_global_seed(uint64_t seed) {
  if (seed == 0) seed = 88172645463393265ull;
  tl_rng = RNG(seed);
  last_seed = seed;
}

uint64_t get_global_seed() { return last_seed; }

namespace {

template <class Draw>
Value sample(const Shape& shape, RNG& rng, Draw draw) {
  return construct_from_generator(shape, [&rng, &draw](const Index&) { return Value(draw(rng)); });
}

double uniform(RNG& r) { return r.next_uniform01(); }
double gaussian(RNG& r) { return r.next_gaussian(); }

struct RandInt {
  double n;
  double operator()(RNG& r) const { return static_cast<double>(static_cast<long long>(n * r.next_uniform01())); }
};

struct Binomial {
  double p;
  long long trials;
  double operator()(RNG& r) const {
    long long k = 0;
    for (long long i = 0; i < trials; ++i)
      if (r.next_uniform01() < p) ++k;
    return static_cast<double>(k);
  }
};

RandInt rand_int(long long n) {
  if (n <= 0) throw std::invalid_argument("sample_rand_int: n must be positive");
  return RandInt{static_cast<double>(n)};
}

Binomial binomial(double p, long long trials) {
  if (trials < 0) throw std::invalid_argument("sample_binomial: negative number of trials");
  return Binomial{p, trials};
}

} // anon

std::vector<double> randoms(std::size_t count) {
  std::vector<double> out(count);
  for (auto& x : out) x = global_rng().next_uniform01();
  return out;
}

std::vector<double> randoms(std::size_t count, uint64_t seed) {
  RNG rng(seed);
  std::vector<double> out(count);
  for (auto& x : out) x = rng.next_uniform01();
  return out;
}

Value sample_uniform(const Shape& shape) { return sample(shape, global_rng(), uniform); }
Value sample_uniform(const Shape& shape, uint64_t seed) {
  RNG rng(seed);
  return sample(shape, rng, uniform);
}
NestedArray sample_uniform(std::size_t count) { return sample_uniform(Shape{count}).nested(); }
NestedArray sample_uniform(std::size_t count, uint64_t seed) { return sample_uniform(Shape{count}, seed).nested(); }

Value sample_normal(const Shape& shape) { return sample(shape, global_rng(), gaussian); }
Value sample_normal(const Shape& shape, uint64_t seed) {
  RNG rng(seed);
  return sample(shape, rng, gaussian);
}
NestedArray sample_normal(std::size_t count) { return sample_normal(Shape{count}).nested(); }
NestedArray sample_normal(std::size_t count, uint64_t seed) { return sample_normal(Shape{count}, seed).nested(); }

Value sample_rand_int(const Shape& shape, long long n) {
  return sample(shape, global_rng(), rand_int(n));
}
Value sample_rand_int(const Shape& shape, long long n, uint64_t seed) {
  RNG rng(seed);
  return sample(shape, rng, rand_int(n));
}
NestedArray sample_rand_int(std::size_t count, long long n) {
  return sample_rand_int(Shape{count}, n).nested();
}

Value sample_binomial(const Shape& shape, double p, long long trials) {
  return sample(shape, global_rng(), binomial(p, trials));
}
Value sample_binomial(const Shape& shape, double p, long long trials, uint64_t seed) {
  RNG rng(seed);
  return sample(shape, rng, binomial(p, trials));
}
NestedArray sample_binomial(std::size_t count, double p, long long trials) {
  return sample_binomial(Shape{count}, p, trials).nested();
}

} // namespace pv
