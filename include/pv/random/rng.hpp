#ifndef PV_RNG_HPP
#define PV_RNG_HPP

#include <cmath>
#include <cstdint>

namespace pv {

// Tiny xorshift64* RNG for portability (not cryptographic)
struct RNG {
  uint64_t state;
  bool has_spare = false;
  double spare = 0.0;

  explicit RNG(uint64_t seed = 88172645463393265ull) : state(seed?seed:88172645463393265ull) {}
  inline uint64_t next_u64() {
    uint64_t x = state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    state = x;
    return x * 2685821657736338717ull;
  }
  inline double next_uniform01() {
    // 53-bit mantissa -> [0,1)
    return (next_u64() >> 11) * (1.0/9007199254740992.0);
  }
  // Standard normal, Marsaglia polar method (second draw cached)
  inline double next_gaussian() {
    if (has_spare) { has_spare = false; return spare; }
    double u, v, s;
    do {
      u = 2.0 * next_uniform01() - 1.0;
      v = 2.0 * next_uniform01() - 1.0;
      s = u*u + v*v;
    } while (s >= 1.0 || s == 0.0);
    const double m = std::sqrt(-2.0 * std::log(s) / s);
    spare = v * m;
    has_spare = true;
    return u * m;
  }
};

} // namespace pv

#endif // PV_RNG_HPP
