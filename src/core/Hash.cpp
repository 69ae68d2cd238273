#include "orrery/core/Hash.h"

namespace orrery::core {

u64 fnv1a64(std::string_view text) {
  constexpr u64 offsetBasis = 14695981039346656037ull;
  constexpr u64 prime       = 1099511628211ull;

  u64 hash = offsetBasis;
  for (unsigned char c : text) {
    hash ^= static_cast<u64>(c);
    hash *= prime;
  }
  return hash;
}

u64 hashCombine(u64 a, u64 b) {
  u64 x = a;
  x ^= b + 0x9E3779B97F4A7C15ull + (x << 6) + (x >> 2);
  // murmur3 finalizer
  x ^= x >> 33;
  x *= 0xff51afd7ed558ccdULL;
  x ^= x >> 33;
  x *= 0xc4ceb9fe1a85ec53ULL;
  x ^= x >> 33;
  return x;
}

} // namespace orrery::core
