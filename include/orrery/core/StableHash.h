#pragma once

#include "orrery/core/Types.h"

#include <cmath>
#include <cstddef>
#include <string_view>

namespace orrery::core {

// Portable 64-bit stable hash builder for regression signatures.
//
// Integers are fed in explicit little-endian order, strings are length-prefixed
// and doubles are quantized, so the value is identical across runs and platforms.
// Not cryptographic.
class StableHash64 {
public:
  static constexpr u64 kOffsetBasis = 14695981039346656037ull;
  static constexpr u64 kPrime       = 1099511628211ull;

  explicit StableHash64(u64 seed = kOffsetBasis) : h_(seed) {}

  u64 value() const { return h_; }

  void addU8(u8 b) {
    h_ ^= static_cast<u64>(b);
    h_ *= kPrime;
  }

  void addU32(u32 v) {
    for (int i = 0; i < 4; ++i) addU8(static_cast<u8>((v >> (8 * i)) & 0xFFu));
  }

  void addU64(u64 v) {
    for (int i = 0; i < 8; ++i) addU8(static_cast<u8>((v >> (8 * i)) & 0xFFull));
  }

  void addI64(i64 v) { addU64(static_cast<u64>(v)); }
  void addInt(int v) { addI64(static_cast<i64>(v)); }

  void addString(std::string_view s) {
    addU64(static_cast<u64>(s.size()));
    for (char c : s) addU8(static_cast<u8>(c));
  }

  // Quantize to integer steps of 1/scale. Relative scale matters for large magnitudes
  // (masses in kg), so callers pick a scale that suits the quantity.
  void addDoubleQ(double v, double scale = 1e6) {
    if (!std::isfinite(v)) {
      addU8(0xFFu);
      return;
    }
    addI64(static_cast<i64>(std::llround(v * scale)));
  }

private:
  u64 h_{kOffsetBasis};
};

} // namespace orrery::core
