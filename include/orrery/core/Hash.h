#pragma once

#include "orrery/core/Types.h"

#include <string_view>

namespace orrery::core {

// 64-bit FNV-1a hash (stable, fast, good for IDs / seeds).
u64 fnv1a64(std::string_view text);

// Mix/combine two 64-bit hashes into one (order-sensitive).
u64 hashCombine(u64 a, u64 b);

// Derive a child seed from a parent seed and a salt.
// Used so independent generators (names, positions, factions...) never share a stream.
inline u64 deriveSeed(u64 base, u64 salt) { return hashCombine(base, salt); }
inline u64 deriveSeed(u64 base, std::string_view tag) { return hashCombine(base, fnv1a64(tag)); }

} // namespace orrery::core
