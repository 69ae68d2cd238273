#pragma once

#include <string_view>

namespace orrery::core {

// Fatal internal-consistency fault: logs at Error level and aborts.
// Reserved for states the deterministic generator guarantees cannot happen
// (seed drift, version mismatch). Never use it for bad user input.
[[noreturn]] void panic(std::string_view message, const char* file, int line);

} // namespace orrery::core

#define ORRERY_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      ::orrery::core::panic("Assertion failed: " #expr, __FILE__, __LINE__); \
    } \
  } while (0)

#define ORRERY_ASSERT_MSG(expr, msg) \
  do { \
    if (!(expr)) { \
      ::orrery::core::panic((msg), __FILE__, __LINE__); \
    } \
  } while (0)
