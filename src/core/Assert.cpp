#include "orrery/core/Assert.h"
#include "orrery/core/Log.h"

#include <cstdlib>
#include <sstream>

namespace orrery::core {

[[noreturn]] void panic(std::string_view message, const char* file, int line) {
  std::ostringstream oss;
  oss << "PANIC: " << message << " (" << file << ":" << line << ")";
  log(LogLevel::Error, oss.str());
  std::abort();
}

} // namespace orrery::core
