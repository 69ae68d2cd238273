#include "orrery/sim/ObjectType.h"

#include <array>

namespace orrery::sim {

namespace {

constexpr std::array<std::string_view, kOrbitalObjectTypeCount> kTypeNames = {
  "star",
  "neutron star",
  "black hole",
  "telluric planet",
  "telluric satellite",
  "gas planet",
  "mandelbulb",
  "julia set",
  "space station",
  "space elevator",
};

} // namespace

std::string_view toString(OrbitalObjectType type) {
  const int i = static_cast<int>(type);
  if (i < 0 || i >= kOrbitalObjectTypeCount) return "unknown object";
  return kTypeNames[static_cast<std::size_t>(i)];
}

bool orbitalObjectTypeFromInt(int value, OrbitalObjectType& out) {
  if (value < 0 || value >= kOrbitalObjectTypeCount) return false;
  out = static_cast<OrbitalObjectType>(value);
  return true;
}

} // namespace orrery::sim
