#include "orrery/sim/Coordinates.h"

#include "orrery/core/Hash.h"

#include <sstream>

namespace orrery::sim {

namespace {

core::u64 hashSector(const SectorCoord& c) {
  core::u64 h = core::hashCombine(0x5EC7'0A11ull, static_cast<core::u64>(static_cast<core::u32>(c.x)));
  h = core::hashCombine(h, static_cast<core::u64>(static_cast<core::u32>(c.y)));
  h = core::hashCombine(h, static_cast<core::u64>(static_cast<core::u32>(c.z)));
  return h;
}

core::u64 hashCoords(const StarSystemCoordinates& c) {
  return core::hashCombine(hashSector(c.sector), static_cast<core::u64>(c.localIndex));
}

} // namespace

std::size_t SectorCoordHash::operator()(const SectorCoord& c) const noexcept {
  return static_cast<std::size_t>(hashSector(c));
}

std::size_t StarSystemCoordinatesHash::operator()(const StarSystemCoordinates& c) const noexcept {
  return static_cast<std::size_t>(hashCoords(c));
}

std::size_t UniverseObjectIdHash::operator()(const UniverseObjectId& id) const noexcept {
  core::u64 h = hashCoords(id.system);
  h = core::hashCombine(h, static_cast<core::u64>(id.object.type));
  h = core::hashCombine(h, static_cast<core::u64>(id.object.index));
  return static_cast<std::size_t>(h);
}

std::string toString(const StarSystemCoordinates& c) {
  std::ostringstream oss;
  oss << "(" << c.sector.x << ", " << c.sector.y << ", " << c.sector.z << ")#" << c.localIndex;
  return oss.str();
}

std::string toString(const UniverseObjectId& id) {
  std::ostringstream oss;
  oss << toString(id.system) << "/" << toString(id.object.type) << ":" << id.object.index;
  return oss.str();
}

} // namespace orrery::sim
