#include "orrery/sim/Universe.h"

#include "orrery/core/Assert.h"
#include "orrery/core/Log.h"
#include "orrery/proc/SystemGenerator.h"

namespace orrery::sim {

Universe::Universe(core::u64 seed, proc::GalaxyParams params)
: galaxy_(seed, params),
  factions_(seed, static_cast<std::size_t>(galaxy_.params().factionCount)) {}

double Universe::distanceLy(const StarSystemCoordinates& a, const StarSystemCoordinates& b) const {
  if (a == b) return 0.0;
  return math::distance(galaxy_.galacticPosition(a), galaxy_.galacticPosition(b));
}

const StarSystemModel& Universe::systemModel(const StarSystemCoordinates& coords) {
  if (const StarSystemModel* cached = systemCache_.get(coords)) return *cached;

  if (!galaxy_.isValid(coords)) {
    ORRERY_LOG_DEBUG("Generating system for coordinates outside the sector population: " + toString(coords));
  }
  return systemCache_.put(coords, proc::generateSystemModel(galaxy_, factions_, coords));
}

std::optional<OrbitalObjectModel> Universe::findObjectModel(const UniverseObjectId& id) {
  const StarSystemModel& system = systemModel(id.system);
  if (const OrbitalObjectModel* obj = findObject(system, id.object)) return *obj;
  return std::nullopt;
}

OrbitalObjectModel Universe::objectModel(const UniverseObjectId& id) {
  auto obj = findObjectModel(id);
  ORRERY_ASSERT_MSG(obj.has_value(), "Could not find object model for " + toString(id));
  return *obj;
}

void Universe::setCacheCapacity(std::size_t systemCap) {
  systemCache_.setCapacity(systemCap);
}

} // namespace orrery::sim
