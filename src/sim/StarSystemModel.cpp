#include "orrery/sim/StarSystemModel.h"

namespace orrery::sim {

int findObjectIndex(const StarSystemModel& system, const SystemObjectId& id) {
  for (std::size_t i = 0; i < system.objects.size(); ++i) {
    if (system.objects[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

const OrbitalObjectModel* findObject(const StarSystemModel& system, const SystemObjectId& id) {
  const int i = findObjectIndex(system, id);
  return (i >= 0) ? &system.objects[static_cast<std::size_t>(i)] : nullptr;
}

std::vector<const OrbitalObjectModel*> objectsOfType(const StarSystemModel& system, OrbitalObjectType type) {
  std::vector<const OrbitalObjectModel*> out;
  for (const auto& o : system.objects) {
    if (o.type() == type) out.push_back(&o);
  }
  return out;
}

std::vector<const OrbitalObjectModel*> orbitalFacilities(const StarSystemModel& system) {
  std::vector<const OrbitalObjectModel*> out;
  for (const auto& o : system.objects) {
    if (isOrbitalFacility(o.type())) out.push_back(&o);
  }
  return out;
}

std::size_t countObjects(const StarSystemModel& system, OrbitalObjectType type) {
  std::size_t n = 0;
  for (const auto& o : system.objects) {
    if (o.type() == type) ++n;
  }
  return n;
}

} // namespace orrery::sim
