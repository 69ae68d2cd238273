#include "orrery/sim/StarSystem.h"

#include "orrery/sim/Orbit.h"

namespace orrery::sim {

StarSystem::StarSystem(StarSystemModel model, double timeSeconds)
: model_(std::move(model)), timeSeconds_(timeSeconds) {
  objects_.reserve(model_.objects.size());
  for (const auto& o : model_.objects) objects_.emplace_back(o, math::Vec3d{});
  updatePositions();
}

void StarSystem::setTime(double timeSeconds) {
  timeSeconds_ = timeSeconds;
  updatePositions();
}

void StarSystem::updatePositions() {
  // Parents precede children, so one forward pass is enough.
  for (std::size_t i = 0; i < objects_.size(); ++i) {
    auto& obj = objects_[i];
    const int parent = obj.model_.parentIndex;
    if (parent < 0 || static_cast<std::size_t>(parent) >= i) {
      obj.positionKm_ = orbitPosition3DKm(obj.model_.orbit, timeSeconds_);
      continue;
    }
    obj.positionKm_ = objects_[static_cast<std::size_t>(parent)].positionKm_
                    + orbitPosition3DKm(obj.model_.orbit, timeSeconds_);
  }
}

const OrbitalObject* StarSystem::find(const SystemObjectId& id) const {
  for (const auto& o : objects_) {
    if (o.model().id == id) return &o;
  }
  return nullptr;
}

const OrbitalObject* resolve(const UniverseObjectId& id, const StarSystem& system) {
  if (id.system != system.coordinates()) return nullptr;
  return system.find(id.object);
}

} // namespace orrery::sim
