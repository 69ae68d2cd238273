#pragma once

#include "orrery/math/Vec3.h"
#include "orrery/sim/StarSystemModel.h"

#include <vector>

namespace orrery::sim {

// An object of a loaded system, placed at the system's current time.
class OrbitalObject {
public:
  OrbitalObject(OrbitalObjectModel model, const math::Vec3d& positionKm)
  : model_(std::move(model)), positionKm_(positionKm) {}

  const OrbitalObjectModel& model() const { return model_; }

  // System frame, km. The primary sits at the origin.
  const math::Vec3d& absolutePositionKm() const { return positionKm_; }

  double boundingRadiusKm() const { return model_.radiusKm; }

private:
  friend class StarSystem;

  OrbitalObjectModel model_;
  math::Vec3d positionKm_{};
};

// The system the player is currently in.
class StarSystem {
public:
  explicit StarSystem(StarSystemModel model, double timeSeconds = 0.0);

  const StarSystemModel& model() const { return model_; }
  const StarSystemCoordinates& coordinates() const { return model_.coordinates; }

  double timeSeconds() const { return timeSeconds_; }

  // Re-place every object along its orbit.
  void setTime(double timeSeconds);

  const std::vector<OrbitalObject>& objects() const { return objects_; }

  // nullptr when no object has this path.
  const OrbitalObject* find(const SystemObjectId& id) const;

private:
  void updatePositions();

  StarSystemModel model_;
  double timeSeconds_{0.0};
  std::vector<OrbitalObject> objects_;
};

// Live object for `id`, or nullptr when the id points to another system or
// to nothing in this one.
const OrbitalObject* resolve(const UniverseObjectId& id, const StarSystem& system);

} // namespace orrery::sim
