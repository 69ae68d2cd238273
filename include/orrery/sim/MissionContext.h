#pragma once

#include "orrery/math/Vec3.h"
#include "orrery/sim/StarSystem.h"
#include "orrery/sim/Universe.h"

#include <string>
#include <unordered_map>

namespace orrery::sim {

// Per-tick view of the world handed to mission nodes. Built fresh every
// update and never stored.
struct MissionContext {
  Universe& universe;
  const StarSystem& currentSystem;
  math::Vec3d playerPositionKm{}; // frame of currentSystem
};

// Display labels for input actions, e.g. {"starMap", "M"}, {"jump", "J"}.
using InputBindingLabels = std::unordered_map<std::string, std::string>;

// Label for `action`, or "[unbound]".
std::string bindingLabel(const InputBindingLabels& labels, const std::string& action);

} // namespace orrery::sim
