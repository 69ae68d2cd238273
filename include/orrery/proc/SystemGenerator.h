#pragma once

#include "orrery/proc/GalaxyGenerator.h"
#include "orrery/sim/Faction.h"
#include "orrery/sim/StarSystemModel.h"

namespace orrery::proc {

// Deterministic: the same galaxy seed, params and coordinates always yield a
// structurally identical model. No side effects.
sim::StarSystemModel generateSystemModel(const GalaxyGenerator& galaxy,
                                         const sim::FactionRegistry& factions,
                                         const sim::StarSystemCoordinates& coords);

} // namespace orrery::proc
