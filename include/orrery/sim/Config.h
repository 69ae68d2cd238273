#pragma once

#include "orrery/core/CVar.h"
#include "orrery/proc/GalaxyGenerator.h"
#include "orrery/sim/MissionBoard.h"

namespace orrery::sim {

// Registers galaxy.* and mission.* variables (plus the core ones) with
// their defaults. Safe to call repeatedly.
void installSimCVars(core::CVarRegistry& registry = core::cvars());

proc::GalaxyParams galaxyParamsFromCVars(const core::CVarRegistry& registry = core::cvars());
MissionBoardParams missionBoardParamsFromCVars(const core::CVarRegistry& registry = core::cvars());

} // namespace orrery::sim
