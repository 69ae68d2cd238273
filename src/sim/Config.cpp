#include "orrery/sim/Config.h"

#include <algorithm>

namespace orrery::sim {

void installSimCVars(core::CVarRegistry& r) {
  core::installDefaultCVars(r);

  const proc::GalaxyParams g{};
  r.defineFloat("galaxy.sectorSizeLy", g.sectorSizeLy, core::CVar_Archive, "Edge length of a galaxy sector (ly)");
  r.defineFloat("galaxy.radiusLy", g.radiusLy, core::CVar_Archive, "Disc radius (ly)");
  r.defineFloat("galaxy.radialScaleLengthLy", g.radialScaleLengthLy, core::CVar_Archive,
                "Density falloff length in the disc plane (ly)");
  r.defineFloat("galaxy.verticalScaleHeightLy", g.verticalScaleHeightLy, core::CVar_Archive,
                "Density falloff height above the plane (ly)");
  r.defineFloat("galaxy.density", g.baseMeanSystemsPerSector, core::CVar_Archive,
                "Mean systems per sector at the galactic centre");
  r.defineInt("galaxy.maxSystemsPerSector", g.maxSystemsPerSector, core::CVar_Archive);
  r.defineInt("galaxy.factions", g.factionCount, core::CVar_Archive, "Number of factions");

  const MissionBoardParams m{};
  r.defineFloat("mission.sightseeing.radiusLy", m.sightseeingSearchRadiusLy, core::CVar_Archive,
                "Search radius for sightseeing targets (ly)");
  r.defineFloat("mission.sightseeing.keepChance", m.sightseeingKeepChance, core::CVar_Archive,
                "Probability that a candidate target is offered");
  r.defineInt("mission.sightseeing.maxOffers", static_cast<std::int64_t>(m.maxSightseeingOffers), core::CVar_Archive);
  r.defineInt("mission.flyBy.baseReward", m.flyByBaseReward, core::CVar_Archive, "Credits");
  r.defineFloat("mission.flyBy.rewardPerLy", m.flyByRewardPerLy, core::CVar_Archive, "Credits per light-year");
  r.defineFloat("mission.contact.radiusLy", m.contactSearchRadiusLy, core::CVar_Archive,
                "Search radius for contact stations (ly)");
  r.defineFloat("mission.contact.decay", m.contactDistanceDecay, core::CVar_Archive,
                "k in the contact keep probability 1 / (1 + k d^2)");
}

proc::GalaxyParams galaxyParamsFromCVars(const core::CVarRegistry& r) {
  proc::GalaxyParams g{};
  g.sectorSizeLy = r.getFloat("galaxy.sectorSizeLy", g.sectorSizeLy);
  g.radiusLy = r.getFloat("galaxy.radiusLy", g.radiusLy);
  g.radialScaleLengthLy = r.getFloat("galaxy.radialScaleLengthLy", g.radialScaleLengthLy);
  g.verticalScaleHeightLy = r.getFloat("galaxy.verticalScaleHeightLy", g.verticalScaleHeightLy);
  g.baseMeanSystemsPerSector = r.getFloat("galaxy.density", g.baseMeanSystemsPerSector);
  g.maxSystemsPerSector = static_cast<int>(r.getInt("galaxy.maxSystemsPerSector", g.maxSystemsPerSector));
  g.factionCount = static_cast<int>(r.getInt("galaxy.factions", g.factionCount));
  return g;
}

MissionBoardParams missionBoardParamsFromCVars(const core::CVarRegistry& r) {
  MissionBoardParams m{};
  m.sightseeingSearchRadiusLy = r.getFloat("mission.sightseeing.radiusLy", m.sightseeingSearchRadiusLy);
  m.sightseeingKeepChance = r.getFloat("mission.sightseeing.keepChance", m.sightseeingKeepChance);
  m.maxSightseeingOffers = static_cast<std::size_t>(
    std::max<std::int64_t>(0, r.getInt("mission.sightseeing.maxOffers", static_cast<std::int64_t>(m.maxSightseeingOffers))));
  m.flyByBaseReward = r.getInt("mission.flyBy.baseReward", m.flyByBaseReward);
  m.flyByRewardPerLy = r.getFloat("mission.flyBy.rewardPerLy", m.flyByRewardPerLy);
  m.contactSearchRadiusLy = r.getFloat("mission.contact.radiusLy", m.contactSearchRadiusLy);
  m.contactDistanceDecay = r.getFloat("mission.contact.decay", m.contactDistanceDecay);
  return m;
}

} // namespace orrery::sim
