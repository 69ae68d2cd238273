#include "orrery/sim/MissionBoard.h"

#include "orrery/core/Log.h"
#include "orrery/core/Random.h"
#include "orrery/math/Math.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <cmath>

namespace orrery::sim {

namespace {

// Salt of the first contact-station draw.
constexpr core::u64 kContactDrawOffset = 325;

bool isSightseeingTarget(OrbitalObjectType t) {
  return t == OrbitalObjectType::BlackHole || t == OrbitalObjectType::NeutronStar || isAnomaly(t);
}

// The giver must be a generated facility; anything else is a caller bug.
bool lookupFacility(Universe& universe, const UniverseObjectId& facilityId, OrbitalObjectModel& out) {
  out = universe.objectModel(facilityId);
  if (!isOrbitalFacility(out.type())) {
    ORRERY_LOG_WARN("Mission board requested for a non-facility object: " + toString(facilityId));
    return false;
  }
  return true;
}

} // namespace

core::i64 hourBucket(core::i64 timestampMs) {
  return math::floorDiv(timestampMs, kMillisecondsPerHour);
}

double contactKeepProbability(double distanceLy, double decay) {
  return 1.0 / (1.0 + decay * distanceLy * distanceLy);
}

std::vector<Mission> generateSightseeingMissions(Universe& universe, const UniverseObjectId& facilityId,
                                                 const Player& player, core::i64 timestampMs,
                                                 const MissionBoardParams& params) {
  std::vector<Mission> out;

  OrbitalObjectModel facility;
  if (!lookupFacility(universe, facilityId, facility)) return out;

  const core::u64 drawSeed = core::hashCombine(facility.seed, static_cast<core::u64>(hourBucket(timestampMs)));
  const auto neighbors = universe.neighbors(facilityId.system, params.sightseeingSearchRadiusLy);

  core::u64 candidateIndex = 0;
  for (const auto& n : neighbors) {
    if (out.size() >= params.maxSightseeingOffers) break;

    const StarSystemModel& system = universe.systemModel(n.coordinates);
    for (const auto& obj : system.objects) {
      if (!isSightseeingTarget(obj.type())) continue;

      const core::u64 index = candidateIndex++;
      if (core::uniformDraw(drawSeed, index) >= params.sightseeingKeepChance) continue;

      const core::i64 reward = params.flyByBaseReward +
                               static_cast<core::i64>(std::llround(params.flyByRewardPerLy * n.distanceLy));
      Mission m = makeSightseeingMission(facilityId, UniverseObjectId{n.coordinates, obj.id}, reward);
      if (hasMission(player, m)) continue;

      out.push_back(std::move(m));
      if (out.size() >= params.maxSightseeingOffers) break;
    }
  }

  return out;
}

std::vector<ContactStation> findContactStations(Universe& universe, const UniverseObjectId& facilityId,
                                                const MissionBoardParams& params) {
  std::vector<ContactStation> out;

  OrbitalObjectModel facility;
  if (!lookupFacility(universe, facilityId, facility)) return out;

  const auto neighbors = universe.neighbors(facilityId.system, params.contactSearchRadiusLy);

  core::u64 candidateIndex = 0;
  for (const auto& n : neighbors) {
    const StarSystemModel& system = universe.systemModel(n.coordinates);
    for (const OrbitalObjectModel* other : orbitalFacilities(system)) {
      const core::u64 index = kContactDrawOffset + candidateIndex++;
      const double p = contactKeepProbability(n.distanceLy, params.contactDistanceDecay);
      if (core::uniformDraw(facility.seed, index) >= p) continue;
      if (other->factionId != facility.factionId) continue;

      out.push_back(ContactStation{UniverseObjectId{n.coordinates, other->id}, other->name, system.name, n.distanceLy});
    }
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const ContactStation& a, const ContactStation& b) { return a.distanceLy < b.distanceLy; });
  return out;
}

MissionBoard generateMissionBoard(Universe& universe, const UniverseObjectId& facilityId,
                                  const Player& player, core::i64 timestampMs,
                                  const MissionBoardParams& params) {
  MissionBoard board;
  board.sightseeing = generateSightseeingMissions(universe, facilityId, player, timestampMs, params);
  board.contacts = findContactStations(universe, facilityId, params);
  return board;
}

std::string describe(const ContactStation& contact) {
  return contact.name + " in " + contact.systemName + " (" + formatDistance(lyToKm(contact.distanceLy)) + ")";
}

} // namespace orrery::sim
