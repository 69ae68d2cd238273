#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/Mission.h"
#include "orrery/sim/Player.h"
#include "orrery/sim/Universe.h"

#include <string>
#include <vector>

namespace orrery::sim {

constexpr core::i64 kMillisecondsPerHour = 3600000;

struct MissionBoardParams {
  // Sightseeing offers
  double sightseeingSearchRadiusLy{75.0};
  double sightseeingKeepChance{0.5};
  std::size_t maxSightseeingOffers{8};
  core::i64 flyByBaseReward{5000};
  double flyByRewardPerLy{400.0};

  // Contact stations
  double contactSearchRadiusLy{75.0};
  double contactDistanceDecay{0.02}; // k in 1 / (1 + k d^2)
};

// A facility in a neighbouring system that the current facility trades with.
struct ContactStation {
  UniverseObjectId facilityId{};
  std::string name;
  std::string systemName;
  double distanceLy{0.0};
};

struct MissionBoard {
  std::vector<Mission> sightseeing;
  std::vector<ContactStation> contacts;
};

// floor(timestampMs / 1h), also for timestamps before the epoch.
core::i64 hourBucket(core::i64 timestampMs);

// 1 / (1 + k d^2)
double contactKeepProbability(double distanceLy, double decay);

// Fly-by offers towards black holes, neutron stars and anomalies around the
// facility. Identical for every call within the same hour; missions the
// player already has (current or completed) are never offered again.
std::vector<Mission> generateSightseeingMissions(Universe& universe, const UniverseObjectId& facilityId,
                                                 const Player& player, core::i64 timestampMs,
                                                 const MissionBoardParams& params = {});

// Same-faction facilities in neighbouring systems, thinned out with distance.
// Sorted by ascending distance.
std::vector<ContactStation> findContactStations(Universe& universe, const UniverseObjectId& facilityId,
                                                const MissionBoardParams& params = {});

MissionBoard generateMissionBoard(Universe& universe, const UniverseObjectId& facilityId,
                                  const Player& player, core::i64 timestampMs,
                                  const MissionBoardParams& params = {});

// "Arbelia Station Beta in Arbelia (12.30 ly)"
std::string describe(const ContactStation& contact);

} // namespace orrery::sim
