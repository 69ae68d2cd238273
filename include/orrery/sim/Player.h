#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/Discovery.h"
#include "orrery/sim/Mission.h"

#include <string>
#include <vector>

namespace orrery::sim {

struct Player {
  std::string name{"Explorer"};
  core::i64 credits{0};

  std::vector<Mission> currentMissions;
  std::vector<Mission> completedMissions;

  std::vector<SpaceDiscovery> localDiscoveries;    // not uploaded yet
  std::vector<SpaceDiscovery> uploadedDiscoveries;
};

// True if an equal mission is current or completed.
bool hasMission(const Player& player, const Mission& mission);

// Adds to the current missions. Returns false for duplicates.
bool acceptMission(Player& player, Mission mission);

// Updates every current mission. Completed ones move to completedMissions and
// pay their reward. Returns the number of missions completed by this call.
std::size_t updateMissions(Player& player, const MissionContext& context);

void earn(Player& player, core::i64 amount);

// Records a discovery locally unless it is already known to the player.
bool addLocalDiscovery(Player& player, const SpaceDiscovery& discovery);

// Uploads localDiscoveries[index] to the encyclopaedia and pays its value.
// Returns false for an out-of-range index.
bool sellDiscovery(Player& player, std::size_t index, EncyclopaediaGalactica& encyclopaedia,
                   Universe& universe, core::i64* outValue = nullptr);

} // namespace orrery::sim
