#include "orrery/sim/Player.h"

#include "orrery/core/Log.h"

#include <algorithm>

namespace orrery::sim {

bool hasMission(const Player& player, const Mission& mission) {
  auto same = [&](const Mission& m) { return equals(m, mission); };
  return std::any_of(player.currentMissions.begin(), player.currentMissions.end(), same) ||
         std::any_of(player.completedMissions.begin(), player.completedMissions.end(), same);
}

bool acceptMission(Player& player, Mission mission) {
  if (hasMission(player, mission)) return false;
  player.currentMissions.push_back(std::move(mission));
  return true;
}

std::size_t updateMissions(Player& player, const MissionContext& context) {
  std::size_t completed = 0;
  for (auto it = player.currentMissions.begin(); it != player.currentMissions.end();) {
    updateState(*it, context);
    if (!isCompleted(*it)) {
      ++it;
      continue;
    }

    earn(player, it->reward);
    ORRERY_LOG_INFO("Mission completed: +" + std::to_string(it->reward) + " credits");
    player.completedMissions.push_back(std::move(*it));
    it = player.currentMissions.erase(it);
    ++completed;
  }
  return completed;
}

void earn(Player& player, core::i64 amount) {
  player.credits += amount;
}

bool addLocalDiscovery(Player& player, const SpaceDiscovery& discovery) {
  auto same = [&](const SpaceDiscovery& d) { return d.objectId == discovery.objectId; };
  if (std::any_of(player.localDiscoveries.begin(), player.localDiscoveries.end(), same) ||
      std::any_of(player.uploadedDiscoveries.begin(), player.uploadedDiscoveries.end(), same)) {
    return false;
  }
  player.localDiscoveries.push_back(discovery);
  return true;
}

bool sellDiscovery(Player& player, std::size_t index, EncyclopaediaGalactica& encyclopaedia,
                   Universe& universe, core::i64* outValue) {
  if (index >= player.localDiscoveries.size()) return false;

  SpaceDiscovery d = player.localDiscoveries[index];
  const core::i64 value = encyclopaedia.estimateDiscovery(d.objectId, universe);
  if (!encyclopaedia.contributeDiscoveryIfNew(d)) {
    ORRERY_LOG_DEBUG("Discovery already known: " + toString(d.objectId));
  }
  earn(player, value);

  player.localDiscoveries.erase(player.localDiscoveries.begin() + static_cast<std::ptrdiff_t>(index));
  player.uploadedDiscoveries.push_back(std::move(d));

  if (outValue) *outValue = value;
  return true;
}

} // namespace orrery::sim
