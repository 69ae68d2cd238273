#include "orrery/sim/Mission.h"

namespace orrery::sim {

std::string_view toString(MissionType type) {
  switch (type) {
    case MissionType::SightseeingFlyBy: return "sightseeing";
  }
  return "unknown";
}

Mission makeSightseeingMission(const UniverseObjectId& missionGiver, const UniverseObjectId& target, core::i64 reward) {
  Mission m;
  m.type = MissionType::SightseeingFlyBy;
  m.tree = makeFlyByNode(target);
  m.reward = reward;
  m.missionGiver = missionGiver;
  return m;
}

std::string describe(const Mission& m, Universe& universe) {
  return describe(m.tree, m.missionGiver.system, universe);
}

MissionRecord serialize(const Mission& m) {
  MissionRecord r;
  r.type = static_cast<int>(m.type);
  r.tree = serialize(m.tree);
  r.reward = m.reward;
  r.missionGiver = m.missionGiver;
  return r;
}

bool deserialize(const MissionRecord& record, Mission& out, std::string* outError) {
  if (record.type != static_cast<int>(MissionType::SightseeingFlyBy)) {
    if (outError) *outError = "unknown mission type " + std::to_string(record.type);
    return false;
  }

  Mission m;
  m.type = static_cast<MissionType>(record.type);
  if (!deserialize(record.tree, m.tree, outError)) return false;
  m.reward = record.reward;
  m.missionGiver = record.missionGiver;
  out = std::move(m);
  return true;
}

} // namespace orrery::sim
