#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/MissionNode.h"

#include <string>
#include <string_view>
#include <vector>

namespace orrery::sim {

enum class MissionType : core::u8 {
  SightseeingFlyBy = 0,
};

std::string_view toString(MissionType type);

// A mission offered by (and accepted at) an orbital facility.
struct Mission {
  MissionType type{MissionType::SightseeingFlyBy};
  MissionNode tree{};
  core::i64 reward{0}; // credits
  UniverseObjectId missionGiver{};
};

Mission makeSightseeingMission(const UniverseObjectId& missionGiver, const UniverseObjectId& target, core::i64 reward);

inline bool isCompleted(const Mission& m) { return isCompleted(m.tree); }
inline void updateState(Mission& m, const MissionContext& context) { updateState(m.tree, context); }

// Two missions are the same offer when their trees match.
inline bool equals(const Mission& a, const Mission& b) { return equals(a.tree, b.tree); }

// Described from the giver's system.
std::string describe(const Mission& m, Universe& universe);

inline std::string describeNextTask(const Mission& m, const MissionContext& context,
                                    const InputBindingLabels& bindings) {
  return describeNextTask(m.tree, context, bindings);
}

inline std::vector<StarSystemCoordinates> getTargetSystems(const Mission& m) { return getTargetSystems(m.tree); }

struct MissionRecord {
  int type{0};
  MissionNodeRecord tree{};
  core::i64 reward{0};
  UniverseObjectId missionGiver{};
};

MissionRecord serialize(const Mission& m);
bool deserialize(const MissionRecord& record, Mission& out, std::string* outError = nullptr);

} // namespace orrery::sim
