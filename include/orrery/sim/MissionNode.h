#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/Coordinates.h"
#include "orrery/sim/MissionContext.h"

#include <string>
#include <string_view>
#include <vector>

namespace orrery::sim {

// Values are persisted in save games.
enum class MissionNodeType : core::u8 {
  FlyBy    = 0,
  And      = 1,
  Or       = 2,
  Xor      = 3,
  Sequence = 4,
};

enum class FlyByState : core::u8 {
  NotInSystem    = 0,
  TooFarInSystem = 1,
  CloseEnough    = 2,
};

std::string_view toString(MissionNodeType type);
std::string_view toString(FlyByState state);

// One node of a mission tree.
//
// FlyBy nodes use `objectId` and `flyByState`. Logic nodes own `children`;
// Sequence nodes additionally track the index of the child in progress
// (== children.size() once every step is done).
struct MissionNode {
  MissionNodeType type{MissionNodeType::FlyBy};

  UniverseObjectId objectId{};
  FlyByState flyByState{FlyByState::NotInSystem};

  std::vector<MissionNode> children;
  core::u32 activeChild{0};
};

MissionNode makeFlyByNode(const UniverseObjectId& target);

// `type` must be a logic type and `children` non-empty.
MissionNode makeLogicNode(MissionNodeType type, std::vector<MissionNode> children);

// How many bounding radii count as "close enough" for a fly-by of `type`.
double flyByThresholdMultiplier(OrbitalObjectType type);

bool isCompleted(const MissionNode& node);

// Advances the node from the player's situation. No-op once completed.
void updateState(MissionNode& node, const MissionContext& context);

// Same shape and targets; progress is ignored.
bool equals(const MissionNode& a, const MissionNode& b);

// One-line summary as seen from `origin`, e.g. "Fly by black hole in Arbelia (12.30 ly)".
std::string describe(const MissionNode& node, const StarSystemCoordinates& origin, Universe& universe);

// What the player should do next.
std::string describeNextTask(const MissionNode& node, const MissionContext& context,
                             const InputBindingLabels& bindings);

// Systems the player has to visit, without duplicates, in tree order.
std::vector<StarSystemCoordinates> getTargetSystems(const MissionNode& node);

// Persisted form. `state` holds the FlyByState for fly-bys and the active
// child index for sequences.
struct MissionNodeRecord {
  int type{0};
  std::vector<MissionNodeRecord> children;
  UniverseObjectId objectId{};
  int state{0};
};

MissionNodeRecord serialize(const MissionNode& node);

// Rejects unknown types, out-of-range states and malformed trees.
bool deserialize(const MissionNodeRecord& record, MissionNode& out, std::string* outError = nullptr);

} // namespace orrery::sim
