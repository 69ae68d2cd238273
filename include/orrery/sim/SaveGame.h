#pragma once

#include "orrery/core/Types.h"
#include "orrery/math/Vec3.h"
#include "orrery/sim/Coordinates.h"
#include "orrery/sim/Discovery.h"
#include "orrery/sim/Mission.h"
#include "orrery/sim/Player.h"
#include "orrery/sim/Universe.h"

#include <iosfwd>
#include <string>
#include <vector>

namespace orrery::sim {

// Everything persisted between sessions. Systems are regenerated from the seed,
// so only coordinates and ids are stored.
struct SaveGame {
  int version{1};

  core::u64 seed{0};
  double timeSeconds{0.0};

  StarSystemCoordinates currentSystem{};
  math::Vec3d playerPositionKm{};

  std::string playerName;
  core::i64 credits{0};

  std::vector<MissionRecord> currentMissions;
  std::vector<MissionRecord> completedMissions;

  std::vector<SpaceDiscovery> localDiscoveries;
  std::vector<SpaceDiscovery> uploadedDiscoveries;
};

SaveGame makeSaveGame(const Player& player, core::u64 seed, const StarSystemCoordinates& currentSystem,
                      const math::Vec3d& playerPositionKm, double timeSeconds);

// Rebuilds the player against `universe`. Fails (leaving `out` untouched) if the
// save was written for another seed, a mission record is malformed, or a mission
// target, mission giver or discovery names an object the universe does not have.
bool restorePlayer(const SaveGame& save, Universe& universe, Player& out, std::string* outError = nullptr);

bool saveToStream(const SaveGame& s, std::ostream& out);
bool loadFromStream(std::istream& in, SaveGame& out, std::string* outError = nullptr);

bool saveToFile(const SaveGame& s, const std::string& path);
bool loadFromFile(const std::string& path, SaveGame& out, std::string* outError = nullptr);

} // namespace orrery::sim
