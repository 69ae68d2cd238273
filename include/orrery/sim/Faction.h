#pragma once

#include "orrery/core/Types.h"
#include "orrery/proc/NameGenerator.h"

#include <cstddef>
#include <string>
#include <vector>

namespace orrery::sim {

struct Faction {
  core::u32 id = 0; // 1-based, 0 = none
  std::string name;
};

// Deterministic faction registry.
// Factions are generated purely from universeSeed + faction index, so they don't need persistence.
class FactionRegistry {
public:
  explicit FactionRegistry(core::u64 universeSeed, std::size_t factionCount = 4);

  std::size_t count() const { return factions_.size(); }
  const std::vector<Faction>& all() const { return factions_; }

  // nullptr for unknown ids.
  const Faction* find(core::u32 id) const;

  // Maps a system seed to its controlling faction id.
  core::u32 controllingFactionId(core::u64 systemSeed) const;

private:
  core::u64 seed_ = 0;
  std::vector<Faction> factions_;
};

} // namespace orrery::sim
