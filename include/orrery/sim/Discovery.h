#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/Coordinates.h"

#include <map>
#include <string>

namespace orrery::sim {

class Universe;

struct SpaceDiscovery {
  UniverseObjectId objectId{};
  core::i64 discoveryTimestampMs{0};
  std::string explorerName;
};

// Credits paid for a first discovery of `type`.
core::i64 discoveryBaseValue(OrbitalObjectType type);

// Registry of discoveries uploaded by every explorer. The first contributor
// of an object keeps the credit.
class EncyclopaediaGalactica {
public:
  // Returns false when the object was already known.
  bool contributeDiscoveryIfNew(const SpaceDiscovery& discovery);

  bool hasObjectBeenDiscovered(const UniverseObjectId& id) const;

  // nullptr if unknown.
  const SpaceDiscovery* find(const UniverseObjectId& id) const;

  // Value in credits: the type's base value with a small per-object variation,
  // halved if the object is already in the registry.
  core::i64 estimateDiscovery(const UniverseObjectId& id, Universe& universe) const;

  std::size_t size() const { return entries_.size(); }

private:
  std::map<UniverseObjectId, SpaceDiscovery> entries_;
};

} // namespace orrery::sim
