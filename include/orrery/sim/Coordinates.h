#pragma once

#include "orrery/core/Types.h"
#include "orrery/sim/ObjectType.h"

#include <cstddef>
#include <string>
#include <tuple>

namespace orrery::sim {

struct SectorCoord {
  core::i32 x{0}, y{0}, z{0};

  bool operator==(const SectorCoord& o) const { return x==o.x && y==o.y && z==o.z; }
  bool operator!=(const SectorCoord& o) const { return !(*this == o); }
  bool operator<(const SectorCoord& o) const { return std::tie(x, y, z) < std::tie(o.x, o.y, o.z); }
};

// Address of a star system: the galaxy sector plus the index of the system
// inside that sector. Valid when localIndex < the sector's system count.
struct StarSystemCoordinates {
  SectorCoord sector{};
  core::u32 localIndex{0};

  bool operator==(const StarSystemCoordinates& o) const {
    return sector == o.sector && localIndex == o.localIndex;
  }
  bool operator!=(const StarSystemCoordinates& o) const { return !(*this == o); }
  bool operator<(const StarSystemCoordinates& o) const {
    if (sector != o.sector) return sector < o.sector;
    return localIndex < o.localIndex;
  }
};

// Path of an object inside its system: the n-th object of a given type,
// counted in generation order.
struct SystemObjectId {
  OrbitalObjectType type{OrbitalObjectType::Star};
  core::u32 index{0};

  bool operator==(const SystemObjectId& o) const { return type == o.type && index == o.index; }
  bool operator!=(const SystemObjectId& o) const { return !(*this == o); }
  bool operator<(const SystemObjectId& o) const {
    if (type != o.type) return type < o.type;
    return index < o.index;
  }
};

// Globally unique, regenerable reference to one orbital object.
struct UniverseObjectId {
  StarSystemCoordinates system{};
  SystemObjectId object{};

  bool operator==(const UniverseObjectId& o) const { return system == o.system && object == o.object; }
  bool operator!=(const UniverseObjectId& o) const { return !(*this == o); }
  bool operator<(const UniverseObjectId& o) const {
    if (system != o.system) return system < o.system;
    return object < o.object;
  }
};

inline bool equals(const StarSystemCoordinates& a, const StarSystemCoordinates& b) { return a == b; }
inline bool equals(const UniverseObjectId& a, const UniverseObjectId& b) { return a == b; }

struct SectorCoordHash {
  std::size_t operator()(const SectorCoord& c) const noexcept;
};

struct StarSystemCoordinatesHash {
  std::size_t operator()(const StarSystemCoordinates& c) const noexcept;
};

struct UniverseObjectIdHash {
  std::size_t operator()(const UniverseObjectId& id) const noexcept;
};

// "(x, y, z)#i"
std::string toString(const StarSystemCoordinates& c);
// "(x, y, z)#i/telluric planet:2"
std::string toString(const UniverseObjectId& id);

} // namespace orrery::sim
