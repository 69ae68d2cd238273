#pragma once

#include "orrery/core/Types.h"
#include "orrery/proc/GalaxyGenerator.h"
#include "orrery/sim/Faction.h"
#include "orrery/sim/StarSystemModel.h"

#include <list>
#include <optional>
#include <unordered_map>

namespace orrery::sim {

// A streaming universe: star systems are generated on demand from their
// coordinates and kept in a small LRU cache. The cache never changes results.
// Not thread-safe; owned by the simulation thread.
class Universe {
public:
  explicit Universe(core::u64 seed, proc::GalaxyParams params = {});

  core::u64 seed() const { return galaxy_.seed(); }
  const proc::GalaxyParams& galaxyParams() const { return galaxy_.params(); }
  const proc::GalaxyGenerator& galaxy() const { return galaxy_; }
  const FactionRegistry& factions() const { return factions_; }

  bool isValid(const StarSystemCoordinates& coords) const { return galaxy_.isValid(coords); }

  math::Vec3d galacticPosition(const StarSystemCoordinates& coords) const {
    return galaxy_.galacticPosition(coords);
  }
  double distanceLy(const StarSystemCoordinates& a, const StarSystemCoordinates& b) const;

  std::vector<proc::NeighborSystem> neighbors(const StarSystemCoordinates& origin, double radiusLy) const {
    return galaxy_.neighbors(origin, radiusLy);
  }
  std::optional<proc::NeighborSystem> findNearestSystem(const math::Vec3d& posLy, double maxRadiusLy) const {
    return galaxy_.findNearestSystem(posLy, maxRadiusLy);
  }

  // Generate (or fetch cached) system model.
  // The reference stays valid until the next call that may generate a system.
  const StarSystemModel& systemModel(const StarSystemCoordinates& coords);

  std::optional<OrbitalObjectModel> findObjectModel(const UniverseObjectId& id);

  // For ids produced by the generator. A miss means the generator drifted and is fatal.
  OrbitalObjectModel objectModel(const UniverseObjectId& id);

  void setCacheCapacity(std::size_t systemCap);

  struct CacheStats {
    std::size_t capacity{0};
    std::size_t size{0};
    std::size_t hits{0};
    std::size_t misses{0};
    std::size_t puts{0};
    std::size_t evictions{0};
  };

  CacheStats cacheStats() const { return systemCache_.stats(); }
  void resetCacheStats() { systemCache_.resetStats(); }

private:
  template <class Key, class Value, class Hash = std::hash<Key>>
  class LruCache {
  public:
    explicit LruCache(std::size_t cap = 128) : cap_(cap ? cap : 1) {}

    void setCapacity(std::size_t cap) {
      cap_ = cap ? cap : 1;
      evictIfNeeded();
    }

    CacheStats stats() const {
      CacheStats s;
      s.capacity = cap_;
      s.size = map_.size();
      s.hits = hits_;
      s.misses = misses_;
      s.puts = puts_;
      s.evictions = evictions_;
      return s;
    }

    void resetStats() { hits_ = misses_ = puts_ = evictions_ = 0; }

    Value* get(const Key& key) {
      auto it = map_.find(key);
      if (it == map_.end()) {
        ++misses_;
        return nullptr;
      }
      ++hits_;
      touch(it);
      return &it->second.value;
    }

    Value& put(const Key& key, Value value) {
      ++puts_;
      auto it = map_.find(key);
      if (it != map_.end()) {
        it->second.value = std::move(value);
        touch(it);
        return it->second.value;
      }

      order_.push_front(key);
      Entry e;
      e.value = std::move(value);
      e.it = order_.begin();
      auto itIns = map_.emplace(key, std::move(e)).first;

      evictIfNeeded();
      return itIns->second.value;
    }

  private:
    struct Entry {
      Value value{};
      typename std::list<Key>::iterator it{};
    };

    void touch(typename std::unordered_map<Key, Entry, Hash>::iterator it) {
      order_.splice(order_.begin(), order_, it->second.it);
      it->second.it = order_.begin();
    }

    void evictIfNeeded() {
      while (map_.size() > cap_) {
        map_.erase(order_.back());
        order_.pop_back();
        ++evictions_;
      }
    }

    std::size_t cap_{128};
    std::list<Key> order_{};
    std::unordered_map<Key, Entry, Hash> map_{};

    std::size_t hits_{0};
    std::size_t misses_{0};
    std::size_t puts_{0};
    std::size_t evictions_{0};
  };

  proc::GalaxyGenerator galaxy_;
  FactionRegistry factions_;

  LruCache<StarSystemCoordinates, StarSystemModel, StarSystemCoordinatesHash> systemCache_{256};
};

} // namespace orrery::sim
