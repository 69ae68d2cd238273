#include "orrery/core/Log.h"
#include "orrery/proc/SystemGenerator.h"
#include "orrery/sim/Signature.h"
#include "orrery/sim/Universe.h"

#include "test_worlds.h"

#include <iostream>

int test_universe_cache() {
  int fails = 0;

  // Keep unit-test output clean even if a fallback path logs a warning.
  orrery::core::setLogLevel(orrery::core::LogLevel::Off);

  using orrery_test::kSeed;

  // ---------------------------------------------------------------------------
  // Cache capacity is clamped to at least 1 (systemModel returns references).
  // ---------------------------------------------------------------------------
  {
    orrery::sim::Universe u(kSeed);
    u.setCacheCapacity(0);
    if (u.cacheStats().capacity < 1) {
      std::cerr << "[test_universe_cache] cache capacity not clamped\n";
      ++fails;
    }
  }

  // ---------------------------------------------------------------------------
  // Deterministic hit/miss/eviction behaviour.
  // ---------------------------------------------------------------------------
  {
    orrery::sim::Universe u(kSeed);
    const auto systems = orrery_test::systemsNearCentre(u);
    if (systems.size() < 3) {
      std::cerr << "[test_universe_cache] expected at least 3 systems near the centre\n";
      return fails + 1;
    }

    u.setCacheCapacity(2);
    u.resetCacheStats();

    (void)u.systemModel(systems[0]);
    (void)u.systemModel(systems[0]); // hit
    (void)u.systemModel(systems[1]);
    (void)u.systemModel(systems[2]); // evicts systems[0]

    const auto s = u.cacheStats();
    if (s.capacity != 2 || s.size != 2) {
      std::cerr << "[test_universe_cache] cache size/cap mismatch size=" << s.size << " cap=" << s.capacity << "\n";
      ++fails;
    }
    if (s.hits != 1 || s.misses != 3 || s.puts != 3 || s.evictions != 1) {
      std::cerr << "[test_universe_cache] unexpected cache stats (hits=" << s.hits << " misses=" << s.misses
                << " puts=" << s.puts << " evictions=" << s.evictions << ")\n";
      ++fails;
    }

    // Least recently used entry is gone, the newest two are still cached.
    u.resetCacheStats();
    (void)u.systemModel(systems[2]);
    (void)u.systemModel(systems[1]);
    (void)u.systemModel(systems[0]);
    const auto s2 = u.cacheStats();
    if (s2.hits != 2 || s2.misses != 1) {
      std::cerr << "[test_universe_cache] expected LRU eviction of the oldest system\n";
      ++fails;
    }
  }

  // ---------------------------------------------------------------------------
  // The cache never changes results.
  // ---------------------------------------------------------------------------
  {
    orrery::sim::Universe cached(kSeed);
    orrery::sim::Universe tiny(kSeed);
    tiny.setCacheCapacity(1);

    for (const auto& c : orrery_test::systemsNearCentre(cached, 25.0)) {
      const auto direct = orrery::proc::generateSystemModel(cached.galaxy(), cached.factions(), c);
      const auto sigDirect = orrery::sim::signatureSystemModel(direct);
      const auto sigCached = orrery::sim::signatureSystemModel(cached.systemModel(c));
      const auto sigCachedAgain = orrery::sim::signatureSystemModel(cached.systemModel(c));
      const auto sigTiny = orrery::sim::signatureSystemModel(tiny.systemModel(c));
      if (sigDirect != sigCached || sigCached != sigCachedAgain || sigCached != sigTiny) {
        std::cerr << "[test_universe_cache] cached system differs from direct generation at "
                  << orrery::sim::toString(c) << "\n";
        ++fails;
      }
    }
  }

  // ---------------------------------------------------------------------------
  // Object lookups and distances.
  // ---------------------------------------------------------------------------
  {
    orrery::sim::Universe u(kSeed);
    const auto systems = orrery_test::systemsNearCentre(u);
    const auto& a = systems.front();
    const auto& b = systems.back();

    const auto& model = u.systemModel(a);
    const orrery::sim::UniverseObjectId realPrimary{a, model.objects.front().id};

    const auto found = u.findObjectModel(realPrimary);
    if (!found || found->name != model.name) {
      std::cerr << "[test_universe_cache] expected the primary to resolve\n";
      ++fails;
    }
    if (u.objectModel(realPrimary).seed != model.objects.front().seed) {
      std::cerr << "[test_universe_cache] objectModel mismatch\n";
      ++fails;
    }

    const orrery::sim::UniverseObjectId missing{a, {orrery::sim::OrbitalObjectType::GasPlanet, 1000}};
    if (u.findObjectModel(missing).has_value()) {
      std::cerr << "[test_universe_cache] expected nullopt for an unknown object path\n";
      ++fails;
    }

    if (u.distanceLy(a, a) != 0.0) {
      std::cerr << "[test_universe_cache] distance to self must be 0\n";
      ++fails;
    }
    const double ab = u.distanceLy(a, b);
    if (ab <= 0.0 || ab != u.distanceLy(b, a)) {
      std::cerr << "[test_universe_cache] distance must be positive and symmetric\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_universe_cache] pass\n";
  return fails;
}
