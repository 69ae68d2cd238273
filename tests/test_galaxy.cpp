#include "orrery/proc/GalaxyGenerator.h"
#include "orrery/sim/Faction.h"

#include "test_harness.h"

#include <cmath>
#include <limits>
#include <set>

using namespace orrery;

int test_galaxy() {
  int failures = 0;

  const proc::GalaxyGenerator galaxy(42, proc::GalaxyParams{});
  const proc::GalaxyGenerator same(42, proc::GalaxyParams{});
  const proc::GalaxyGenerator other(43, proc::GalaxyParams{});

  const math::Vec3d centre{0, 0, 0};
  const auto around = galaxy.querySphere(centre, 40.0);
  CHECK(!around.empty());

  // Pure functions of (seed, params, coordinates).
  for (const auto& n : around) {
    CHECK(galaxy.isValid(n.coordinates));
    CHECK(same.systemSeed(n.coordinates) == galaxy.systemSeed(n.coordinates));
    CHECK(same.galacticPosition(n.coordinates) == n.positionLy);

    // Position always lies inside its own sector.
    CHECK(galaxy.sectorOf(n.positionLy) == n.coordinates.sector);
  }

  // Another seed gives another galaxy.
  {
    bool anyDifferent = false;
    for (const auto& n : around) {
      if (other.systemSeed(n.coordinates) != galaxy.systemSeed(n.coordinates)) anyDifferent = true;
    }
    CHECK(anyDifferent);
  }

  // Density falls off radially and vertically, and stops at the disc edge.
  {
    const double atCentre = galaxy.meanSystemsInSector({0, 0, 0});
    CHECK(atCentre > 0.4);
    CHECK(galaxy.meanSystemsInSector({1000, 0, 0}) < atCentre);
    CHECK(galaxy.meanSystemsInSector({0, 0, -2000}) < galaxy.meanSystemsInSector({0, 0, -1000}));
    CHECK(galaxy.meanSystemsInSector({0, 30, 0}) < atCentre);
    CHECK(galaxy.meanSystemsInSector({0, -30, 0}) < atCentre);
    CHECK(galaxy.meanSystemsInSector({6000, 0, 0}) == 0.0);
    CHECK(galaxy.systemCountInSector({6000, 0, 0}) == 0);
    CHECK(!galaxy.isValid(sim::StarSystemCoordinates{{6000, 0, 0}, 0}));
    CHECK(galaxy.meanSystemsInSector({0, 6000, 0}) == 0.0);
  }

  // Far-away positions clamp to the i32 sector range and queries stay inside the galaxy.
  {
    const sim::SectorCoord far = galaxy.sectorOf(math::Vec3d{1e12, -1e12, 0.0});
    CHECK(far.x == std::numeric_limits<core::i32>::max());
    CHECK(far.y == std::numeric_limits<core::i32>::min());
    CHECK(far.z == 0);
    CHECK((galaxy.sectorOf(math::Vec3d{std::nan(""), 15.0, -15.0}) == sim::SectorCoord{0, 1, -2}));

    CHECK(galaxy.populatedSectorLimit() == 5001);
    CHECK(galaxy.querySphere(math::Vec3d{1e12, 0.0, 0.0}, 1e6).empty());
    CHECK(galaxy.querySphere(math::Vec3d{0.0, 1e9, 0.0}, 100.0).empty());
    CHECK(!galaxy.findNearestSystem(math::Vec3d{-1e15, 1e15, 1e15}, 1000.0).has_value());
  }

  // Counts respect the cap and define validity.
  {
    proc::GalaxyParams dense;
    dense.baseMeanSystemsPerSector = 100.0;
    dense.maxSystemsPerSector = 3;
    const proc::GalaxyGenerator packed(7, dense);
    CHECK(packed.systemCountInSector({0, 0, 0}) == 3);
    CHECK(packed.isValid(sim::StarSystemCoordinates{{0, 0, 0}, 2}));
    CHECK(!packed.isValid(sim::StarSystemCoordinates{{0, 0, 0}, 3}));
  }

  // querySphere: sorted, within radius, no duplicates.
  {
    std::set<sim::StarSystemCoordinates> seen;
    for (std::size_t i = 0; i < around.size(); ++i) {
      CHECK(around[i].distanceLy <= 40.0);
      if (i > 0) CHECK(around[i - 1].distanceLy <= around[i].distanceLy);
      CHECK(seen.insert(around[i].coordinates).second);
    }
  }

  // neighbors(): origin excluded, distances measured from the origin.
  {
    const auto origin = around.front().coordinates;
    const auto originPos = galaxy.galacticPosition(origin);
    const auto near = galaxy.neighbors(origin, 25.0);
    CHECK(!near.empty());
    for (const auto& n : near) {
      CHECK(n.coordinates != origin);
      CHECK(n.distanceLy <= 25.0);
      CHECK(std::abs(n.distanceLy - math::distance(originPos, n.positionLy)) < 1e-9);
    }
    CHECK(near.size() + 1 == galaxy.querySphere(originPos, 25.0).size());
  }

  // findNearestSystem agrees with a brute-force sphere query.
  {
    const math::Vec3d queryPos{123.0, 4.0, -77.0};
    const auto nearest = galaxy.findNearestSystem(queryPos, 60.0);
    const auto all = galaxy.querySphere(queryPos, 60.0);
    CHECK(nearest.has_value() == !all.empty());
    if (nearest && !all.empty()) CHECK(nearest->coordinates == all.front().coordinates);

    // Nothing outside the disc.
    CHECK(!galaxy.findNearestSystem(math::Vec3d{90000.0, 0.0, 0.0}, 30.0).has_value());
  }

  // Factions: 1-based, deterministic, every system controlled by a known one.
  {
    const sim::FactionRegistry factions(42, 4);
    const sim::FactionRegistry again(42, 4);
    CHECK(factions.count() == 4);
    CHECK(factions.find(0) == nullptr);
    CHECK(factions.find(5) == nullptr);
    CHECK(factions.find(1) != nullptr && factions.find(1)->id == 1);
    for (std::size_t i = 0; i < factions.count(); ++i) {
      CHECK(!factions.all()[i].name.empty());
      CHECK(factions.all()[i].name == again.all()[i].name);
    }
    for (const auto& n : around) {
      const auto f = factions.controllingFactionId(galaxy.systemSeed(n.coordinates));
      CHECK(f >= 1 && f <= 4);
    }
  }

  return failures;
}
