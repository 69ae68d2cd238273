#include "orrery/sim/Coordinates.h"
#include "orrery/sim/Orbit.h"
#include "orrery/sim/Units.h"

#include "test_harness.h"

#include <cmath>
#include <set>
#include <unordered_set>

using namespace orrery;

int test_coordinates() {
  int failures = 0;

  const sim::StarSystemCoordinates a{{1, -2, 3}, 0};
  const sim::StarSystemCoordinates b{{1, -2, 3}, 1};
  const sim::StarSystemCoordinates c{{1, -2, 4}, 0};

  // Equality / ordering
  CHECK((a == sim::StarSystemCoordinates{{1, -2, 3}, 0}));
  CHECK(sim::equals(a, a));
  CHECK(!sim::equals(a, b));
  CHECK(a != c);
  CHECK(a < b);
  CHECK(b < c);
  CHECK(!(c < a));

  const sim::UniverseObjectId p2{a, {sim::OrbitalObjectType::TelluricPlanet, 2}};
  const sim::UniverseObjectId p3{a, {sim::OrbitalObjectType::TelluricPlanet, 3}};
  const sim::UniverseObjectId g2{a, {sim::OrbitalObjectType::GasPlanet, 2}};
  const sim::UniverseObjectId p2b{b, {sim::OrbitalObjectType::TelluricPlanet, 2}};
  CHECK(sim::equals(p2, sim::UniverseObjectId{a, {sim::OrbitalObjectType::TelluricPlanet, 2}}));
  CHECK(!sim::equals(p2, p3));
  CHECK(!sim::equals(p2, g2)); // same index, other type
  CHECK(!sim::equals(p2, p2b)); // same path, other system

  // Hash-based containers agree with equality.
  {
    std::unordered_set<sim::StarSystemCoordinates, sim::StarSystemCoordinatesHash> set;
    set.insert(a);
    set.insert(b);
    set.insert(a);
    CHECK(set.size() == 2);
    CHECK(sim::StarSystemCoordinatesHash{}(a) == sim::StarSystemCoordinatesHash{}(sim::StarSystemCoordinates{{1, -2, 3}, 0}));
    CHECK(sim::StarSystemCoordinatesHash{}(a) != sim::StarSystemCoordinatesHash{}(b));

    std::unordered_set<sim::UniverseObjectId, sim::UniverseObjectIdHash> ids{p2, p3, g2, p2b, p2};
    CHECK(ids.size() == 4);

    std::set<sim::UniverseObjectId> ordered{p2, p3, g2, p2b};
    CHECK(ordered.size() == 4);
    CHECK(*ordered.begin() == p2);
  }

  // Text forms
  CHECK(sim::toString(a) == "(1, -2, 3)#0");
  CHECK(sim::toString(p2) == "(1, -2, 3)#0/telluric planet:2");
  CHECK(sim::toString(sim::OrbitalObjectType::BlackHole) == "black hole");
  CHECK(sim::toString(sim::OrbitalObjectType::SpaceElevator) == "space elevator");

  // Type validation for external data
  {
    sim::OrbitalObjectType t = sim::OrbitalObjectType::Star;
    CHECK(sim::orbitalObjectTypeFromInt(2, t) && t == sim::OrbitalObjectType::BlackHole);
    CHECK(sim::orbitalObjectTypeFromInt(sim::kOrbitalObjectTypeCount - 1, t));
    CHECK(!sim::orbitalObjectTypeFromInt(sim::kOrbitalObjectTypeCount, t));
    CHECK(!sim::orbitalObjectTypeFromInt(-1, t));
  }

  CHECK(sim::isStellarObject(sim::OrbitalObjectType::NeutronStar));
  CHECK(!sim::isStellarObject(sim::OrbitalObjectType::GasPlanet));
  CHECK(sim::isAnomaly(sim::OrbitalObjectType::JuliaSet));
  CHECK(sim::isOrbitalFacility(sim::OrbitalObjectType::SpaceStation));
  CHECK(!sim::isOrbitalFacility(sim::OrbitalObjectType::Star));

  // Distances
  CHECK(sim::formatDistance(0.25) == "250 m");
  CHECK(sim::formatDistance(1500.0) == "1500 km");
  CHECK(sim::formatDistance(2.0 * sim::kAU_KM) == "2.00 AU");
  CHECK(sim::formatDistance(sim::lyToKm(12.3)) == "12.30 ly");
  CHECK(std::abs(sim::kmToLy(sim::lyToKm(4.2)) - 4.2) < 1e-12);

  // Orbits: one full period returns to the start; a frozen orbit never moves.
  {
    sim::OrbitElements el;
    el.semiMajorAxisKm = sim::kAU_KM;
    el.eccentricity = 0.2;
    el.inclinationRad = 0.1;
    el.periodSeconds = sim::orbitalPeriodSeconds(el.semiMajorAxisKm, sim::kSolarMassKg);

    // About one year around a solar mass.
    CHECK(std::abs(el.periodSeconds / (365.25 * sim::kSecondsPerDay) - 1.0) < 0.01);

    const auto p0 = orrery::sim::orbitPosition3DKm(el, 0.0);
    const auto p1 = orrery::sim::orbitPosition3DKm(el, el.periodSeconds);
    CHECK(math::distance(p0, p1) < 1.0);

    // Periapsis at epoch.
    CHECK(std::abs(p0.length() - el.semiMajorAxisKm * (1.0 - el.eccentricity)) < 1.0);

    sim::OrbitElements frozen = el;
    frozen.periodSeconds = 0.0;
    CHECK(math::distance(sim::orbitPosition3DKm(frozen, 0.0), sim::orbitPosition3DKm(frozen, 1.0e7)) < 1e-6);

    CHECK(sim::orbitalPeriodSeconds(0.0, sim::kSolarMassKg) == 0.0);
    CHECK(sim::orbitPosition3DKm(sim::OrbitElements{}, 100.0).length() == 0.0);
  }

  return failures;
}
