#include "orrery/proc/GalaxyGenerator.h"
#include "orrery/proc/SystemGenerator.h"
#include "orrery/sim/Faction.h"
#include "orrery/sim/Signature.h"
#include "orrery/sim/StarSystem.h"

#include "test_harness.h"

#include <array>
#include <cmath>

using namespace orrery;

int test_system_generator() {
  int failures = 0;

  const proc::GalaxyGenerator galaxy(42, proc::GalaxyParams{});
  const sim::FactionRegistry factions(42, 4);

  const auto systems = galaxy.querySphere(math::Vec3d{0, 0, 0}, 40.0);
  CHECK(systems.size() > 10);

  std::size_t withFacilities = 0;

  for (const auto& n : systems) {
    const auto sys = proc::generateSystemModel(galaxy, factions, n.coordinates);
    const auto again = proc::generateSystemModel(galaxy, factions, n.coordinates);

    // Determinism: same coordinates, same system, down to the last orbit element.
    CHECK(sim::signatureSystemModel(sys) == sim::signatureSystemModel(again));

    CHECK(sys.coordinates == n.coordinates);
    CHECK(sys.seed == galaxy.systemSeed(n.coordinates));
    CHECK(sys.galacticPositionLy == n.positionLy);
    CHECK(!sys.name.empty());
    CHECK(factions.find(sys.factionId) != nullptr);

    CHECK(!sys.objects.empty());
    if (sys.objects.empty()) continue;

    const auto& primary = sys.objects.front();
    CHECK(sim::isStellarObject(primary.type()));
    CHECK(primary.id.index == 0);
    CHECK(primary.parentIndex == -1);
    CHECK(primary.name == sys.name);
    CHECK(primary.radiusKm > 0.0);

    std::array<core::u32, sim::kOrbitalObjectTypeCount> nextIndex{};
    std::size_t planets = 0;

    for (std::size_t i = 0; i < sys.objects.size(); ++i) {
      const auto& o = sys.objects[i];
      const auto t = static_cast<std::size_t>(o.type());

      // Per-type indices are dense and in generation order.
      CHECK(o.id.index == nextIndex[t]);
      ++nextIndex[t];

      CHECK(sim::findObjectIndex(sys, o.id) == static_cast<int>(i));
      CHECK(!o.name.empty());

      if (i > 0) {
        // Parents always precede their children.
        CHECK(o.parentIndex >= 0 && o.parentIndex < static_cast<int>(i));
      }

      // Only facilities carry a faction, and it is the system's.
      if (sim::isOrbitalFacility(o.type())) {
        CHECK(o.factionId == sys.factionId);
      } else {
        CHECK(o.factionId == 0);
      }

      if (o.parentIndex < 0) continue;
      const auto parentType = sys.objects[static_cast<std::size_t>(o.parentIndex)].type();

      switch (o.type()) {
        case sim::OrbitalObjectType::TelluricPlanet:
        case sim::OrbitalObjectType::GasPlanet:
          ++planets;
          CHECK(o.parentIndex == 0);
          break;
        case sim::OrbitalObjectType::TelluricSatellite:
          CHECK(parentType == sim::OrbitalObjectType::TelluricPlanet || parentType == sim::OrbitalObjectType::GasPlanet);
          break;
        case sim::OrbitalObjectType::SpaceElevator:
          CHECK(parentType == sim::OrbitalObjectType::TelluricPlanet);
          break;
        case sim::OrbitalObjectType::SpaceStation:
          CHECK(parentType != sim::OrbitalObjectType::TelluricSatellite);
          break;
        default:
          break;
      }
    }

    CHECK(planets <= 9);

    const auto facilities = sim::orbitalFacilities(sys);
    if (primary.type() != sim::OrbitalObjectType::Star) {
      CHECK(facilities.empty());
      CHECK(planets <= 3);
    }
    if (!facilities.empty()) ++withFacilities;

    CHECK(sim::countObjects(sys, sim::OrbitalObjectType::SpaceStation) ==
          sim::objectsOfType(sys, sim::OrbitalObjectType::SpaceStation).size());

    // Path lookups miss cleanly.
    CHECK(sim::findObject(sys, sim::SystemObjectId{sim::OrbitalObjectType::GasPlanet, 999}) == nullptr);
    CHECK(sim::findObjectIndex(sys, sim::SystemObjectId{sim::OrbitalObjectType::JuliaSet, 999}) == -1);
  }

  // The neighbourhood of the centre has stations somewhere.
  CHECK(withFacilities > 0);

  // Live system: objects placed along their orbits, primary at the origin.
  {
    const auto model = proc::generateSystemModel(galaxy, factions, systems.front().coordinates);
    sim::StarSystem live(model, 0.0);
    CHECK(live.objects().size() == model.objects.size());
    CHECK(live.objects().front().absolutePositionKm().length() == 0.0);
    CHECK(live.find(model.objects.front().id) == &live.objects().front());
    CHECK(live.find(sim::SystemObjectId{sim::OrbitalObjectType::SpaceElevator, 999}) == nullptr);

    for (std::size_t i = 1; i < model.objects.size(); ++i) {
      const auto& o = model.objects[i];
      const auto& parentPos = live.objects()[static_cast<std::size_t>(o.parentIndex)].absolutePositionKm();
      const double d = math::distance(live.objects()[i].absolutePositionKm(), parentPos);
      const double a = o.orbit.semiMajorAxisKm;
      CHECK(d <= a * (1.0 + o.orbit.eccentricity) + 1.0);
      CHECK(d >= a * (1.0 - o.orbit.eccentricity) - 1.0);
    }

    // Moving the clock moves orbiting objects and never the primary.
    live.setTime(5.0 * 86400.0);
    CHECK(live.timeSeconds() == 5.0 * 86400.0);
    CHECK(live.objects().front().absolutePositionKm().length() == 0.0);

    const sim::UniverseObjectId primaryId{model.coordinates, model.objects.front().id};
    CHECK(sim::resolve(primaryId, live) == &live.objects().front());

    sim::UniverseObjectId elsewhere = primaryId;
    elsewhere.system.localIndex += 1000;
    CHECK(sim::resolve(elsewhere, live) == nullptr);
  }

  return failures;
}
