#include "orrery/proc/SystemGenerator.h"

#include "orrery/core/Random.h"
#include "orrery/math/Math.h"
#include "orrery/proc/NameGenerator.h"
#include "orrery/sim/Orbit.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace orrery::proc {

namespace {

enum class StarClass : core::u8 { O, B, A, F, G, K, M };

struct StarProps {
  double massSol{1.0};
  double radiusSol{1.0};
  double luminositySol{1.0};
  double temperatureK{5778.0};
};

StarClass pickStarClass(core::SplitMix64& rng) {
  const double r = rng.nextDouble();
  // Very rough main-sequence-ish distribution.
  if (r < 0.0003) return StarClass::O;
  if (r < 0.0016) return StarClass::B;
  if (r < 0.006)  return StarClass::A;
  if (r < 0.03)   return StarClass::F;
  if (r < 0.10)   return StarClass::G;
  if (r < 0.30)   return StarClass::K;
  return StarClass::M;
}

StarProps makeStar(StarClass cls, core::SplitMix64& rng) {
  StarProps s{};
  auto rr = [&](double a, double b) { return rng.range(a, b); };

  switch (cls) {
    case StarClass::O:
      s = {rr(16.0, 60.0), rr(6.0, 15.0), rr(30000.0, 500000.0), rr(30000.0, 50000.0)};
      break;
    case StarClass::B:
      s = {rr(2.1, 16.0), rr(2.0, 6.0), rr(25.0, 30000.0), rr(10000.0, 30000.0)};
      break;
    case StarClass::A:
      s = {rr(1.4, 2.1), rr(1.4, 2.5), rr(5.0, 25.0), rr(7500.0, 10000.0)};
      break;
    case StarClass::F:
      s = {rr(1.04, 1.4), rr(1.15, 1.6), rr(1.5, 5.0), rr(6000.0, 7500.0)};
      break;
    case StarClass::G:
      s = {rr(0.8, 1.04), rr(0.9, 1.2), rr(0.6, 1.6), rr(5200.0, 6000.0)};
      break;
    case StarClass::K:
      s = {rr(0.45, 0.8), rr(0.7, 0.95), rr(0.08, 0.6), rr(3700.0, 5200.0)};
      break;
    case StarClass::M:
    default:
      s = {rr(0.08, 0.45), rr(0.1, 0.7), rr(0.0001, 0.08), rr(2400.0, 3700.0)};
      break;
  }
  return s;
}

// Builds the flat object list and hands out per-type indices.
class SystemBuilder {
public:
  explicit SystemBuilder(sim::StarSystemModel& model) : model_(model) {}

  int add(sim::OrbitalObjectType type, sim::OrbitalObjectModel obj) {
    auto& counter = counters_[static_cast<std::size_t>(type)];
    obj.id = sim::SystemObjectId{type, counter++};
    model_.objects.push_back(std::move(obj));
    return static_cast<int>(model_.objects.size() - 1);
  }

  const sim::OrbitalObjectModel& at(int index) const {
    return model_.objects[static_cast<std::size_t>(index)];
  }

private:
  sim::StarSystemModel& model_;
  std::array<core::u32, sim::kOrbitalObjectTypeCount> counters_{};
};

void randomizeOrientation(sim::OrbitElements& orbit, core::SplitMix64& rng, double maxInclinationDeg) {
  orbit.inclinationRad = rng.range(0.0, math::degToRad(maxInclinationDeg));
  orbit.ascendingNodeRad = rng.range(0.0, math::kTwoPi);
  orbit.argPeriapsisRad = rng.range(0.0, math::kTwoPi);
  orbit.meanAnomalyAtEpochRad = rng.range(0.0, math::kTwoPi);
}

void placeInOrbit(sim::OrbitalObjectModel& obj, const sim::OrbitalObjectModel& parent, int parentIndex,
                  double semiMajorAxisKm, double maxEccentricity, double maxInclinationDeg,
                  core::SplitMix64& rng) {
  obj.parentIndex = parentIndex;
  obj.orbit.semiMajorAxisKm = semiMajorAxisKm;
  obj.orbit.eccentricity = rng.range(0.0, maxEccentricity);
  randomizeOrientation(obj.orbit, rng, maxInclinationDeg);
  obj.orbit.periodSeconds = sim::orbitalPeriodSeconds(semiMajorAxisKm, parent.massKg);
}

sim::OrbitalObjectModel makePrimary(core::SplitMix64& rng, sim::OrbitalObjectType& outType, double& outLuminositySol) {
  sim::OrbitalObjectModel o{};
  o.seed = rng.nextU64();

  const double r = rng.nextDouble();
  if (r < 0.01) {
    outType = sim::OrbitalObjectType::BlackHole;
    const double massSol = rng.range(5.0, 40.0);
    o.massKg = massSol * sim::kSolarMassKg;
    o.radiusKm = 2.953 * massSol; // Schwarzschild radius
    o.siderealDaySeconds = rng.range(1e-3, 1.0);
    outLuminositySol = 0.0;
  } else if (r < 0.04) {
    outType = sim::OrbitalObjectType::NeutronStar;
    o.massKg = rng.range(1.1, 2.3) * sim::kSolarMassKg;
    o.radiusKm = rng.range(10.0, 15.0);
    o.temperatureK = rng.range(5.0e5, 1.0e6);
    o.siderealDaySeconds = rng.range(1e-3, 2.0);
    outLuminositySol = 0.0;
  } else {
    outType = sim::OrbitalObjectType::Star;
    const StarProps s = makeStar(pickStarClass(rng), rng);
    o.massKg = s.massSol * sim::kSolarMassKg;
    o.radiusKm = s.radiusSol * sim::kSolarRadiusKm;
    o.temperatureK = s.temperatureK;
    o.siderealDaySeconds = rng.range(10.0, 40.0) * sim::kSecondsPerDay;
    outLuminositySol = s.luminositySol;
  }
  o.axialTiltRad = rng.range(0.0, math::degToRad(30.0));
  return o;
}

} // namespace

sim::StarSystemModel generateSystemModel(const GalaxyGenerator& galaxy,
                                         const sim::FactionRegistry& factions,
                                         const sim::StarSystemCoordinates& coords) {
  using sim::OrbitalObjectType;

  sim::StarSystemModel model{};
  model.coordinates = coords;
  model.seed = galaxy.systemSeed(coords);
  model.galacticPositionLy = galaxy.galacticPosition(coords);
  model.factionId = factions.controllingFactionId(model.seed);

  core::SplitMix64 rng(model.seed);
  NameGenerator ng(core::deriveSeed(model.seed, "names"));
  model.name = ng.systemName();

  SystemBuilder b(model);

  // Primary
  OrbitalObjectType primaryType = OrbitalObjectType::Star;
  double luminositySol = 1.0;
  sim::OrbitalObjectModel primaryModel = makePrimary(rng, primaryType, luminositySol);
  primaryModel.name = model.name;
  const int primary = b.add(primaryType, std::move(primaryModel));
  const bool normalStar = (primaryType == OrbitalObjectType::Star);

  // Companion star on a wide orbit
  if (normalStar && rng.chance(0.25)) {
    const StarProps s = makeStar(rng.chance(0.7) ? StarClass::M : StarClass::K, rng);
    sim::OrbitalObjectModel c{};
    c.seed = rng.nextU64();
    c.name = model.name + " B";
    c.massKg = s.massSol * sim::kSolarMassKg;
    c.radiusKm = s.radiusSol * sim::kSolarRadiusKm;
    c.temperatureK = s.temperatureK;
    c.siderealDaySeconds = rng.range(10.0, 40.0) * sim::kSecondsPerDay;
    placeInOrbit(c, b.at(primary), primary, rng.range(40.0, 120.0) * sim::kAU_KM, 0.3, 10.0, rng);
    b.add(OrbitalObjectType::Star, std::move(c));
  }

  // Planets and their satellites
  const double frostLineAU = 2.7 * std::sqrt(std::max(luminositySol, 0.05));
  const int planetCount = normalStar ? rng.range(0, 9) : rng.range(0, 3);
  std::vector<int> planetIndices;
  planetIndices.reserve(static_cast<std::size_t>(planetCount));

  double aAU = rng.range(0.25, 0.6);
  for (int i = 0; i < planetCount; ++i) {
    aAU *= rng.range(1.35, 1.9);
    aAU += rng.range(0.05, 0.25);

    const bool gas = (aAU < frostLineAU) ? rng.chance(0.1) : rng.chance(0.8);

    sim::OrbitalObjectModel p{};
    p.seed = rng.nextU64();
    p.name = ng.planetName(model.name, i);
    if (gas) {
      p.radiusKm = rng.range(3.0, 11.0) * sim::kEarthRadiusKm;
      p.massKg = rng.range(20.0, 320.0) * sim::kEarthMassKg;
      p.siderealDaySeconds = rng.range(0.3, 1.2) * sim::kSecondsPerDay;
    } else {
      p.radiusKm = rng.range(0.3, 1.8) * sim::kEarthRadiusKm;
      p.massKg = rng.range(0.1, 6.0) * sim::kEarthMassKg;
      p.siderealDaySeconds = rng.range(0.5, 3.0) * sim::kSecondsPerDay;
    }
    p.axialTiltRad = rng.range(0.0, math::degToRad(35.0));
    placeInOrbit(p, b.at(primary), primary, aAU * sim::kAU_KM, 0.18, 6.0, rng);

    const int planet = b.add(gas ? OrbitalObjectType::GasPlanet : OrbitalObjectType::TelluricPlanet, std::move(p));
    planetIndices.push_back(planet);

    const int satelliteCount = gas ? rng.range(0, 4) : (rng.chance(0.4) ? rng.range(1, 2) : 0);
    double satA = b.at(planet).radiusKm * rng.range(4.0, 10.0);
    for (int s = 0; s < satelliteCount; ++s) {
      satA *= rng.range(1.4, 2.2);

      sim::OrbitalObjectModel m{};
      m.seed = rng.nextU64();
      m.name = ng.satelliteName(b.at(planet).name, s);
      m.radiusKm = std::min(rng.range(0.05, 0.45) * sim::kEarthRadiusKm, b.at(planet).radiusKm * 0.5);
      m.massKg = rng.range(0.001, 0.05) * sim::kEarthMassKg;
      m.siderealDaySeconds = rng.range(1.0, 30.0) * sim::kSecondsPerDay;
      placeInOrbit(m, b.at(planet), planet, satA, 0.05, 5.0, rng);
      b.add(OrbitalObjectType::TelluricSatellite, std::move(m));
    }
  }

  // Anomalies
  if (rng.chance(0.08)) {
    sim::OrbitalObjectModel a{};
    a.seed = rng.nextU64();
    a.name = ng.anomalyName(model.name, 0);
    a.radiusKm = rng.range(500.0, 3000.0);
    a.siderealDaySeconds = rng.range(0.5, 5.0) * sim::kSecondsPerDay;
    placeInOrbit(a, b.at(primary), primary, rng.range(1.0, 30.0) * sim::kAU_KM, 0.2, 20.0, rng);
    b.add(rng.chance(0.5) ? OrbitalObjectType::Mandelbulb : OrbitalObjectType::JuliaSet, std::move(a));
  }

  // Orbital facilities, only around a normal star.
  if (normalStar) {
    int stationCount = 0;
    auto addStation = [&](int parent, double semiMajorAxisKm) {
      sim::OrbitalObjectModel st{};
      st.seed = rng.nextU64();
      st.name = ng.stationName(model.name, stationCount++);
      st.radiusKm = rng.range(1.0, 5.0);
      st.siderealDaySeconds = rng.range(60.0, 600.0);
      st.factionId = model.factionId;
      placeInOrbit(st, b.at(parent), parent, semiMajorAxisKm, 0.01, 3.0, rng);
      b.add(OrbitalObjectType::SpaceStation, std::move(st));
    };

    for (const int planet : planetIndices) {
      if (rng.chance(0.3)) addStation(planet, b.at(planet).radiusKm * rng.range(2.0, 6.0));
    }
    if (planetIndices.empty() && rng.chance(0.5)) {
      addStation(primary, rng.range(0.5, 3.0) * sim::kAU_KM);
    }

    for (const int planet : planetIndices) {
      const auto& p = b.at(planet);
      if (p.type() != OrbitalObjectType::TelluricPlanet || !rng.chance(0.1)) continue;

      // Anchored on the surface: co-rotates with the planet.
      sim::OrbitalObjectModel el{};
      el.seed = rng.nextU64();
      el.name = ng.elevatorName(p.name);
      el.radiusKm = rng.range(20.0, 60.0);
      el.factionId = model.factionId;
      el.parentIndex = planet;
      el.orbit.semiMajorAxisKm = p.radiusKm;
      el.orbit.periodSeconds = p.siderealDaySeconds;
      el.orbit.meanAnomalyAtEpochRad = rng.range(0.0, math::kTwoPi);
      el.siderealDaySeconds = p.siderealDaySeconds;
      b.add(OrbitalObjectType::SpaceElevator, std::move(el));
    }
  }

  return model;
}

} // namespace orrery::proc
