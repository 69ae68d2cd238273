#include "orrery/core/Log.h"
#include "orrery/sim/MissionBoard.h"
#include "orrery/sim/Player.h"
#include "orrery/sim/Units.h"

#include "test_harness.h"
#include "test_worlds.h"

#include <algorithm>
#include <cmath>

using namespace orrery;

namespace {

bool sameOffers(const std::vector<sim::Mission>& a, const std::vector<sim::Mission>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!sim::equals(a[i], b[i]) || a[i].reward != b[i].reward) return false;
  }
  return true;
}

bool containsOffer(const std::vector<sim::Mission>& list, const sim::Mission& m) {
  return std::any_of(list.begin(), list.end(), [&](const sim::Mission& x) { return sim::equals(x, m); });
}

bool containsContact(const std::vector<sim::ContactStation>& list, const sim::ContactStation& c) {
  return std::any_of(list.begin(), list.end(),
                     [&](const sim::ContactStation& x) { return x.facilityId == c.facilityId; });
}

} // namespace

int test_mission_board() {
  int failures = 0;

  // Hour buckets, including timestamps before the epoch.
  CHECK(sim::hourBucket(0) == 0);
  CHECK(sim::hourBucket(sim::kMillisecondsPerHour - 1) == 0);
  CHECK(sim::hourBucket(sim::kMillisecondsPerHour) == 1);
  CHECK(sim::hourBucket(-1) == -1);
  CHECK(sim::hourBucket(-sim::kMillisecondsPerHour) == -1);
  CHECK(sim::hourBucket(-sim::kMillisecondsPerHour - 1) == -2);

  // Contact keep probability.
  CHECK(sim::contactKeepProbability(0.0, 0.02) == 1.0);
  CHECK(std::abs(sim::contactKeepProbability(10.0, 0.02) - 1.0 / 3.0) < 1e-12);
  CHECK(sim::contactKeepProbability(10.0, 0.0) == 1.0);
  CHECK(sim::contactKeepProbability(20.0, 0.02) < sim::contactKeepProbability(10.0, 0.02));

  sim::Universe u(orrery_test::kSeed);
  u.setCacheCapacity(4096);

  const auto facilityOpt = orrery_test::findFacility(u);
  CHECK(facilityOpt.has_value());
  if (!facilityOpt) return failures;
  const sim::UniverseObjectId facility = *facilityOpt;
  const sim::OrbitalObjectModel facilityModel = u.objectModel(facility);

  const sim::MissionBoardParams params{};
  const core::i64 hour = 5;
  const core::i64 ts = hour * sim::kMillisecondsPerHour + 123;
  const sim::Player nobody;

  // ---- Sightseeing offers ----
  const auto offers = sim::generateSightseeingMissions(u, facility, nobody, ts, params);
  CHECK(!offers.empty());
  CHECK(offers.size() <= params.maxSightseeingOffers);

  // Stable for the whole hour.
  CHECK(sameOffers(offers, sim::generateSightseeingMissions(u, facility, nobody, ts + 30 * 60 * 1000, params)));
  CHECK(sameOffers(offers, sim::generateSightseeingMissions(u, facility, nobody, hour * sim::kMillisecondsPerHour, params)));

  for (const auto& m : offers) {
    CHECK(m.type == sim::MissionType::SightseeingFlyBy);
    CHECK(m.missionGiver == facility);
    CHECK(m.tree.type == sim::MissionNodeType::FlyBy);

    const auto target = m.tree.objectId;
    const auto type = target.object.type;
    CHECK(type == sim::OrbitalObjectType::BlackHole || type == sim::OrbitalObjectType::NeutronStar ||
          sim::isAnomaly(type));
    CHECK(target.system != facility.system);
    CHECK(u.findObjectModel(target).has_value());

    const double d = u.distanceLy(facility.system, target.system);
    CHECK(d <= params.sightseeingSearchRadiusLy);
    CHECK(m.reward == params.flyByBaseReward + static_cast<core::i64>(std::llround(params.flyByRewardPerLy * d)));
  }

  // Every candidate kept / none kept.
  sim::MissionBoardParams all = params;
  all.sightseeingKeepChance = 1.0;
  all.maxSightseeingOffers = 100000;
  const auto everything = sim::generateSightseeingMissions(u, facility, nobody, ts, all);
  CHECK(everything.size() >= offers.size());
  for (const auto& m : offers) CHECK(containsOffer(everything, m));

  // The candidate set is the same every hour, only the draw changes.
  CHECK(sameOffers(everything, sim::generateSightseeingMissions(u, facility, nobody, ts + 7 * sim::kMillisecondsPerHour, all)));

  sim::MissionBoardParams none = params;
  none.sightseeingKeepChance = 0.0;
  CHECK(sim::generateSightseeingMissions(u, facility, nobody, ts, none).empty());

  // The cap keeps the first offers in search order.
  {
    sim::MissionBoardParams wide = params;
    wide.maxSightseeingOffers = 100000;
    const auto uncapped = sim::generateSightseeingMissions(u, facility, nobody, ts, wide);

    sim::MissionBoardParams two = params;
    two.maxSightseeingOffers = 2;
    const auto capped = sim::generateSightseeingMissions(u, facility, nobody, ts, two);
    CHECK(capped.size() == std::min<std::size_t>(2, uncapped.size()));
    for (std::size_t i = 0; i < capped.size(); ++i) CHECK(sim::equals(capped[i], uncapped[i]));
  }

  // Offers rotate with the hour.
  {
    bool changed = false;
    for (core::i64 h = hour + 1; h <= hour + 3; ++h) {
      const auto later = sim::generateSightseeingMissions(u, facility, nobody, h * sim::kMillisecondsPerHour, params);
      if (!sameOffers(offers, later)) changed = true;
    }
    CHECK(changed);
  }

  // Missions the player already has are not offered again.
  {
    sim::Player p;
    CHECK(sim::acceptMission(p, offers.front()));
    CHECK(!sim::acceptMission(p, offers.front()));

    const auto again = sim::generateSightseeingMissions(u, facility, p, ts, all);
    CHECK(!containsOffer(again, offers.front()));
    CHECK(again.size() + 1 == everything.size());

    p.completedMissions.push_back(p.currentMissions.front());
    p.currentMissions.clear();
    CHECK(!containsOffer(sim::generateSightseeingMissions(u, facility, p, ts, all), offers.front()));
  }

  // ---- Contact stations ----
  const auto contacts = sim::findContactStations(u, facility, params);
  {
    for (std::size_t i = 0; i < contacts.size(); ++i) {
      const auto& c = contacts[i];
      CHECK(c.facilityId.system != facility.system);
      CHECK(sim::isOrbitalFacility(c.facilityId.object.type));
      CHECK(u.objectModel(c.facilityId).factionId == facilityModel.factionId);
      CHECK(c.name == u.objectModel(c.facilityId).name);
      CHECK(c.systemName == u.systemModel(c.facilityId.system).name);
      CHECK(c.distanceLy <= params.contactSearchRadiusLy);
      if (i > 0) CHECK(contacts[i - 1].distanceLy <= c.distanceLy);
      CHECK(sim::describe(c) == c.name + " in " + c.systemName + " (" + sim::formatDistance(sim::lyToKm(c.distanceLy)) + ")");
    }

    const auto again = sim::findContactStations(u, facility, params);
    CHECK(again.size() == contacts.size());
    for (std::size_t i = 0; i < again.size() && i < contacts.size(); ++i) {
      CHECK(again[i].facilityId == contacts[i].facilityId);
    }
  }

  // No decay keeps every same-faction facility around.
  {
    sim::MissionBoardParams flat = params;
    flat.contactDistanceDecay = 0.0;
    const auto kept = sim::findContactStations(u, facility, flat);

    std::size_t expected = 0;
    for (const auto& n : u.neighbors(facility.system, params.contactSearchRadiusLy)) {
      for (const auto* f : sim::orbitalFacilities(u.systemModel(n.coordinates))) {
        if (f->factionId == facilityModel.factionId) ++expected;
      }
    }
    CHECK(kept.size() == expected);
    CHECK(kept.size() >= contacts.size());
    for (const auto& c : contacts) CHECK(containsContact(kept, c));

    // Stronger decay only thins the list further.
    sim::MissionBoardParams steep = params;
    steep.contactDistanceDecay = 1.0;
    const auto few = sim::findContactStations(u, facility, steep);
    CHECK(few.size() <= contacts.size());
    for (const auto& c : few) CHECK(containsContact(contacts, c));
  }

  // Whole board.
  {
    const auto board = sim::generateMissionBoard(u, facility, nobody, ts, params);
    CHECK(sameOffers(board.sightseeing, offers));
    CHECK(board.contacts.size() == contacts.size());
  }

  // Only facilities hand out missions.
  {
    const core::LogLevel prev = core::getLogLevel();
    core::setLogLevel(core::LogLevel::Off);

    const auto& sys = u.systemModel(facility.system);
    const sim::UniverseObjectId primary{facility.system, sys.objects.front().id};
    CHECK(sim::generateSightseeingMissions(u, primary, nobody, ts, params).empty());
    CHECK(sim::findContactStations(u, primary, params).empty());

    core::setLogLevel(prev);
  }

  return failures;
}
