#include "orrery/core/Args.h"
#include "orrery/core/CVar.h"
#include "orrery/core/Log.h"
#include "orrery/sim/Config.h"
#include "orrery/sim/MissionBoard.h"
#include "orrery/sim/MissionContext.h"
#include "orrery/sim/Player.h"
#include "orrery/sim/SaveGame.h"
#include "orrery/sim/Signature.h"
#include "orrery/sim/StarSystem.h"
#include "orrery/sim/Units.h"
#include "orrery/sim/Universe.h"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace orrery;

// Sector walks grow with the cube of the radius.
constexpr double kMaxNeighborRadiusLy = 1000.0;

static void printHelp() {
  std::cout
    << "orrery_sandbox - headless universe / mission board inspector\n\n"
    << "  --seed <u64>             universe seed (default 1337, or the save's seed)\n"
    << "  --pos <x> <y> <z>        pick the system nearest to this galactic position (ly)\n"
    << "  --sector <x> <y> <z>     pick a system by sector ...\n"
    << "  --index <n>              ... and index inside the sector\n"
    << "  --describe               list the system's orbital objects\n"
    << "  --sig                    print the system's stable signature\n"
    << "  --neighbors              list neighbouring systems\n"
    << "  --radius <ly>            neighbour radius (default 25, at most 1000)\n"
    << "  --board                  show the mission board of a facility in the system\n"
    << "  --facility <n>           facility index for --board (default 0)\n"
    << "  --time <ms>              unix time in ms for --board (default: now)\n"
    << "  --accept <n>             accept the n-th sightseeing offer\n"
    << "  --load <file>            load a save game\n"
    << "  --save <file>            write a save game\n"
    << "  --config <file>          load cvars from a config file\n"
    << "  --set <name=value>       set a cvar (repeatable)\n"
    << "  --cvars                  list cvars and exit\n"
    << "  -h, --help               this text\n";
}

static std::optional<sim::StarSystemCoordinates> pickSystem(const core::Args& args, sim::Universe& u,
                                                            const std::optional<sim::StarSystemCoordinates>& fallback) {
  const auto sector = args.values("sector");
  if (sector.size() >= 3) {
    sim::StarSystemCoordinates c;
    c.sector.x = std::atoi(sector[sector.size() - 3].c_str());
    c.sector.y = std::atoi(sector[sector.size() - 2].c_str());
    c.sector.z = std::atoi(sector[sector.size() - 1].c_str());
    long long index = 0;
    if (args.has("index") && !args.getI64("index", index)) {
      ORRERY_LOG_ERROR("--index expects an integer");
      return std::nullopt;
    }
    c.localIndex = static_cast<core::u32>(index);
    if (!u.isValid(c)) {
      ORRERY_LOG_ERROR("No system at " + sim::toString(c));
      return std::nullopt;
    }
    return c;
  }

  if (!args.has("pos") && fallback) return fallback;

  math::Vec3d posLy{0, 0, 0};
  const auto p = args.values("pos");
  if (p.size() >= 3) {
    posLy.x = std::atof(p[p.size() - 3].c_str());
    posLy.y = std::atof(p[p.size() - 2].c_str());
    posLy.z = std::atof(p[p.size() - 1].c_str());
  }

  const auto nearest = u.findNearestSystem(posLy, 1000.0);
  if (!nearest) {
    ORRERY_LOG_ERROR("No system within 1000 ly of the requested position");
    return std::nullopt;
  }
  return nearest->coordinates;
}

static void printObjects(const sim::StarSystemModel& sys) {
  for (const auto& o : sys.objects) {
    std::cout << "  " << std::left << std::setw(20) << sim::toString(o.type()) << std::right
              << " #" << o.id.index << "  " << o.name
              << "  r=" << sim::formatDistance(o.radiusKm);
    if (o.parentIndex >= 0) {
      std::cout << "  around " << sys.objects[static_cast<std::size_t>(o.parentIndex)].name
                << " a=" << sim::formatDistance(o.orbit.semiMajorAxisKm);
    }
    if (o.factionId != 0) std::cout << "  faction=" << o.factionId;
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Info);

  core::Args args;
  args.setArity("pos", 3);
  args.setArity("sector", 3);
  args.parse(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  sim::installSimCVars();

  std::string configPath;
  if (args.getString("config", configPath)) {
    std::string err;
    if (!core::cvars().loadFile(configPath, &err)) {
      ORRERY_LOG_ERROR("Config: " + err);
      return 1;
    }
  }
  for (const auto& assignment : args.values("set")) {
    std::string err;
    if (!core::cvars().assign(assignment, &err)) {
      ORRERY_LOG_ERROR("--set: " + err);
      return 1;
    }
  }

  if (args.hasFlag("cvars")) {
    for (const core::CVar* v : core::cvars().list()) {
      std::cout << v->name << " = " << core::CVarRegistry::valueToString(*v)
                << "  (" << core::CVarRegistry::typeName(v->type) << ")";
      if (!v->help.empty()) std::cout << "  " << v->help;
      std::cout << "\n";
    }
    return 0;
  }

  // Save game first: it provides defaults for seed and location.
  std::optional<sim::SaveGame> save;
  std::string loadPath;
  if (args.getString("load", loadPath)) {
    sim::SaveGame s;
    if (!sim::loadFromFile(loadPath, s)) return 1; // already logged
    save = std::move(s);
  }

  core::u64 seed = save ? save->seed : 1337;
  if (args.has("seed")) {
    unsigned long long s = 0;
    if (!args.getU64("seed", s)) {
      ORRERY_LOG_ERROR("--seed expects an unsigned integer");
      return 1;
    }
    if (save && static_cast<core::u64>(s) != save->seed) {
      ORRERY_LOG_ERROR("--seed " + std::to_string(s) + " does not match the seed of " + loadPath + " (" +
                       std::to_string(save->seed) + ")");
      return 1;
    }
    seed = static_cast<core::u64>(s);
  }

  sim::Universe u(seed, sim::galaxyParamsFromCVars());

  sim::Player player;
  if (save) {
    std::string err;
    if (!sim::restorePlayer(*save, u, player, &err)) {
      ORRERY_LOG_ERROR("Failed to restore " + loadPath + ": " + err);
      return 1;
    }
  }

  const auto coords = pickSystem(args, u, save ? std::optional<sim::StarSystemCoordinates>(save->currentSystem) : std::nullopt);
  if (!coords) return 1;

  const math::Vec3d playerPosKm = save ? save->playerPositionKm : math::Vec3d{};
  const double timeSeconds = save ? save->timeSeconds : 0.0;

  const sim::StarSystemModel sys = u.systemModel(*coords);
  const sim::Faction* faction = u.factions().find(sys.factionId);

  std::cout << "Seed: " << seed << "\n";
  std::cout << "System: " << sys.name << " " << sim::toString(sys.coordinates)
            << "  pos=(" << std::fixed << std::setprecision(2) << sys.galacticPositionLy.x << ", "
            << sys.galacticPositionLy.y << ", " << sys.galacticPositionLy.z << ") ly"
            << "  faction=" << (faction ? faction->name : std::string("none"))
            << "  objects=" << sys.objects.size() << "\n";

  if (args.hasFlag("sig")) {
    std::cout << "sysSig=" << static_cast<unsigned long long>(sim::signatureSystemModel(sys)) << "\n";
  }

  if (args.hasFlag("describe")) {
    std::cout << "\nObjects:\n";
    printObjects(sys);
  }

  if (args.hasFlag("neighbors")) {
    double radiusLy = 25.0;
    if (args.has("radius") && !args.getDouble("radius", radiusLy)) {
      ORRERY_LOG_ERROR("--radius expects a number");
      return 1;
    }
    if (!(radiusLy >= 0.0 && radiusLy <= kMaxNeighborRadiusLy)) {
      ORRERY_LOG_ERROR("--radius must be between 0 and " + std::to_string(static_cast<int>(kMaxNeighborRadiusLy)) + " ly");
      return 1;
    }
    const auto neighbors = u.neighbors(*coords, radiusLy);
    std::cout << "\nNeighbors within " << radiusLy << " ly: " << neighbors.size() << "\n";
    for (const auto& n : neighbors) {
      const std::string name = u.systemModel(n.coordinates).name;
      std::cout << "  " << std::setw(14) << name << "  " << sim::toString(n.coordinates)
                << "  dist=" << std::fixed << std::setprecision(2) << n.distanceLy << " ly\n";
    }
  }

  if (args.hasFlag("board") || args.has("accept")) {
    const auto facilities = sim::orbitalFacilities(sys);
    if (facilities.empty()) {
      std::cerr << "[board] system has no orbital facilities\n";
      return 1;
    }

    long long facilityIdx = 0;
    if (args.has("facility") && !args.getI64("facility", facilityIdx)) {
      ORRERY_LOG_ERROR("--facility expects an integer");
      return 1;
    }
    if (facilityIdx < 0) facilityIdx = 0;
    const auto& facility = *facilities[std::min<std::size_t>(static_cast<std::size_t>(facilityIdx), facilities.size() - 1)];
    const sim::UniverseObjectId facilityId{*coords, facility.id};

    long long nowMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch()).count();
    if (args.has("time") && !args.getI64("time", nowMs)) {
      ORRERY_LOG_ERROR("--time expects milliseconds since the epoch");
      return 1;
    }

    const auto params = sim::missionBoardParamsFromCVars();
    auto board = sim::generateMissionBoard(u, facilityId, player, static_cast<core::i64>(nowMs), params);

    std::cout << "\nMission board of " << facility.name << " (hour " << sim::hourBucket(nowMs) << ")\n";
    std::cout << "Exploration:\n";
    for (std::size_t i = 0; i < board.sightseeing.size(); ++i) {
      const auto& m = board.sightseeing[i];
      std::cout << "  [" << i << "] " << sim::describe(m, u) << "  reward=" << m.reward << "\n";
    }
    std::cout << "Contacts:\n";
    for (const auto& c : board.contacts) std::cout << "  " << sim::describe(c) << "\n";

    long long accept = -1;
    if (args.has("accept")) {
      if (!args.getI64("accept", accept) || accept < 0 || static_cast<std::size_t>(accept) >= board.sightseeing.size()) {
        ORRERY_LOG_ERROR("--accept: no such offer");
        return 1;
      }
      if (!sim::acceptMission(player, board.sightseeing[static_cast<std::size_t>(accept)])) {
        ORRERY_LOG_WARN("Mission already accepted");
      }
    }
  }

  if (!player.currentMissions.empty() || !player.completedMissions.empty()) {
    const sim::StarSystem live(sys, timeSeconds);
    const sim::MissionContext ctx{u, live, playerPosKm};
    const sim::InputBindingLabels bindings{{"starMap", "M"}, {"jump", "J"}};

    const std::size_t done = sim::updateMissions(player, ctx);
    if (done > 0) std::cout << "\nCompleted " << done << " mission(s)\n";

    std::cout << "\nPlayer " << player.name << "  credits=" << player.credits << "\n";
    for (const auto& m : player.currentMissions) {
      std::cout << "  - " << sim::describe(m, u) << "\n    next: " << sim::describeNextTask(m, ctx, bindings) << "\n";
    }
    for (const auto& m : player.completedMissions) {
      std::cout << "  - (done) " << sim::describe(m, u) << "\n";
    }
  }

  std::string savePath;
  if (args.getString("save", savePath)) {
    const auto s = sim::makeSaveGame(player, seed, *coords, playerPosKm, timeSeconds);
    if (!sim::saveToFile(s, savePath)) return 1;
    std::cout << "\nSaved to " << savePath << "\n";
  }

  return 0;
}
