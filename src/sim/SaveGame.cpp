#include "orrery/sim/SaveGame.h"

#include "orrery/core/Log.h"

#include <fstream>
#include <initializer_list>
#include <istream>
#include <limits>
#include <ostream>
#include <sstream>

namespace orrery::sim {

namespace {

constexpr const char* kHeader = "OrrerySave";
constexpr int kVersion = 1;
constexpr int kMaxNodeDepth = 64;
constexpr std::size_t kMaxChildren = 1024;

void writeCoords(std::ostream& f, const StarSystemCoordinates& c) {
  f << c.sector.x << " " << c.sector.y << " " << c.sector.z << " " << c.localIndex;
}

void writeId(std::ostream& f, const UniverseObjectId& id) {
  writeCoords(f, id.system);
  f << " " << static_cast<int>(id.object.type) << " " << id.object.index;
}

void writeNode(std::ostream& f, const MissionNodeRecord& r) {
  f << "node " << r.type << " " << r.state << " " << r.children.size() << " ";
  writeId(f, r.objectId);
  f << "\n";
  for (const auto& c : r.children) writeNode(f, c);
}

void writeMission(std::ostream& f, const MissionRecord& m) {
  f << "mission " << m.type << " " << m.reward << " ";
  writeId(f, m.missionGiver);
  f << "\n";
  writeNode(f, m.tree);
}

void writeDiscovery(std::ostream& f, const SpaceDiscovery& d) {
  f << "discovery " << d.discoveryTimestampMs << " ";
  writeId(f, d.objectId);
  f << " " << d.explorerName << "\n";
}

// Token reader that remembers the first error.
class Reader {
public:
  explicit Reader(std::istream& in) : in_(in) {}

  bool ok() const { return error_.empty(); }
  const std::string& error() const { return error_; }

  void fail(const std::string& msg) {
    if (error_.empty()) error_ = msg;
  }

  template <class T>
  bool read(T& v, const char* what) {
    if (!ok()) return false;
    if (!(in_ >> v)) {
      fail(std::string("expected ") + what);
      return false;
    }
    return true;
  }

  bool expect(const char* token) {
    std::string s;
    if (!read(s, token)) return false;
    if (s != token) {
      fail(std::string("expected '") + token + "', got '" + s + "'");
      return false;
    }
    return true;
  }

  // Rest of the current line, leading blanks removed.
  std::string restOfLine() {
    std::string s;
    std::getline(in_, s);
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    s.erase(0, b);
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ')) s.pop_back();
    return s;
  }

  bool coords(StarSystemCoordinates& c) {
    return read(c.sector.x, "sector x") && read(c.sector.y, "sector y") &&
           read(c.sector.z, "sector z") && read(c.localIndex, "system index");
  }

  bool id(UniverseObjectId& out) {
    int type = 0;
    if (!coords(out.system) || !read(type, "object type") || !read(out.object.index, "object index")) return false;
    if (!orbitalObjectTypeFromInt(type, out.object.type)) {
      fail("invalid object type " + std::to_string(type));
      return false;
    }
    return true;
  }

  bool node(MissionNodeRecord& r, int depth) {
    if (depth > kMaxNodeDepth) {
      fail("mission tree too deep");
      return false;
    }
    std::size_t childCount = 0;
    if (!expect("node") || !read(r.type, "node type") || !read(r.state, "node state") ||
        !read(childCount, "child count") || !id(r.objectId)) {
      return false;
    }
    if (childCount > kMaxChildren) {
      fail("too many children in mission node");
      return false;
    }
    r.children.resize(childCount);
    for (auto& c : r.children) {
      if (!node(c, depth + 1)) return false;
    }
    return true;
  }

  bool mission(MissionRecord& m) {
    return read(m.type, "mission type") && read(m.reward, "mission reward") &&
           id(m.missionGiver) && node(m.tree, 0);
  }

  bool missions(std::vector<MissionRecord>& out) {
    std::size_t n = 0;
    if (!read(n, "mission count")) return false;
    out.clear();
    for (std::size_t i = 0; i < n; ++i) {
      MissionRecord m;
      if (!expect("mission") || !mission(m)) return false;
      out.push_back(std::move(m));
    }
    return true;
  }

  bool discoveries(std::vector<SpaceDiscovery>& out) {
    std::size_t n = 0;
    if (!read(n, "discovery count")) return false;
    out.clear();
    for (std::size_t i = 0; i < n; ++i) {
      SpaceDiscovery d;
      if (!expect("discovery") || !read(d.discoveryTimestampMs, "discovery time") || !id(d.objectId)) return false;
      d.explorerName = restOfLine();
      out.push_back(std::move(d));
    }
    return true;
  }

private:
  std::istream& in_;
  std::string error_;
};

bool objectExists(Universe& universe, const UniverseObjectId& id, const char* what, std::string* outError) {
  if (universe.findObjectModel(id)) return true;
  if (outError) *outError = std::string(what) + " not found: " + toString(id);
  return false;
}

bool targetsExist(Universe& universe, const MissionNode& node, std::string* outError) {
  if (node.type == MissionNodeType::FlyBy) return objectExists(universe, node.objectId, "mission target", outError);
  for (const auto& c : node.children) {
    if (!targetsExist(universe, c, outError)) return false;
  }
  return true;
}

} // namespace

SaveGame makeSaveGame(const Player& player, core::u64 seed, const StarSystemCoordinates& currentSystem,
                      const math::Vec3d& playerPositionKm, double timeSeconds) {
  SaveGame s;
  s.seed = seed;
  s.timeSeconds = timeSeconds;
  s.currentSystem = currentSystem;
  s.playerPositionKm = playerPositionKm;
  s.playerName = player.name;
  s.credits = player.credits;
  for (const auto& m : player.currentMissions) s.currentMissions.push_back(serialize(m));
  for (const auto& m : player.completedMissions) s.completedMissions.push_back(serialize(m));
  s.localDiscoveries = player.localDiscoveries;
  s.uploadedDiscoveries = player.uploadedDiscoveries;
  return s;
}

bool restorePlayer(const SaveGame& save, Universe& universe, Player& out, std::string* outError) {
  if (save.seed != universe.seed()) {
    if (outError) {
      *outError = "save was written for seed " + std::to_string(save.seed) +
                  ", universe seed is " + std::to_string(universe.seed());
    }
    return false;
  }

  Player p;
  p.name = save.playerName;
  p.credits = save.credits;

  auto restore = [&](const std::vector<MissionRecord>& records, std::vector<Mission>& dst) {
    for (const auto& r : records) {
      Mission m;
      if (!deserialize(r, m, outError)) return false;
      if (!objectExists(universe, m.missionGiver, "mission giver", outError)) return false;
      if (!targetsExist(universe, m.tree, outError)) return false;
      dst.push_back(std::move(m));
    }
    return true;
  };
  if (!restore(save.currentMissions, p.currentMissions)) return false;
  if (!restore(save.completedMissions, p.completedMissions)) return false;

  for (const auto* list : {&save.localDiscoveries, &save.uploadedDiscoveries}) {
    for (const auto& d : *list) {
      if (!objectExists(universe, d.objectId, "discovered object", outError)) return false;
    }
  }

  p.localDiscoveries = save.localDiscoveries;
  p.uploadedDiscoveries = save.uploadedDiscoveries;
  out = std::move(p);
  return true;
}

bool saveToStream(const SaveGame& s, std::ostream& f) {
  f.precision(std::numeric_limits<double>::max_digits10);

  f << kHeader << " " << s.version << "\n";
  f << "seed " << s.seed << "\n";
  f << "timeSeconds " << s.timeSeconds << "\n";
  f << "currentSystem ";
  writeCoords(f, s.currentSystem);
  f << "\n";
  f << "playerPosKm " << s.playerPositionKm.x << " " << s.playerPositionKm.y << " " << s.playerPositionKm.z << "\n";
  f << "playerName " << s.playerName << "\n";
  f << "credits " << s.credits << "\n";

  f << "currentMissions " << s.currentMissions.size() << "\n";
  for (const auto& m : s.currentMissions) writeMission(f, m);
  f << "completedMissions " << s.completedMissions.size() << "\n";
  for (const auto& m : s.completedMissions) writeMission(f, m);

  f << "localDiscoveries " << s.localDiscoveries.size() << "\n";
  for (const auto& d : s.localDiscoveries) writeDiscovery(f, d);
  f << "uploadedDiscoveries " << s.uploadedDiscoveries.size() << "\n";
  for (const auto& d : s.uploadedDiscoveries) writeDiscovery(f, d);

  return static_cast<bool>(f);
}

bool loadFromStream(std::istream& in, SaveGame& out, std::string* outError) {
  Reader r(in);

  std::string header;
  int version = 0;
  if (!r.read(header, "header") || header != kHeader) {
    if (outError) *outError = "not an orrery save file";
    return false;
  }
  if (!r.read(version, "version") || version < 1 || version > kVersion) {
    if (outError) *outError = "unsupported save version " + std::to_string(version);
    return false;
  }

  SaveGame s;
  s.version = version;

  std::string key;
  while (r.ok() && (in >> key)) {
    if (key == "seed") {
      r.read(s.seed, "seed");
    } else if (key == "timeSeconds") {
      r.read(s.timeSeconds, "time");
    } else if (key == "currentSystem") {
      r.coords(s.currentSystem);
    } else if (key == "playerPosKm") {
      if (r.read(s.playerPositionKm.x, "x") && r.read(s.playerPositionKm.y, "y")) r.read(s.playerPositionKm.z, "z");
    } else if (key == "playerName") {
      s.playerName = r.restOfLine();
    } else if (key == "credits") {
      r.read(s.credits, "credits");
    } else if (key == "currentMissions") {
      r.missions(s.currentMissions);
    } else if (key == "completedMissions") {
      r.missions(s.completedMissions);
    } else if (key == "localDiscoveries") {
      r.discoveries(s.localDiscoveries);
    } else if (key == "uploadedDiscoveries") {
      r.discoveries(s.uploadedDiscoveries);
    } else {
      // Unknown key (newer writer): skip the line.
      ORRERY_LOG_DEBUG("SaveGame: skipping unknown key '" + key + "'");
      r.restOfLine();
    }
  }

  if (!r.ok()) {
    if (outError) *outError = r.error();
    return false;
  }

  out = std::move(s);
  return true;
}

bool saveToFile(const SaveGame& s, const std::string& path) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    ORRERY_LOG_ERROR("SaveGame: failed to open file for writing: " + path);
    return false;
  }
  if (!saveToStream(s, f)) {
    ORRERY_LOG_ERROR("SaveGame: write failed: " + path);
    return false;
  }
  return true;
}

bool loadFromFile(const std::string& path, SaveGame& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    if (outError) *outError = "file not found: " + path;
    ORRERY_LOG_WARN("SaveGame: file not found: " + path);
    return false;
  }

  std::string err;
  if (!loadFromStream(f, out, &err)) {
    ORRERY_LOG_ERROR("SaveGame: " + path + ": " + err);
    if (outError) *outError = err;
    return false;
  }
  return true;
}

} // namespace orrery::sim
