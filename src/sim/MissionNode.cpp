#include "orrery/sim/MissionNode.h"

#include "orrery/core/Assert.h"
#include "orrery/sim/Units.h"

#include <algorithm>
#include <sstream>

namespace orrery::sim {

namespace {

bool isLogicType(MissionNodeType t) {
  return t == MissionNodeType::And || t == MissionNodeType::Or ||
         t == MissionNodeType::Xor || t == MissionNodeType::Sequence;
}

std::size_t completedChildren(const MissionNode& node) {
  return static_cast<std::size_t>(std::count_if(node.children.begin(), node.children.end(),
                                                [](const MissionNode& c) { return isCompleted(c); }));
}

void updateFlyBy(MissionNode& node, const MissionContext& context) {
  if (node.objectId.system != context.currentSystem.coordinates()) {
    node.flyByState = FlyByState::NotInSystem;
    return;
  }

  const OrbitalObject* target = resolve(node.objectId, context.currentSystem);
  ORRERY_ASSERT_MSG(target != nullptr, "Fly-by target missing from its own system: " + toString(node.objectId));

  const double distanceKm = math::distance(context.playerPositionKm, target->absolutePositionKm());
  const double thresholdKm = target->boundingRadiusKm() * flyByThresholdMultiplier(target->model().type());

  node.flyByState = (distanceKm < thresholdKm) ? FlyByState::CloseEnough : FlyByState::TooFarInSystem;
}

void appendUnique(std::vector<StarSystemCoordinates>& out, const std::vector<StarSystemCoordinates>& in) {
  for (const auto& c : in) {
    if (std::find(out.begin(), out.end(), c) == out.end()) out.push_back(c);
  }
}

std::string goToSystemInstructions(const MissionContext& context, const StarSystemCoordinates& target,
                                   const InputBindingLabels& bindings) {
  const double ly = context.universe.distanceLy(context.currentSystem.coordinates(), target);
  const std::string systemName = context.universe.systemModel(target).name;

  std::ostringstream oss;
  oss << "Open the star map with " << bindingLabel(bindings, "starMap")
      << " and set " << systemName << " (" << formatDistance(lyToKm(ly)) << " away) as your destination. "
      << "Then press " << bindingLabel(bindings, "jump") << " to jump there.";
  return oss.str();
}

std::string joinTasks(const MissionNode& node, const MissionContext& context,
                      const InputBindingLabels& bindings, std::string_view separator) {
  std::string out;
  for (const auto& child : node.children) {
    if (isCompleted(child)) continue;
    if (!out.empty()) out += separator;
    out += describeNextTask(child, context, bindings);
  }
  return out;
}

} // namespace

std::string bindingLabel(const InputBindingLabels& labels, const std::string& action) {
  const auto it = labels.find(action);
  if (it == labels.end() || it->second.empty()) return "[unbound]";
  return it->second;
}

std::string_view toString(MissionNodeType type) {
  switch (type) {
    case MissionNodeType::FlyBy: return "fly-by";
    case MissionNodeType::And: return "and";
    case MissionNodeType::Or: return "or";
    case MissionNodeType::Xor: return "xor";
    case MissionNodeType::Sequence: return "sequence";
  }
  return "unknown";
}

std::string_view toString(FlyByState state) {
  switch (state) {
    case FlyByState::NotInSystem: return "not in system";
    case FlyByState::TooFarInSystem: return "too far";
    case FlyByState::CloseEnough: return "close enough";
  }
  return "unknown";
}

MissionNode makeFlyByNode(const UniverseObjectId& target) {
  MissionNode n;
  n.type = MissionNodeType::FlyBy;
  n.objectId = target;
  return n;
}

MissionNode makeLogicNode(MissionNodeType type, std::vector<MissionNode> children) {
  ORRERY_ASSERT_MSG(isLogicType(type), "makeLogicNode called with a fly-by type");
  ORRERY_ASSERT_MSG(!children.empty(), "Logic mission node needs at least one child");
  MissionNode n;
  n.type = type;
  n.children = std::move(children);
  return n;
}

double flyByThresholdMultiplier(OrbitalObjectType type) {
  switch (type) {
    case OrbitalObjectType::Star:
    case OrbitalObjectType::TelluricPlanet:
    case OrbitalObjectType::TelluricSatellite:
    case OrbitalObjectType::GasPlanet:
    case OrbitalObjectType::Mandelbulb:
    case OrbitalObjectType::JuliaSet:
    case OrbitalObjectType::SpaceStation:
    case OrbitalObjectType::SpaceElevator:
      return 3.0;
    case OrbitalObjectType::NeutronStar:
      return 50.0;
    case OrbitalObjectType::BlackHole:
      return 10.0;
    default:
      return 1.0;
  }
}

bool isCompleted(const MissionNode& node) {
  switch (node.type) {
    case MissionNodeType::FlyBy:
      return node.flyByState == FlyByState::CloseEnough;
    case MissionNodeType::And:
      return completedChildren(node) == node.children.size();
    case MissionNodeType::Or:
      return completedChildren(node) > 0;
    case MissionNodeType::Xor:
      return completedChildren(node) == 1;
    case MissionNodeType::Sequence:
      return node.activeChild >= node.children.size();
  }
  return false;
}

void updateState(MissionNode& node, const MissionContext& context) {
  if (isCompleted(node)) return;

  switch (node.type) {
    case MissionNodeType::FlyBy:
      updateFlyBy(node, context);
      break;
    case MissionNodeType::And:
    case MissionNodeType::Or:
    case MissionNodeType::Xor:
      for (auto& child : node.children) updateState(child, context);
      break;
    case MissionNodeType::Sequence:
      updateState(node.children[node.activeChild], context);
      while (node.activeChild < node.children.size() && isCompleted(node.children[node.activeChild])) {
        ++node.activeChild;
        if (node.activeChild < node.children.size()) updateState(node.children[node.activeChild], context);
      }
      break;
  }
}

bool equals(const MissionNode& a, const MissionNode& b) {
  if (a.type != b.type) return false;
  if (a.type == MissionNodeType::FlyBy) return a.objectId == b.objectId;

  if (a.children.size() != b.children.size()) return false;
  for (std::size_t i = 0; i < a.children.size(); ++i) {
    if (!equals(a.children[i], b.children[i])) return false;
  }
  return true;
}

std::string describe(const MissionNode& node, const StarSystemCoordinates& origin, Universe& universe) {
  if (node.type == MissionNodeType::FlyBy) {
    const StarSystemCoordinates& target = node.objectId.system;
    const double ly = universe.distanceLy(origin, target);
    const OrbitalObjectModel object = universe.objectModel(node.objectId);
    const std::string systemName = universe.systemModel(target).name;

    std::ostringstream oss;
    oss << "Fly by " << toString(object.type()) << " in " << systemName << " ("
        << (ly > 0.0 ? formatDistance(lyToKm(ly)) : std::string("here")) << ")";
    return oss.str();
  }

  std::string_view separator = ", ";
  std::string prefix;
  switch (node.type) {
    case MissionNodeType::And: separator = " and "; break;
    case MissionNodeType::Or: separator = " or "; break;
    case MissionNodeType::Xor: prefix = "Exactly one of: "; separator = "; "; break;
    case MissionNodeType::Sequence: separator = ", then "; break;
    default: break;
  }

  std::string out = prefix;
  for (std::size_t i = 0; i < node.children.size(); ++i) {
    if (i > 0) out += separator;
    out += describe(node.children[i], origin, universe);
  }
  return out;
}

std::string describeNextTask(const MissionNode& node, const MissionContext& context,
                             const InputBindingLabels& bindings) {
  if (isCompleted(node)) return "Mission completed";

  switch (node.type) {
    case MissionNodeType::FlyBy:
      if (node.flyByState == FlyByState::NotInSystem) {
        return goToSystemInstructions(context, node.objectId.system, bindings);
      }
      return "Get closer to " + context.universe.objectModel(node.objectId).name;
    case MissionNodeType::And:
      return joinTasks(node, context, bindings, "\n");
    case MissionNodeType::Or:
    case MissionNodeType::Xor:
      return joinTasks(node, context, bindings, "\nor\n");
    case MissionNodeType::Sequence:
      return describeNextTask(node.children[node.activeChild], context, bindings);
  }
  return {};
}

std::vector<StarSystemCoordinates> getTargetSystems(const MissionNode& node) {
  std::vector<StarSystemCoordinates> out;
  switch (node.type) {
    case MissionNodeType::FlyBy:
      out.push_back(node.objectId.system);
      break;
    case MissionNodeType::And:
    case MissionNodeType::Or:
    case MissionNodeType::Xor:
      for (const auto& child : node.children) appendUnique(out, getTargetSystems(child));
      break;
    case MissionNodeType::Sequence:
      if (node.activeChild < node.children.size()) out = getTargetSystems(node.children[node.activeChild]);
      break;
  }
  return out;
}

MissionNodeRecord serialize(const MissionNode& node) {
  MissionNodeRecord r;
  r.type = static_cast<int>(node.type);
  if (node.type == MissionNodeType::FlyBy) {
    r.objectId = node.objectId;
    r.state = static_cast<int>(node.flyByState);
    return r;
  }

  r.children.reserve(node.children.size());
  for (const auto& child : node.children) r.children.push_back(serialize(child));
  if (node.type == MissionNodeType::Sequence) r.state = static_cast<int>(node.activeChild);
  return r;
}

bool deserialize(const MissionNodeRecord& record, MissionNode& out, std::string* outError) {
  auto fail = [&](const std::string& msg) {
    if (outError) *outError = msg;
    return false;
  };

  if (record.type < 0 || record.type > static_cast<int>(MissionNodeType::Sequence)) {
    return fail("unknown mission node type " + std::to_string(record.type));
  }

  MissionNode n;
  n.type = static_cast<MissionNodeType>(record.type);

  if (n.type == MissionNodeType::FlyBy) {
    if (!record.children.empty()) return fail("fly-by node cannot have children");
    if (record.state < 0 || record.state > static_cast<int>(FlyByState::CloseEnough)) {
      return fail("invalid fly-by state " + std::to_string(record.state));
    }
    const int objectType = static_cast<int>(record.objectId.object.type);
    OrbitalObjectType parsedType{};
    if (!orbitalObjectTypeFromInt(objectType, parsedType)) {
      return fail("invalid fly-by target type " + std::to_string(objectType));
    }
    n.objectId = record.objectId;
    n.flyByState = static_cast<FlyByState>(record.state);
    out = std::move(n);
    return true;
  }

  if (record.children.empty()) return fail(std::string(toString(n.type)) + " node has no children");

  n.children.reserve(record.children.size());
  for (const auto& childRecord : record.children) {
    MissionNode child;
    if (!deserialize(childRecord, child, outError)) return false;
    n.children.push_back(std::move(child));
  }

  if (n.type == MissionNodeType::Sequence) {
    if (record.state < 0 || static_cast<std::size_t>(record.state) > n.children.size()) {
      return fail("sequence index " + std::to_string(record.state) + " out of range");
    }
    n.activeChild = static_cast<core::u32>(record.state);
  } else if (record.state != 0) {
    return fail(std::string(toString(n.type)) + " node carries a state");
  }

  out = std::move(n);
  return true;
}

} // namespace orrery::sim
