#include "orrery/sim/Faction.h"

#include "orrery/core/Random.h"

#include <array>
#include <string>

namespace orrery::sim {
namespace {

constexpr std::array<const char*, 8> kGovSuffix = {
  "Union",
  "Federation",
  "Republic",
  "Consortium",
  "Collective",
  "Directorate",
  "Kingdom",
  "Free State",
};

constexpr std::array<const char*, 6> kGovPrefix = {
  "United",
  "Outer",
  "Core",
  "New",
  "Greater",
  "Independent",
};

}

FactionRegistry::FactionRegistry(core::u64 universeSeed, std::size_t factionCount)
  : seed_(universeSeed)
{
  if (factionCount == 0) factionCount = 1;

  const proc::NameGenerator names;
  const auto base = core::deriveSeed(seed_, "faction");

  factions_.reserve(factionCount);
  for (std::size_t i = 0; i < factionCount; ++i) {
    core::SplitMix64 rng(core::deriveSeed(base, static_cast<core::u64>(i)));

    Faction f;
    f.id = static_cast<core::u32>(i + 1);

    const std::string coreName = names.makeName(rng, 2, 4);
    const std::string prefix = rng.chance(0.35) ? std::string(rng.pick(kGovPrefix)) + " " : std::string();
    f.name = prefix + coreName + " " + rng.pick(kGovSuffix);

    factions_.push_back(std::move(f));
  }
}

const Faction* FactionRegistry::find(core::u32 id) const {
  if (id == 0 || id > factions_.size()) return nullptr;
  return &factions_[id - 1];
}

core::u32 FactionRegistry::controllingFactionId(core::u64 systemSeed) const {
  const auto mapSeed = core::deriveSeed(seed_, "faction_map");
  const auto h = core::hashCombine(systemSeed, mapSeed);
  return static_cast<core::u32>(h % static_cast<core::u64>(factions_.size())) + 1u;
}

} // namespace orrery::sim
