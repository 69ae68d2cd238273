#pragma once

#include "orrery/core/Random.h"

#include <string>

namespace orrery::proc {

// Deterministic, lightweight name generator (syllable-based).
class NameGenerator {
public:
  explicit NameGenerator(core::u64 seed = 0) : rng_(seed) {}

  void reseed(core::u64 seed) { rng_.reseed(seed); }

  std::string systemName();

  // Capitalized word of [minSyllables, maxSyllables] syllables drawn from `rng`.
  std::string makeName(core::SplitMix64& rng, int minSyllables, int maxSyllables) const;

  std::string planetName(const std::string& systemName, int index) const;
  std::string satelliteName(const std::string& planetName, int index) const;
  std::string stationName(const std::string& systemName, int index) const;
  std::string elevatorName(const std::string& planetName) const;
  std::string anomalyName(const std::string& systemName, int index);

private:
  core::SplitMix64 rng_;
};

} // namespace orrery::proc
