#include "orrery/proc/NameGenerator.h"

#include <array>
#include <cctype>
#include <string>

namespace orrery::proc {

static const std::array<const char*, 32> kSyllA = {
  "al","an","ar","as","be","ca","ce","da","de","el","en","er","es","fa","fi","ga",
  "ha","he","ia","in","is","ka","ke","la","le","li","ma","me","na","ne","or","ra"
};

static const std::array<const char*, 32> kSyllB = {
  "bar","bel","car","cer","dan","del","dor","far","fen","gar","gen","hal","hel","ian","iel","jor",
  "kal","kel","lar","len","mir","nal","ner","nor","par","pel","ran","rel","sar","sel","tor","ven"
};

static const std::array<const char*, 24> kSyllC = {
  "a","e","i","o","u","ae","ia","io","oa","ul","ur","on","en","is","as","os","ar","or","ir","ium","ara","ora","eus","is"
};

static const std::array<const char*, 12> kRomans = {
  "I","II","III","IV","V","VI","VII","VIII","IX","X","XI","XII"
};

static const std::array<const char*, 24> kGreek = {
  "Alpha","Beta","Gamma","Delta","Epsilon","Zeta","Eta","Theta","Iota","Kappa",
  "Lambda","Mu","Nu","Xi","Omicron","Pi","Rho","Sigma","Tau","Upsilon",
  "Phi","Chi","Psi","Omega"
};

static const std::array<const char*, 6> kAnomalyWords = {
  "Veil","Knot","Spiral","Lattice","Bloom","Echo"
};

static std::string capitalize(std::string s) {
  if (!s.empty()) {
    s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
  }
  return s;
}

std::string NameGenerator::systemName() {
  return makeName(rng_, 2, 3);
}

std::string NameGenerator::makeName(core::SplitMix64& rng, int minSyllables, int maxSyllables) const {
  const int parts = rng.range(minSyllables, maxSyllables);
  std::string s;

  for (int i = 2; i < parts; ++i) s += rng.pick(kSyllA);
  s += rng.pick(kSyllB);
  s += rng.pick(kSyllC);

  return capitalize(s);
}

std::string NameGenerator::planetName(const std::string& sys, int index) const {
  const int r = (index >= 0) ? (index % static_cast<int>(kRomans.size())) : 0;
  return sys + " " + kRomans[static_cast<std::size_t>(r)];
}

std::string NameGenerator::satelliteName(const std::string& planet, int index) const {
  const int i = (index >= 0) ? (index % 26) : 0;
  return planet + static_cast<char>('a' + i);
}

std::string NameGenerator::stationName(const std::string& sys, int index) const {
  const int g = (index >= 0) ? (index % static_cast<int>(kGreek.size())) : 0;
  return sys + " Station " + kGreek[static_cast<std::size_t>(g)];
}

std::string NameGenerator::elevatorName(const std::string& planet) const {
  return planet + " Elevator";
}

std::string NameGenerator::anomalyName(const std::string& sys, int index) {
  return sys + " " + rng_.pick(kAnomalyWords) + " " + std::to_string(index + 1);
}

} // namespace orrery::proc
