#include "orrery/proc/GalaxyGenerator.h"

#include "orrery/core/Random.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace orrery::proc {

static core::u64 sectorHash(core::u64 base, const sim::SectorCoord& c) {
  core::u64 h = core::hashCombine(base, static_cast<core::u64>(static_cast<core::u32>(c.x)));
  h = core::hashCombine(h, static_cast<core::u64>(static_cast<core::u32>(c.y)));
  return core::hashCombine(h, static_cast<core::u64>(static_cast<core::u32>(c.z)));
}

// Floors into the i32 range. NaN maps to sector 0.
static core::i32 sectorIndex(double v) {
  if (std::isnan(v)) return 0;
  const double f = std::floor(v);
  constexpr double lo = static_cast<double>(std::numeric_limits<core::i32>::min());
  constexpr double hi = static_cast<double>(std::numeric_limits<core::i32>::max());
  return static_cast<core::i32>(std::clamp(f, lo, hi));
}

static bool neighborLess(const NeighborSystem& a, const NeighborSystem& b) {
  if (a.distanceLy != b.distanceLy) return a.distanceLy < b.distanceLy;
  return a.coordinates < b.coordinates;
}

GalaxyGenerator::GalaxyGenerator(core::u64 seed, GalaxyParams params)
: seed_(seed), params_(params) {
  if (!(params_.sectorSizeLy > 0.0)) params_.sectorSizeLy = 10.0;
  params_.maxSystemsPerSector = std::max(0, params_.maxSystemsPerSector);
  params_.factionCount = std::max(1, params_.factionCount);
}

sim::SectorCoord GalaxyGenerator::sectorOf(const math::Vec3d& posLy) const {
  const double s = params_.sectorSizeLy;
  return sim::SectorCoord{
    sectorIndex(posLy.x / s),
    sectorIndex(posLy.y / s),
    sectorIndex(posLy.z / s),
  };
}

double GalaxyGenerator::meanSystemsInSector(const sim::SectorCoord& sector) const {
  const double s = params_.sectorSizeLy;
  const double cx = (static_cast<double>(sector.x) + 0.5) * s;
  const double cy = (static_cast<double>(sector.y) + 0.5) * s;
  const double cz = (static_cast<double>(sector.z) + 0.5) * s;

  const double r = std::sqrt(cx*cx + cz*cz);
  if (r > params_.radiusLy || std::abs(cy) > params_.radiusLy) return 0.0;

  const double radial = std::exp(-r / std::max(1.0, params_.radialScaleLengthLy));
  const double vertical = std::exp(-std::abs(cy) / std::max(1.0, params_.verticalScaleHeightLy));
  return std::max(0.0, params_.baseMeanSystemsPerSector) * radial * vertical;
}

core::u32 GalaxyGenerator::systemCountInSector(const sim::SectorCoord& sector) const {
  const double mean = meanSystemsInSector(sector);
  if (mean <= 0.0) return 0;

  core::SplitMix64 rng(sectorHash(core::deriveSeed(seed_, "sector"), sector));
  const double whole = std::floor(mean);
  int count = static_cast<int>(whole);
  if (rng.nextDouble() < (mean - whole)) ++count;

  return static_cast<core::u32>(std::clamp(count, 0, params_.maxSystemsPerSector));
}

core::i64 GalaxyGenerator::populatedSectorLimit() const {
  const double limit = std::ceil(std::max(0.0, params_.radiusLy) / params_.sectorSizeLy) + 1.0;
  return std::min<core::i64>(static_cast<core::i64>(std::min(limit, 2147483647.0)),
                             std::numeric_limits<core::i32>::max());
}

bool GalaxyGenerator::isValid(const sim::StarSystemCoordinates& coords) const {
  return coords.localIndex < systemCountInSector(coords.sector);
}

core::u64 GalaxyGenerator::systemSeed(const sim::StarSystemCoordinates& coords) const {
  const core::u64 h = sectorHash(core::deriveSeed(seed_, "system"), coords.sector);
  return core::hashCombine(h, static_cast<core::u64>(coords.localIndex));
}

math::Vec3d GalaxyGenerator::galacticPosition(const sim::StarSystemCoordinates& coords) const {
  core::SplitMix64 rng(core::deriveSeed(systemSeed(coords), "position"));
  const double jx = rng.nextDouble();
  const double jy = rng.nextDouble();
  const double jz = rng.nextDouble();

  const double s = params_.sectorSizeLy;
  return {
    (static_cast<double>(coords.sector.x) + jx) * s,
    (static_cast<double>(coords.sector.y) + jy) * s,
    (static_cast<double>(coords.sector.z) + jz) * s,
  };
}

std::vector<NeighborSystem> GalaxyGenerator::querySphere(const math::Vec3d& posLy, double radiusLy) const {
  std::vector<NeighborSystem> out;
  if (!(radiusLy >= 0.0)) return out;

  const math::Vec3d r{radiusLy, radiusLy, radiusLy};
  const sim::SectorCoord lo = sectorOf(posLy - r);
  const sim::SectorCoord hi = sectorOf(posLy + r);

  // Sectors outside the populated cube are empty; never walk them.
  const core::i64 limit = populatedSectorLimit();
  const core::i64 x0 = std::max<core::i64>(lo.x, -limit), x1 = std::min<core::i64>(hi.x, limit);
  const core::i64 y0 = std::max<core::i64>(lo.y, -limit), y1 = std::min<core::i64>(hi.y, limit);
  const core::i64 z0 = std::max<core::i64>(lo.z, -limit), z1 = std::min<core::i64>(hi.z, limit);
  if (x0 > x1 || y0 > y1 || z0 > z1) return out;

  for (core::i64 z = z0; z <= z1; ++z) {
    for (core::i64 y = y0; y <= y1; ++y) {
      for (core::i64 x = x0; x <= x1; ++x) {
        const sim::SectorCoord sector{static_cast<core::i32>(x), static_cast<core::i32>(y), static_cast<core::i32>(z)};
        const core::u32 n = systemCountInSector(sector);
        for (core::u32 i = 0; i < n; ++i) {
          const sim::StarSystemCoordinates c{sector, i};
          const math::Vec3d p = galacticPosition(c);
          const double d = math::distance(p, posLy);
          if (d <= radiusLy) out.push_back(NeighborSystem{c, p, d});
        }
      }
    }
  }

  std::sort(out.begin(), out.end(), neighborLess);
  return out;
}

std::vector<NeighborSystem> GalaxyGenerator::neighbors(const sim::StarSystemCoordinates& origin, double radiusLy) const {
  auto out = querySphere(galacticPosition(origin), radiusLy);
  out.erase(std::remove_if(out.begin(), out.end(),
                           [&](const NeighborSystem& n) { return n.coordinates == origin; }),
            out.end());
  return out;
}

std::optional<NeighborSystem> GalaxyGenerator::findNearestSystem(const math::Vec3d& posLy, double maxRadiusLy) const {
  // Grow the search shell so dense regions stay cheap.
  double r = std::min(maxRadiusLy, params_.sectorSizeLy);
  while (r > 0.0) {
    const auto hits = querySphere(posLy, r);
    if (!hits.empty()) return hits.front();
    if (r >= maxRadiusLy) break;
    r = std::min(maxRadiusLy, r * 2.0);
  }
  return std::nullopt;
}

} // namespace orrery::proc
