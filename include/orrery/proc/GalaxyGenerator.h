#pragma once

#include "orrery/core/Types.h"
#include "orrery/math/Vec3.h"
#include "orrery/sim/Coordinates.h"

#include <optional>
#include <vector>

namespace orrery::proc {

struct GalaxyParams {
  double sectorSizeLy{10.0};              // edge length of a sector cube
  double radiusLy{50000.0};               // disc radius; sectors beyond it (or this far off the plane) are empty
  double radialScaleLengthLy{15000.0};    // exponential falloff in the disc plane
  double verticalScaleHeightLy{300.0};    // exponential falloff above/below the plane (y axis)
  double baseMeanSystemsPerSector{0.5};   // at the galactic centre
  int maxSystemsPerSector{16};
  int factionCount{4};
};

// A system found by a spatial query.
struct NeighborSystem {
  sim::StarSystemCoordinates coordinates{};
  math::Vec3d positionLy{};
  double distanceLy{0.0};
};

// Pure functions of (universe seed, params, coordinates). Nothing is cached here.
class GalaxyGenerator {
public:
  GalaxyGenerator(core::u64 seed, GalaxyParams params);

  core::u64 seed() const { return seed_; }
  const GalaxyParams& params() const { return params_; }

  // Clamped to the i32 sector range.
  sim::SectorCoord sectorOf(const math::Vec3d& posLy) const;

  // Largest |sector index| on any axis that can hold a system.
  core::i64 populatedSectorLimit() const;

  // Expected number of systems in a sector, from its centre position.
  double meanSystemsInSector(const sim::SectorCoord& sector) const;
  core::u32 systemCountInSector(const sim::SectorCoord& sector) const;

  bool isValid(const sim::StarSystemCoordinates& coords) const;

  core::u64 systemSeed(const sim::StarSystemCoordinates& coords) const;

  // Light-years. Always inside the system's own sector.
  math::Vec3d galacticPosition(const sim::StarSystemCoordinates& coords) const;

  // Every valid system within `radiusLy` of `posLy`, sorted by distance then coordinates.
  // Only sectors within populatedSectorLimit() are visited.
  std::vector<NeighborSystem> querySphere(const math::Vec3d& posLy, double radiusLy) const;

  // As querySphere() around `origin`, excluding `origin` itself.
  std::vector<NeighborSystem> neighbors(const sim::StarSystemCoordinates& origin, double radiusLy) const;

  std::optional<NeighborSystem> findNearestSystem(const math::Vec3d& posLy, double maxRadiusLy) const;

private:
  core::u64 seed_{0};
  GalaxyParams params_{};
};

} // namespace orrery::proc
