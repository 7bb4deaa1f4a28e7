#include "neighbors/facing_resolver.hpp"

#include <cmath>
#include <numbers>

namespace cellwatch::neighbors {

namespace {

// Two azimuths closer than this are treated as the same sector direction.
constexpr double kAzimuthTolerance = 1e-9;

// Great-circle distance is never shorter than the meridian arc between the two
// latitudes, so this is a safe lower bound for the distance gate.
double LatitudeArcKm(const geo::CellGeometry& a, const geo::CellGeometry& b) {
  const double delta_rad = std::abs(a.latitude - b.latitude) * std::numbers::pi / 180.0;
  return delta_rad * geo::kEarthRadiusKm;
}

bool IsCoLocatedSector(const geo::CellGeometry& target, const geo::CellGeometry& candidate) {
  return candidate.site_id == target.site_id &&
         std::abs(candidate.azimuth_deg - target.azimuth_deg) <= kAzimuthTolerance;
}

bool IsFacingNeighbor(const geo::CellGeometry& target, const geo::CellGeometry& candidate,
                      const double half_beamwidth_deg) {
  if (candidate.site_id == target.site_id) {
    return false;
  }
  if (LatitudeArcKm(target, candidate) > target.max_distance_km) {
    return false;
  }
  const double distance_km =
      geo::GreatCircleDistanceKm(target.Position(), candidate.Position());
  if (distance_km > target.max_distance_km) {
    return false;
  }
  return AreMutuallyFacing(target, candidate, half_beamwidth_deg);
}

} // namespace

bool AreMutuallyFacing(const geo::CellGeometry& a, const geo::CellGeometry& b,
                       const double half_beamwidth_deg) {
  // The forward and reverse great-circle bearings are computed separately;
  // they are only approximately 180 degrees apart.
  const double a_to_b = geo::Bearing(a.latitude, a.longitude, b.latitude, b.longitude);
  const double b_to_a = geo::Bearing(b.latitude, b.longitude, a.latitude, a.longitude);
  return geo::WithinCoverage(a_to_b, a.azimuth_deg, half_beamwidth_deg) &&
         geo::WithinCoverage(b_to_a, b.azimuth_deg, half_beamwidth_deg);
}

FacingCellsResult FindFacingCells(const geo::GeometryTable& table,
                                  const std::string_view target_cell_id,
                                  const FacingOptions& options) {
  FacingCellsResult result;
  const auto target_index = table.IndexOf(target_cell_id);
  if (!target_index.has_value()) {
    result.status = ResolveStatus::kTargetNotFound;
    return result;
  }

  result.status = ResolveStatus::kResolved;
  const auto& rows = table.Rows();
  const geo::CellGeometry& target = rows[*target_index];

  // Both rules are tested per row, so a cell matching both is emitted once.
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (i == *target_index) {
      continue;
    }
    const geo::CellGeometry& candidate = rows[i];
    if (IsCoLocatedSector(target, candidate) ||
        IsFacingNeighbor(target, candidate, options.half_beamwidth_deg)) {
      result.neighbors.push_back(candidate);
    }
  }
  return result;
}

BatchFacingResult FindFacingCellsBatch(const geo::GeometryTable& table,
                                       const std::vector<std::string>& target_cell_ids,
                                       const FacingOptions& options) {
  BatchFacingResult batch;
  batch.targets.reserve(target_cell_ids.size());
  batch.neighbors.reserve(target_cell_ids.size());

  for (const auto& target : target_cell_ids) {
    FacingCellsResult result = FindFacingCells(table, target, options);
    if (result.status == ResolveStatus::kTargetNotFound) {
      batch.unknown_targets.push_back(target);
      continue;
    }
    batch.targets.push_back(target);
    batch.neighbors.push_back(std::move(result.neighbors));
  }
  return batch;
}

} // namespace cellwatch::neighbors
