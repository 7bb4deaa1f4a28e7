#pragma once

#include "geo/cell_geometry.hpp"
#include "geo/geometry.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cellwatch::neighbors {

struct FacingOptions {
  double half_beamwidth_deg = geo::kDefaultHalfBeamwidthDeg;
};

enum class ResolveStatus {
  kResolved,
  kTargetNotFound,
};

// Outcome of one neighbor lookup. An unknown target is reported as
// kTargetNotFound with no neighbors, so callers can tell it apart from a known
// cell that simply has nobody facing it.
struct FacingCellsResult {
  ResolveStatus status = ResolveStatus::kTargetNotFound;
  std::vector<geo::CellGeometry> neighbors;
};

// Resolves the cells physically facing `target_cell_id`.
//
// A candidate is a neighbor when either:
// - mutual facing: within the target's max_distance_km, the target's cone
//   covers the candidate, the candidate's cone covers the target, and the two
//   cells are on different sites; or
// - co-location: same site_id and same azimuth as the target (one sector
//   split across hardware; the bearing test is meaningless at distance 0).
//
// The target itself is never returned. Neighbors follow geometry table order.
// Cost is one pass over the table; a latitude-band check skips candidates
// whose latitude difference alone already exceeds the distance gate.
FacingCellsResult FindFacingCells(const geo::GeometryTable& table, std::string_view target_cell_id,
                                  const FacingOptions& options = {});

struct BatchFacingResult {
  // Parallel to the resolved targets, in request order.
  std::vector<std::string> targets;
  std::vector<std::vector<geo::CellGeometry>> neighbors;
  std::vector<std::string> unknown_targets;
};

// Resolves many targets against the same table: O(targets * cells).
BatchFacingResult FindFacingCellsBatch(const geo::GeometryTable& table,
                                       const std::vector<std::string>& target_cell_ids,
                                       const FacingOptions& options = {});

// Exposed for tests: the mutual-facing predicate alone (no site or distance
// handling).
bool AreMutuallyFacing(const geo::CellGeometry& a, const geo::CellGeometry& b,
                       double half_beamwidth_deg);

} // namespace cellwatch::neighbors
