#pragma once

#include "geo/cell_geometry.hpp"
#include "neighbors/facing_resolver.hpp"
#include "traffic/observation.hpp"

#include <string>
#include <vector>

namespace cellwatch::neighbors {

// Directed pair: `neighbor_cell` faces `anomaly_cell`.
struct FacingRelation {
  std::string anomaly_cell;
  std::string neighbor_cell;

  bool operator==(const FacingRelation& other) const = default;
};

struct NeighborAggregation {
  // One entry per (anomaly, neighbor) pair, in anomaly order then geometry order.
  std::vector<FacingRelation> relations;
  // Geometry of every anomaly and neighbor cell, deduplicated, geometry order.
  std::vector<geo::CellGeometry> involved_geometry;
  // Classified rows of every neighbor cell, ordered by (cell_id, timestamp).
  std::vector<traffic::ClassifiedObservation> neighbor_traffic;
  // Anomalous cells with no geometry row; they get no neighbors.
  std::vector<std::string> cells_without_geometry;
};

// Resolves facing neighbors for every anomalous cell and pulls the neighbors'
// traffic from `classified`. An empty `anomalous_cells` yields empty tables.
NeighborAggregation AggregateNeighbors(const std::vector<traffic::ClassifiedObservation>& classified,
                                       const std::vector<std::string>& anomalous_cells,
                                       const geo::GeometryTable& geometry,
                                       const FacingOptions& options = {});

enum class TrafficRole {
  kAnomaly,
  kNeighbor,
};

const char* ToString(TrafficRole role);

struct CombinedTrafficRow {
  traffic::ClassifiedObservation row;
  TrafficRole role = TrafficRole::kAnomaly;
};

// Union of the anomalous cells' own history and their neighbors' traffic,
// deduplicated on (cell_id, timestamp) and ordered by (cell_id, timestamp).
// A cell that is both anomalous and a neighbor of another anomaly is tagged
// kAnomaly.
std::vector<CombinedTrafficRow>
BuildCombinedTraffic(const std::vector<traffic::ClassifiedObservation>& anomalous_history,
                     const std::vector<traffic::ClassifiedObservation>& neighbor_traffic);

} // namespace cellwatch::neighbors
