#include "neighbors/neighbor_aggregator.hpp"

#include <algorithm>
#include <chrono>
#include <set>
#include <unordered_set>
#include <utility>

namespace cellwatch::neighbors {

namespace {

bool RowLess(const traffic::ClassifiedObservation& a, const traffic::ClassifiedObservation& b) {
  if (a.observation.cell_id != b.observation.cell_id) {
    return a.observation.cell_id < b.observation.cell_id;
  }
  return a.observation.timestamp < b.observation.timestamp;
}

} // namespace

const char* ToString(const TrafficRole role) {
  switch (role) {
  case TrafficRole::kAnomaly:
    return "anomaly";
  case TrafficRole::kNeighbor:
    return "neighbor";
  }
  return "anomaly";
}

NeighborAggregation AggregateNeighbors(const std::vector<traffic::ClassifiedObservation>& classified,
                                       const std::vector<std::string>& anomalous_cells,
                                       const geo::GeometryTable& geometry,
                                       const FacingOptions& options) {
  NeighborAggregation aggregation;
  if (anomalous_cells.empty()) {
    return aggregation;
  }

  const BatchFacingResult batch = FindFacingCellsBatch(geometry, anomalous_cells, options);
  aggregation.cells_without_geometry = batch.unknown_targets;

  std::unordered_set<std::string> neighbor_ids;
  std::vector<bool> involved(geometry.Size(), false);
  for (std::size_t t = 0; t < batch.targets.size(); ++t) {
    const std::string& anomaly_cell = batch.targets[t];
    if (const auto index = geometry.IndexOf(anomaly_cell); index.has_value()) {
      involved[*index] = true;
    }
    for (const auto& neighbor : batch.neighbors[t]) {
      aggregation.relations.push_back(
          {.anomaly_cell = anomaly_cell, .neighbor_cell = neighbor.cell_id});
      neighbor_ids.insert(neighbor.cell_id);
      if (const auto index = geometry.IndexOf(neighbor.cell_id); index.has_value()) {
        involved[*index] = true;
      }
    }
  }

  for (std::size_t i = 0; i < geometry.Size(); ++i) {
    if (involved[i]) {
      aggregation.involved_geometry.push_back(geometry.Rows()[i]);
    }
  }

  for (const auto& row : classified) {
    if (neighbor_ids.count(row.observation.cell_id) != 0U) {
      aggregation.neighbor_traffic.push_back(row);
    }
  }
  std::sort(aggregation.neighbor_traffic.begin(), aggregation.neighbor_traffic.end(), RowLess);

  return aggregation;
}

std::vector<CombinedTrafficRow>
BuildCombinedTraffic(const std::vector<traffic::ClassifiedObservation>& anomalous_history,
                     const std::vector<traffic::ClassifiedObservation>& neighbor_traffic) {
  using Key = std::pair<std::string, std::chrono::system_clock::time_point>;
  std::set<Key> seen;

  std::vector<CombinedTrafficRow> combined;
  combined.reserve(anomalous_history.size() + neighbor_traffic.size());

  // Anomaly rows go first so they win the role on duplicates.
  for (const auto& row : anomalous_history) {
    if (seen.emplace(row.observation.cell_id, row.observation.timestamp).second) {
      combined.push_back({.row = row, .role = TrafficRole::kAnomaly});
    }
  }
  for (const auto& row : neighbor_traffic) {
    if (seen.emplace(row.observation.cell_id, row.observation.timestamp).second) {
      combined.push_back({.row = row, .role = TrafficRole::kNeighbor});
    }
  }

  std::stable_sort(combined.begin(), combined.end(),
                   [](const CombinedTrafficRow& a, const CombinedTrafficRow& b) {
                     return RowLess(a.row, b.row);
                   });
  return combined;
}

} // namespace cellwatch::neighbors
