#pragma once

#include "traffic/observation.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace cellwatch::traffic {

struct SustainedParams {
  // Trailing horizon in hours; also the row count of the per-cell trailing
  // sum (telemetry is hourly).
  std::size_t anomaly_window_hours = 24;
  std::size_t min_anomalies = 3;
};

// A cell whose anomalous-slot count reached min_anomalies inside the
// evaluation window, for CS, DATA or both.
struct SustainedAnomaly {
  std::string cell_id;
  std::chrono::system_clock::time_point window_start{};
  std::chrono::system_clock::time_point window_end{};
  // First row at which either signal's trailing count reached the threshold.
  std::chrono::system_clock::time_point first_qualified_at{};
  std::size_t peak_cs_count = 0;
  std::size_t peak_data_count = 0;
  bool cs_qualified = false;
  bool data_qualified = false;
};

struct AnomalySelection {
  std::chrono::system_clock::time_point horizon_start{};
  std::chrono::system_clock::time_point horizon_end{};
  // Sorted, unique.
  std::vector<std::string> anomalous_cells;
  // Parallel to anomalous_cells.
  std::vector<SustainedAnomaly> anomalies;
  // Full, unfiltered history of every anomalous cell, ordered by
  // (cell_id, timestamp); downstream plots need the context around the slots.
  std::vector<ClassifiedObservation> anomalous_history;
};

// Selects cells with sustained anomalies.
//
// 1. horizon = [max timestamp - anomaly_window_hours, max timestamp], global
//    across all cells, both ends inclusive.
// 2. per cell and signal, the trailing sum of AnomalyIndicator over the most
//    recent anomaly_window_hours rows inside the horizon.
// 3. a cell qualifies when any trailing sum of either signal reaches
//    min_anomalies.
//
// Empty input yields an empty selection. Returns false and sets `error` only
// for invalid params.
bool SelectAnomalousCells(const std::vector<ClassifiedObservation>& classified,
                          const SustainedParams& params, AnomalySelection& selection,
                          std::string& error);

bool ValidateSustainedParams(const SustainedParams& params, std::string& error);

} // namespace cellwatch::traffic
