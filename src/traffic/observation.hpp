#pragma once

#include <chrono>
#include <string>

namespace cellwatch::traffic {

// One hourly telemetry row for a cell, already cleaned by the upstream
// preprocessing step. Volumes are non-negative.
struct TrafficObservation {
  std::string cell_id;
  std::chrono::system_clock::time_point timestamp{};
  double traffic_cs = 0.0;
  double traffic_data = 0.0;
};

enum class TrafficLabel {
  kStable,
  kIncrease,
  kDegradation,
};

// Stable wire names used in CSV/JSON artifacts.
const char* ToString(TrafficLabel label);

// STABLE counts as 0; INCREASE and DEGRADATION both count as one anomalous slot.
constexpr int AnomalyIndicator(TrafficLabel label) {
  switch (label) {
  case TrafficLabel::kStable:
    return 0;
  case TrafficLabel::kIncrease:
  case TrafficLabel::kDegradation:
    return 1;
  }
  return 0;
}

// Rolling baseline of one signal at one row.
struct SignalStats {
  double rolling_mean = 0.0;
  double rolling_stddev = 0.0;
  TrafficLabel label = TrafficLabel::kStable;
};

struct ClassifiedObservation {
  TrafficObservation observation;
  SignalStats cs;
  SignalStats data;

  bool IsAnomalous() const {
    return AnomalyIndicator(cs.label) != 0 || AnomalyIndicator(data.label) != 0;
  }
};

} // namespace cellwatch::traffic
