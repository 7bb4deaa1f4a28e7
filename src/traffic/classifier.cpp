#include "traffic/classifier.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace cellwatch::traffic {

namespace {

// Below this relative spread the incremental m2 may be dominated by eviction
// round-off, so the window is recomputed from its samples.
constexpr double kRecomputeRelativeVariance = 1e-8;

// 7 weekdays x 24 hours; one rolling window per slot of the current cell.
int SlotKey(const core::TimeOfWeek& slot) {
  return slot.weekday * 24 + slot.hour;
}

bool ValidateObservation(const TrafficObservation& observation, std::string& error) {
  if (observation.cell_id.empty()) {
    error = "traffic row has an empty cell_id";
    return false;
  }
  if (!std::isfinite(observation.traffic_cs) || observation.traffic_cs < 0.0) {
    error = "cell '" + observation.cell_id + "' at " +
            core::FormatTelemetryDateTime(observation.timestamp) +
            ": traffic_cs must be a finite value >= 0";
    return false;
  }
  if (!std::isfinite(observation.traffic_data) || observation.traffic_data < 0.0) {
    error = "cell '" + observation.cell_id + "' at " +
            core::FormatTelemetryDateTime(observation.timestamp) +
            ": traffic_data must be a finite value >= 0";
    return false;
  }
  return true;
}

struct SlotWindows {
  explicit SlotWindows(std::size_t capacity) : cs(capacity), data(capacity) {}

  RollingWindowStats cs;
  RollingWindowStats data;
};

} // namespace

void RollingWindowStats::Push(const double value) {
  if (capacity_ > 0U && values_.size() == capacity_) {
    Remove(values_.front());
    values_.pop_front();
  }
  values_.push_back(value);
  Add(value);
}

void RollingWindowStats::Add(const double value) {
  const double n = static_cast<double>(values_.size());
  const double delta = value - mean_;
  mean_ += delta / n;
  m2_ += delta * (value - mean_);
}

void RollingWindowStats::Remove(const double value) {
  // Called while `value` is still counted in values_.
  const std::size_t count_before = values_.size();
  if (count_before <= 1U) {
    mean_ = 0.0;
    m2_ = 0.0;
    return;
  }
  const double remaining = static_cast<double>(count_before - 1U);
  const double mean_after = mean_ - (value - mean_) / remaining;
  m2_ -= (value - mean_) * (value - mean_after);
  mean_ = mean_after;
  if (m2_ < 0.0) {
    m2_ = 0.0;
  }
}

double RollingWindowStats::StdDev() const {
  if (values_.size() < 2U) {
    return 0.0;
  }
  const double variance = m2_ / static_cast<double>(values_.size() - 1U);
  if (variance > kRecomputeRelativeVariance * (mean_ * mean_ + 1.0)) {
    return std::sqrt(variance);
  }
  return ExactStdDev();
}

double RollingWindowStats::ExactStdDev() const {
  const double first = values_.front();
  if (std::all_of(values_.begin(), values_.end(),
                  [first](const double value) { return value == first; })) {
    return 0.0;
  }
  const double mean = std::accumulate(values_.begin(), values_.end(), 0.0) /
                      static_cast<double>(values_.size());
  double m2 = 0.0;
  for (const double value : values_) {
    m2 += (value - mean) * (value - mean);
  }
  return std::sqrt(m2 / static_cast<double>(values_.size() - 1U));
}

TrafficLabel ClassifyValue(const double value, const double mean, const double stddev,
                           const double multiplier) {
  if (!(stddev > 0.0)) {
    return TrafficLabel::kStable;
  }
  const double band = multiplier * stddev;
  if (value > mean + band) {
    return TrafficLabel::kIncrease;
  }
  if (value < mean - band) {
    return TrafficLabel::kDegradation;
  }
  return TrafficLabel::kStable;
}

bool ValidateClassifierParams(const ClassifierParams& params, std::string& error) {
  if (!std::isfinite(params.cs_multiplier) || params.cs_multiplier < 0.0) {
    error = "cs_multiplier must be a finite value >= 0";
    return false;
  }
  if (!std::isfinite(params.data_multiplier) || params.data_multiplier < 0.0) {
    error = "data_multiplier must be a finite value >= 0";
    return false;
  }
  if (params.classification_window == 0U) {
    error = "classification_window must be >= 1";
    return false;
  }
  return true;
}

bool ClassifyTraffic(const std::vector<TrafficObservation>& observations,
                     const ClassifierParams& params,
                     std::vector<ClassifiedObservation>& classified, std::string& error) {
  if (!ValidateClassifierParams(params, error)) {
    return false;
  }
  for (const auto& observation : observations) {
    if (!ValidateObservation(observation, error)) {
      return false;
    }
  }

  std::vector<std::size_t> order(observations.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(), [&](const std::size_t lhs, const std::size_t rhs) {
    const auto& a = observations[lhs];
    const auto& b = observations[rhs];
    if (a.cell_id != b.cell_id) {
      return a.cell_id < b.cell_id;
    }
    return a.timestamp < b.timestamp;
  });

  std::vector<ClassifiedObservation> output;
  output.reserve(observations.size());

  // Rows arrive grouped by cell, so slot windows are rebuilt per cell and each
  // slot's window sees its rows in timestamp order.
  std::unordered_map<int, SlotWindows> windows;
  const std::string* current_cell = nullptr;
  for (std::size_t position = 0; position < order.size(); ++position) {
    const TrafficObservation& observation = observations[order[position]];
    if (current_cell == nullptr || *current_cell != observation.cell_id) {
      windows.clear();
      current_cell = &observation.cell_id;
    } else {
      const TrafficObservation& previous = observations[order[position - 1U]];
      if (previous.timestamp == observation.timestamp) {
        error = "duplicate traffic row for cell '" + observation.cell_id + "' at " +
                core::FormatTelemetryDateTime(observation.timestamp);
        return false;
      }
    }

    const int key = SlotKey(core::UtcTimeOfWeek(observation.timestamp));
    auto it = windows.find(key);
    if (it == windows.end()) {
      it = windows.emplace(key, SlotWindows(params.classification_window)).first;
    }
    SlotWindows& slot = it->second;
    slot.cs.Push(observation.traffic_cs);
    slot.data.Push(observation.traffic_data);

    ClassifiedObservation row;
    row.observation = observation;
    row.cs.rolling_mean = slot.cs.Mean();
    row.cs.rolling_stddev = slot.cs.StdDev();
    row.cs.label = ClassifyValue(observation.traffic_cs, row.cs.rolling_mean,
                                 row.cs.rolling_stddev, params.cs_multiplier);
    row.data.rolling_mean = slot.data.Mean();
    row.data.rolling_stddev = slot.data.StdDev();
    row.data.label = ClassifyValue(observation.traffic_data, row.data.rolling_mean,
                                   row.data.rolling_stddev, params.data_multiplier);
    output.push_back(std::move(row));
  }

  classified = std::move(output);
  return true;
}

} // namespace cellwatch::traffic
