#include "traffic/sustained_filter.hpp"

#include <algorithm>
#include <deque>
#include <numeric>

namespace cellwatch::traffic {

namespace {

// Fixed-length trailing sum of 0/1 indicators.
class TrailingCounter {
public:
  explicit TrailingCounter(std::size_t length) : length_(length) {}

  std::size_t Push(int indicator) {
    window_.push_back(indicator);
    sum_ += static_cast<std::size_t>(indicator);
    if (window_.size() > length_) {
      sum_ -= static_cast<std::size_t>(window_.front());
      window_.pop_front();
    }
    return sum_;
  }

private:
  std::size_t length_ = 1;
  std::deque<int> window_;
  std::size_t sum_ = 0;
};

std::vector<std::size_t> OrderByCellAndTime(const std::vector<ClassifiedObservation>& rows) {
  std::vector<std::size_t> order(rows.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(), [&](const std::size_t lhs, const std::size_t rhs) {
    const auto& a = rows[lhs].observation;
    const auto& b = rows[rhs].observation;
    if (a.cell_id != b.cell_id) {
      return a.cell_id < b.cell_id;
    }
    return a.timestamp < b.timestamp;
  });
  return order;
}

} // namespace

bool ValidateSustainedParams(const SustainedParams& params, std::string& error) {
  if (params.anomaly_window_hours == 0U) {
    error = "anomaly_window_hours must be >= 1";
    return false;
  }
  if (params.min_anomalies == 0U) {
    error = "min_anomalies must be >= 1";
    return false;
  }
  return true;
}

bool SelectAnomalousCells(const std::vector<ClassifiedObservation>& classified,
                          const SustainedParams& params, AnomalySelection& selection,
                          std::string& error) {
  if (!ValidateSustainedParams(params, error)) {
    return false;
  }

  selection = AnomalySelection{};
  if (classified.empty()) {
    return true;
  }

  const auto latest = std::max_element(
      classified.begin(), classified.end(),
      [](const ClassifiedObservation& a, const ClassifiedObservation& b) {
        return a.observation.timestamp < b.observation.timestamp;
      });
  selection.horizon_end = latest->observation.timestamp;
  selection.horizon_start =
      selection.horizon_end -
      std::chrono::hours(static_cast<std::chrono::hours::rep>(params.anomaly_window_hours));

  const std::vector<std::size_t> order = OrderByCellAndTime(classified);

  std::size_t begin = 0;
  while (begin < order.size()) {
    const std::string& cell_id = classified[order[begin]].observation.cell_id;
    std::size_t end = begin;
    while (end < order.size() && classified[order[end]].observation.cell_id == cell_id) {
      ++end;
    }

    TrailingCounter cs_counter(params.anomaly_window_hours);
    TrailingCounter data_counter(params.anomaly_window_hours);
    SustainedAnomaly anomaly;
    anomaly.cell_id = cell_id;
    anomaly.window_start = selection.horizon_start;
    anomaly.window_end = selection.horizon_end;
    bool qualified = false;

    for (std::size_t i = begin; i < end; ++i) {
      const ClassifiedObservation& row = classified[order[i]];
      if (row.observation.timestamp < selection.horizon_start) {
        continue;
      }
      const std::size_t cs_count = cs_counter.Push(AnomalyIndicator(row.cs.label));
      const std::size_t data_count = data_counter.Push(AnomalyIndicator(row.data.label));
      anomaly.peak_cs_count = std::max(anomaly.peak_cs_count, cs_count);
      anomaly.peak_data_count = std::max(anomaly.peak_data_count, data_count);

      const bool cs_hit = cs_count >= params.min_anomalies;
      const bool data_hit = data_count >= params.min_anomalies;
      anomaly.cs_qualified = anomaly.cs_qualified || cs_hit;
      anomaly.data_qualified = anomaly.data_qualified || data_hit;
      if (!qualified && (cs_hit || data_hit)) {
        qualified = true;
        anomaly.first_qualified_at = row.observation.timestamp;
      }
    }

    if (qualified) {
      selection.anomalous_cells.push_back(cell_id);
      selection.anomalies.push_back(std::move(anomaly));
      for (std::size_t i = begin; i < end; ++i) {
        selection.anomalous_history.push_back(classified[order[i]]);
      }
    }
    begin = end;
  }

  return true;
}

} // namespace cellwatch::traffic
