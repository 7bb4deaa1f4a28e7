#pragma once

#include "traffic/observation.hpp"

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace cellwatch::traffic {

struct ClassifierParams {
  double cs_multiplier = 2.0;
  double data_multiplier = 2.0;
  // Count of trailing same-time-of-week samples, current row included.
  std::size_t classification_window = 4;
};

// Bounded trailing window with incremental mean/variance (Welford's update
// plus its inverse for evictions). Variance is the sample variance (n - 1).
class RollingWindowStats {
public:
  explicit RollingWindowStats(std::size_t capacity) : capacity_(capacity) {}

  // Appends `value`, evicting the oldest sample once the window is full.
  void Push(double value);

  std::size_t Count() const {
    return values_.size();
  }

  double Mean() const {
    return mean_;
  }

  // 0 when fewer than two samples are held or every held sample is equal.
  // Very small incremental spreads are recomputed from the held samples.
  double StdDev() const;

private:
  double ExactStdDev() const;
  void Add(double value);
  void Remove(double value);

  std::size_t capacity_ = 1;
  std::deque<double> values_;
  double mean_ = 0.0;
  double m2_ = 0.0;
};

// Three-way threshold with strict inequalities: a value exactly on
// mean +/- multiplier * stddev is STABLE. stddev <= 0 always yields STABLE.
TrafficLabel ClassifyValue(double value, double mean, double stddev, double multiplier);

// Classifies every observation against the rolling baseline of its
// (cell, UTC weekday, UTC hour) partition, ordered by timestamp and limited
// to the trailing `classification_window` rows of that partition.
//
// Contract:
// - input order is irrelevant; output is ordered by (cell_id, timestamp).
// - traffic volumes must be finite and >= 0.
// - duplicate (cell_id, timestamp) rows are rejected.
// - returns false and populates `error` on invalid params or input rows.
bool ClassifyTraffic(const std::vector<TrafficObservation>& observations,
                     const ClassifierParams& params, std::vector<ClassifiedObservation>& classified,
                     std::string& error);

bool ValidateClassifierParams(const ClassifierParams& params, std::string& error);

} // namespace cellwatch::traffic
