#pragma once

#include "config/analysis_config.hpp"
#include "core/logging/logger.hpp"
#include "io/telemetry_source.hpp"
#include "neighbors/neighbor_aggregator.hpp"
#include "traffic/observation.hpp"
#include "traffic/sustained_filter.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cellwatch::pipeline {

struct AnalysisResult {
  std::size_t traffic_rows = 0;
  std::size_t geometry_rows = 0;
  // Every input row, classified; ordered by (cell_id, timestamp).
  std::vector<traffic::ClassifiedObservation> classified;
  traffic::AnomalySelection selection;
  neighbors::NeighborAggregation aggregation;
  // Anomalous history plus neighbor traffic, tagged by role.
  std::vector<neighbors::CombinedTrafficRow> combined;
};

// Runs one batch analysis.
//
// Stages:
// 1. load traffic and geometry through `source`
// 2. validate geometry into a lookup table
// 3. classify every observation against its time-of-week baseline
// 4. select cells with sustained anomalies
// 5. resolve facing neighbors and assemble the output tables
//
// Contract:
// - `config` parameters are assumed validated; invalid values still fail here.
// - returns false and sets `error` when any stage rejects its input. No
//   partial result is meaningful in that case.
// - an empty anomalous set is a successful run with empty tables.
bool RunAnalysis(io::ITelemetrySource& source, const config::AnalysisConfig& config,
                 core::logging::Logger& logger, AnalysisResult& result, std::string& error);

} // namespace cellwatch::pipeline
