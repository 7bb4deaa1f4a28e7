#include "pipeline/analysis_pipeline.hpp"

#include "core/time_utils.hpp"
#include "geo/cell_geometry.hpp"
#include "traffic/classifier.hpp"

#include <utility>

namespace cellwatch::pipeline {

namespace {

std::size_t CountAnomalousRows(const std::vector<traffic::ClassifiedObservation>& classified) {
  std::size_t count = 0;
  for (const auto& row : classified) {
    if (row.IsAnomalous()) {
      ++count;
    }
  }
  return count;
}

} // namespace

bool RunAnalysis(io::ITelemetrySource& source, const config::AnalysisConfig& config,
                 core::logging::Logger& logger, AnalysisResult& result, std::string& error) {
  result = AnalysisResult{};

  std::vector<traffic::TrafficObservation> observations;
  if (!source.LoadTraffic(observations, error)) {
    return false;
  }
  result.traffic_rows = observations.size();
  logger.Info("traffic loaded", {{"source", source.Describe()},
                                 {"rows", std::to_string(observations.size())}});

  std::vector<geo::CellGeometry> geometry_rows;
  if (!source.LoadGeometry(geometry_rows, error)) {
    return false;
  }
  result.geometry_rows = geometry_rows.size();

  geo::GeometryTable geometry;
  if (!geo::GeometryTable::Build(std::move(geometry_rows), geometry, error)) {
    error = "invalid geometry: " + error;
    return false;
  }
  logger.Info("geometry loaded", {{"cells", std::to_string(geometry.Size())}});

  if (!traffic::ClassifyTraffic(observations, config.classification, result.classified, error)) {
    error = "classification failed: " + error;
    return false;
  }
  logger.Info("traffic classified",
              {{"rows", std::to_string(result.classified.size())},
               {"anomalous_rows", std::to_string(CountAnomalousRows(result.classified))},
               {"window", std::to_string(config.classification.classification_window)}});

  if (!traffic::SelectAnomalousCells(result.classified, config.sustained, result.selection,
                                     error)) {
    error = "sustained-anomaly selection failed: " + error;
    return false;
  }
  if (result.classified.empty()) {
    logger.Warn("traffic input is empty; nothing to analyze");
  } else {
    logger.Info("sustained anomalies selected",
                {{"cells", std::to_string(result.selection.anomalous_cells.size())},
                 {"horizon_start", core::FormatTelemetryDateTime(result.selection.horizon_start)},
                 {"horizon_end", core::FormatTelemetryDateTime(result.selection.horizon_end)}});
  }
  for (const auto& anomaly : result.selection.anomalies) {
    logger.Debug("anomalous cell",
                 {{"cell_id", anomaly.cell_id},
                  {"peak_cs_count", std::to_string(anomaly.peak_cs_count)},
                  {"peak_data_count", std::to_string(anomaly.peak_data_count)}});
  }

  result.aggregation = neighbors::AggregateNeighbors(
      result.classified, result.selection.anomalous_cells, geometry, config.coverage);
  for (const auto& cell_id : result.aggregation.cells_without_geometry) {
    logger.Warn("anomalous cell has no geometry row; neighbors skipped", {{"cell_id", cell_id}});
  }

  result.combined = neighbors::BuildCombinedTraffic(result.selection.anomalous_history,
                                                    result.aggregation.neighbor_traffic);
  logger.Info("neighbors resolved",
              {{"relations", std::to_string(result.aggregation.relations.size())},
               {"involved_cells", std::to_string(result.aggregation.involved_geometry.size())},
               {"combined_rows", std::to_string(result.combined.size())}});
  return true;
}

} // namespace cellwatch::pipeline
