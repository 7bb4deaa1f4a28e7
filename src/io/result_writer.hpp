#pragma once

#include "config/analysis_config.hpp"
#include "geo/cell_geometry.hpp"
#include "neighbors/neighbor_aggregator.hpp"
#include "pipeline/analysis_pipeline.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cellwatch::io {

struct ArtifactPaths {
  std::filesystem::path combined_traffic_csv;
  std::filesystem::path neighbor_map_csv;
  std::filesystem::path involved_geometry_csv;
  std::filesystem::path summary_json;
};

// Emits `combined_traffic.csv`.
//
// Columns: cell_id,datetime,traffic_cs,traffic_data,cs_rolling_mean,
// cs_rolling_stddev,data_rolling_mean,data_rolling_stddev,cs_label,
// data_label,role. Header is always written, even with no rows.
bool WriteCombinedTrafficCsv(const std::vector<neighbors::CombinedTrafficRow>& rows,
                             const std::filesystem::path& output_dir,
                             std::filesystem::path& written_path, std::string& error);

// Emits `neighbor_map.csv` with columns anomaly_cell,neighbor_cell.
bool WriteNeighborMapCsv(const std::vector<neighbors::FacingRelation>& relations,
                         const std::filesystem::path& output_dir,
                         std::filesystem::path& written_path, std::string& error);

// Emits `involved_geometry.csv` in the geometry input's column layout.
bool WriteInvolvedGeometryCsv(const std::vector<geo::CellGeometry>& cells,
                              const std::filesystem::path& output_dir,
                              std::filesystem::path& written_path, std::string& error);

// Emits `summary.json`: parameters, row counts, the anomalous cells with
// their peak sustained counts, and anomalous cells lacking geometry.
bool WriteAnalysisSummaryJson(const pipeline::AnalysisResult& result,
                              const config::AnalysisConfig& config,
                              const std::filesystem::path& output_dir,
                              std::filesystem::path& written_path, std::string& error);

// Writes all four artifacts. Each file is published atomically; a failure
// stops at the first file that could not be written.
bool WriteAnalysisArtifacts(const pipeline::AnalysisResult& result,
                            const config::AnalysisConfig& config,
                            const std::filesystem::path& output_dir, ArtifactPaths& paths,
                            std::string& error);

} // namespace cellwatch::io
