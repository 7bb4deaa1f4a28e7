#include "io/result_writer.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <chrono>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace cellwatch::io {

namespace {

// Identifiers are written as-is unless they would break the row.
std::string CsvField(std::string_view raw) {
  if (raw.find_first_of(",\"\n\r") == std::string_view::npos) {
    return std::string(raw);
  }
  std::string quoted = "\"";
  for (const char c : raw) {
    if (c == '"') {
      quoted += "\"\"";
    } else {
      quoted.push_back(c);
    }
  }
  quoted.push_back('"');
  return quoted;
}

bool PublishCsv(const fs::path& output_dir, std::string_view file_name, const std::string& text,
                fs::path& written_path, std::string& error) {
  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / file_name;
  return core::WriteTextFileAtomic(written_path, text, error);
}

std::string JsonStringArray(const std::vector<std::string>& values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i != 0U) {
      out << ", ";
    }
    out << "\"" << core::EscapeJson(values[i]) << "\"";
  }
  out << "]";
  return out.str();
}

} // namespace

bool WriteCombinedTrafficCsv(const std::vector<neighbors::CombinedTrafficRow>& rows,
                             const fs::path& output_dir, fs::path& written_path,
                             std::string& error) {
  std::ostringstream out;
  out << "cell_id,datetime,traffic_cs,traffic_data,cs_rolling_mean,cs_rolling_stddev,"
         "data_rolling_mean,data_rolling_stddev,cs_label,data_label,role\n";
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (const auto& entry : rows) {
    const auto& row = entry.row;
    out << CsvField(row.observation.cell_id) << ","
        << core::FormatTelemetryDateTime(row.observation.timestamp) << ","
        << row.observation.traffic_cs << ","
        << row.observation.traffic_data << ","
        << row.cs.rolling_mean << ","
        << row.cs.rolling_stddev << ","
        << row.data.rolling_mean << ","
        << row.data.rolling_stddev << ","
        << traffic::ToString(row.cs.label) << ","
        << traffic::ToString(row.data.label) << ","
        << neighbors::ToString(entry.role) << "\n";
  }
  return PublishCsv(output_dir, "combined_traffic.csv", out.str(), written_path, error);
}

bool WriteNeighborMapCsv(const std::vector<neighbors::FacingRelation>& relations,
                         const fs::path& output_dir, fs::path& written_path, std::string& error) {
  std::ostringstream out;
  out << "anomaly_cell,neighbor_cell\n";
  for (const auto& relation : relations) {
    out << CsvField(relation.anomaly_cell) << "," << CsvField(relation.neighbor_cell) << "\n";
  }
  return PublishCsv(output_dir, "neighbor_map.csv", out.str(), written_path, error);
}

bool WriteInvolvedGeometryCsv(const std::vector<geo::CellGeometry>& cells,
                              const fs::path& output_dir, fs::path& written_path,
                              std::string& error) {
  std::ostringstream out;
  out << "cell_id,site_id,latitude,longitude,azimuth,max_distance_km\n";
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (const auto& cell : cells) {
    out << CsvField(cell.cell_id) << ","
        << CsvField(cell.site_id) << ","
        << cell.latitude << ","
        << cell.longitude << ","
        << cell.azimuth_deg << ","
        << cell.max_distance_km << "\n";
  }
  return PublishCsv(output_dir, "involved_geometry.csv", out.str(), written_path, error);
}

bool WriteAnalysisSummaryJson(const pipeline::AnalysisResult& result,
                              const config::AnalysisConfig& config, const fs::path& output_dir,
                              fs::path& written_path, std::string& error) {
  const auto& selection = result.selection;
  const bool has_traffic = !result.classified.empty();

  std::ostringstream out;
  out << "{\n";
  out << "  \"generated_at_utc\": \""
      << core::FormatUtcTimestamp(std::chrono::system_clock::now()) << "\",\n";

  out << "  \"parameters\": {\n";
  out << "    \"cs_multiplier\": "
      << core::FormatJsonNumber(config.classification.cs_multiplier) << ",\n";
  out << "    \"data_multiplier\": "
      << core::FormatJsonNumber(config.classification.data_multiplier) << ",\n";
  out << "    \"classification_window\": " << config.classification.classification_window
      << ",\n";
  out << "    \"anomaly_window_hours\": " << config.sustained.anomaly_window_hours << ",\n";
  out << "    \"min_anomalies\": " << config.sustained.min_anomalies << ",\n";
  out << "    \"half_beamwidth_deg\": "
      << core::FormatJsonNumber(config.coverage.half_beamwidth_deg) << "\n";
  out << "  },\n";

  out << "  \"counts\": {\n";
  out << "    \"traffic_rows\": " << result.traffic_rows << ",\n";
  out << "    \"geometry_rows\": " << result.geometry_rows << ",\n";
  out << "    \"anomalous_cells\": " << selection.anomalous_cells.size() << ",\n";
  out << "    \"neighbor_relations\": " << result.aggregation.relations.size() << ",\n";
  out << "    \"involved_cells\": " << result.aggregation.involved_geometry.size() << ",\n";
  out << "    \"combined_rows\": " << result.combined.size() << "\n";
  out << "  },\n";

  if (has_traffic) {
    out << "  \"horizon\": {\"start\": \"" << core::FormatTelemetryDateTime(selection.horizon_start)
        << "\", \"end\": \"" << core::FormatTelemetryDateTime(selection.horizon_end) << "\"},\n";
  } else {
    out << "  \"horizon\": null,\n";
  }

  out << "  \"anomalous_cells\": [";
  for (std::size_t i = 0; i < selection.anomalies.size(); ++i) {
    const auto& anomaly = selection.anomalies[i];
    out << (i == 0U ? "\n" : ",\n");
    out << "    {\"cell_id\": \"" << core::EscapeJson(anomaly.cell_id) << "\""
        << ", \"first_qualified_at\": \""
        << core::FormatTelemetryDateTime(anomaly.first_qualified_at) << "\""
        << ", \"peak_cs_count\": " << anomaly.peak_cs_count
        << ", \"peak_data_count\": " << anomaly.peak_data_count
        << ", \"cs_qualified\": " << (anomaly.cs_qualified ? "true" : "false")
        << ", \"data_qualified\": " << (anomaly.data_qualified ? "true" : "false") << "}";
  }
  out << (selection.anomalies.empty() ? "],\n" : "\n  ],\n");

  out << "  \"cells_without_geometry\": "
      << JsonStringArray(result.aggregation.cells_without_geometry) << "\n";
  out << "}\n";

  if (!core::EnsureDirectory(output_dir, error)) {
    return false;
  }
  written_path = output_dir / "summary.json";
  return core::WriteTextFileAtomic(written_path, out.str(), error);
}

bool WriteAnalysisArtifacts(const pipeline::AnalysisResult& result,
                            const config::AnalysisConfig& config, const fs::path& output_dir,
                            ArtifactPaths& paths, std::string& error) {
  return WriteCombinedTrafficCsv(result.combined, output_dir, paths.combined_traffic_csv,
                                 error) &&
         WriteNeighborMapCsv(result.aggregation.relations, output_dir, paths.neighbor_map_csv,
                             error) &&
         WriteInvolvedGeometryCsv(result.aggregation.involved_geometry, output_dir,
                                  paths.involved_geometry_csv, error) &&
         WriteAnalysisSummaryJson(result, config, output_dir, paths.summary_json, error);
}

} // namespace cellwatch::io
