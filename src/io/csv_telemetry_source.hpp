#pragma once

#include "io/telemetry_source.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace cellwatch::io {

// Reads traffic and geometry exports from CSV files.
//
// Traffic columns:  cell_id,datetime,traffic_cs,traffic_data
// Geometry columns: cell_id,site_id,latitude,longitude,azimuth,max_distance_km
//
// Columns are matched by header name; extra columns are ignored. `datetime`
// is UTC in "YYYY-MM-DD HH:MM:SS" (or with a 'T' separator). Any malformed
// row fails the whole load with a line-numbered error.
class CsvTelemetrySource final : public ITelemetrySource {
public:
  CsvTelemetrySource(std::filesystem::path traffic_csv, std::filesystem::path geometry_csv);

  std::string Describe() const override;

  bool LoadTraffic(std::vector<traffic::TrafficObservation>& rows, std::string& error) override;

  bool LoadGeometry(std::vector<geo::CellGeometry>& rows, std::string& error) override;

private:
  std::filesystem::path traffic_csv_;
  std::filesystem::path geometry_csv_;
};

// Stream-level parsers, shared with tests. `source_name` prefixes errors.
bool ParseTrafficCsv(std::istream& input, const std::string& source_name,
                     std::vector<traffic::TrafficObservation>& rows, std::string& error);

bool ParseGeometryCsv(std::istream& input, const std::string& source_name,
                      std::vector<geo::CellGeometry>& rows, std::string& error);

} // namespace cellwatch::io
