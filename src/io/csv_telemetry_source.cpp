#include "io/csv_telemetry_source.hpp"

#include "core/csv_utils.hpp"
#include "core/time_utils.hpp"

#include <fstream>
#include <string_view>
#include <utility>

namespace fs = std::filesystem;

namespace cellwatch::io {

namespace {

// `width` receives the header's column count; every record must match it.
bool ReadHeader(std::istream& input, const std::string& source_name,
                const std::vector<std::string_view>& required, std::vector<std::size_t>& indices,
                std::size_t& width, std::string& error) {
  std::string header;
  if (!std::getline(input, header)) {
    error = source_name + ": file is empty (expected a header row)";
    return false;
  }
  core::csv::TrimTrailingCarriageReturn(header);
  // Tolerate a UTF-8 byte-order mark written by spreadsheet exports.
  if (header.rfind("\xEF\xBB\xBF", 0) == 0U) {
    header.erase(0, 3);
  }

  std::vector<std::string> names;
  std::string split_error;
  if (!core::csv::SplitLine(header, names, split_error)) {
    error = source_name + " line 1: " + split_error;
    return false;
  }
  width = names.size();

  std::string missing;
  if (!core::csv::ResolveColumns(names, required, indices, missing)) {
    error = source_name + ": header is missing required column '" + missing + "'";
    return false;
  }
  return true;
}

std::string LineContext(const std::string& source_name, std::size_t line_number) {
  return source_name + " line " + std::to_string(line_number) + ": ";
}

bool SplitRecord(const std::string& line, std::size_t width, const std::string& context,
                 std::vector<std::string>& columns, std::string& error) {
  std::string split_error;
  if (!core::csv::SplitLine(line, columns, split_error)) {
    error = context + split_error;
    return false;
  }
  if (columns.size() != width) {
    error = context + "expected " + std::to_string(width) + " columns, got " +
            std::to_string(columns.size());
    return false;
  }
  return true;
}

bool ReadNumber(const std::vector<std::string>& columns, std::size_t index,
                std::string_view column_name, const std::string& context, double& value,
                std::string& error) {
  if (columns[index].empty()) {
    error = context + "missing value for " + std::string(column_name);
    return false;
  }
  if (!core::csv::ParseDouble(columns[index], value)) {
    error = context + "invalid numeric value for " + std::string(column_name) + ": '" +
            columns[index] + "'";
    return false;
  }
  return true;
}

} // namespace

CsvTelemetrySource::CsvTelemetrySource(fs::path traffic_csv, fs::path geometry_csv)
    : traffic_csv_(std::move(traffic_csv)), geometry_csv_(std::move(geometry_csv)) {}

std::string CsvTelemetrySource::Describe() const {
  return "csv";
}

bool CsvTelemetrySource::LoadTraffic(std::vector<traffic::TrafficObservation>& rows,
                                     std::string& error) {
  std::ifstream input(traffic_csv_, std::ios::binary);
  if (!input) {
    error = "unable to open traffic csv: " + traffic_csv_.string();
    return false;
  }
  return ParseTrafficCsv(input, traffic_csv_.string(), rows, error);
}

bool CsvTelemetrySource::LoadGeometry(std::vector<geo::CellGeometry>& rows, std::string& error) {
  std::ifstream input(geometry_csv_, std::ios::binary);
  if (!input) {
    error = "unable to open geometry csv: " + geometry_csv_.string();
    return false;
  }
  return ParseGeometryCsv(input, geometry_csv_.string(), rows, error);
}

bool ParseTrafficCsv(std::istream& input, const std::string& source_name,
                     std::vector<traffic::TrafficObservation>& rows, std::string& error) {
  std::vector<std::size_t> col;
  std::size_t width = 0;
  if (!ReadHeader(input, source_name, {"cell_id", "datetime", "traffic_cs", "traffic_data"}, col,
                  width, error)) {
    return false;
  }

  std::vector<traffic::TrafficObservation> parsed;
  std::string line;
  std::size_t line_number = 1;

  while (std::getline(input, line)) {
    ++line_number;
    core::csv::TrimTrailingCarriageReturn(line);
    if (line.empty()) {
      continue;
    }

    const std::string context = LineContext(source_name, line_number);
    std::vector<std::string> columns;
    if (!SplitRecord(line, width, context, columns, error)) {
      return false;
    }

    traffic::TrafficObservation row;
    row.cell_id = columns[col[0]];
    if (row.cell_id.empty()) {
      error = context + "missing value for cell_id";
      return false;
    }

    const auto timestamp = core::ParseTelemetryDateTime(columns[col[1]]);
    if (!timestamp.has_value()) {
      error = context + "invalid datetime '" + columns[col[1]] +
              "' (expected YYYY-MM-DD HH:MM:SS)";
      return false;
    }
    row.timestamp = *timestamp;

    if (!ReadNumber(columns, col[2], "traffic_cs", context, row.traffic_cs, error) ||
        !ReadNumber(columns, col[3], "traffic_data", context, row.traffic_data, error)) {
      return false;
    }
    if (row.traffic_cs < 0.0 || row.traffic_data < 0.0) {
      error = context + "traffic volumes must be >= 0";
      return false;
    }

    parsed.push_back(std::move(row));
  }

  if (input.bad()) {
    error = source_name + ": read failure";
    return false;
  }

  rows = std::move(parsed);
  return true;
}

bool ParseGeometryCsv(std::istream& input, const std::string& source_name,
                      std::vector<geo::CellGeometry>& rows, std::string& error) {
  std::vector<std::size_t> col;
  std::size_t width = 0;
  if (!ReadHeader(input, source_name,
                  {"cell_id", "site_id", "latitude", "longitude", "azimuth", "max_distance_km"},
                  col, width, error)) {
    return false;
  }

  std::vector<geo::CellGeometry> parsed;
  std::string line;
  std::size_t line_number = 1;
  while (std::getline(input, line)) {
    ++line_number;
    core::csv::TrimTrailingCarriageReturn(line);
    if (line.empty()) {
      continue;
    }

    const std::string context = LineContext(source_name, line_number);
    std::vector<std::string> columns;
    if (!SplitRecord(line, width, context, columns, error)) {
      return false;
    }

    geo::CellGeometry cell;
    cell.cell_id = columns[col[0]];
    cell.site_id = columns[col[1]];
    if (!ReadNumber(columns, col[2], "latitude", context, cell.latitude, error) ||
        !ReadNumber(columns, col[3], "longitude", context, cell.longitude, error) ||
        !ReadNumber(columns, col[4], "azimuth", context, cell.azimuth_deg, error) ||
        !ReadNumber(columns, col[5], "max_distance_km", context, cell.max_distance_km, error)) {
      return false;
    }

    parsed.push_back(std::move(cell));
  }

  if (input.bad()) {
    error = source_name + ": read failure";
    return false;
  }

  rows = std::move(parsed);
  return true;
}

} // namespace cellwatch::io
