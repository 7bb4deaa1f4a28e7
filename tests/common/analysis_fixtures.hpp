#ifndef CELLWATCH_TESTS_COMMON_ANALYSIS_FIXTURES_HPP_
#define CELLWATCH_TESTS_COMMON_ANALYSIS_FIXTURES_HPP_

#include "assertions.hpp"
#include "core/time_utils.hpp"
#include "geo/cell_geometry.hpp"
#include "io/telemetry_source.hpp"
#include "traffic/observation.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace cellwatch::tests::common {

// Two km east of the origin on the equator.
inline constexpr double kA2Longitude = 2.0 / 111.19508;

// A1 reports 24 weekly samples of the Monday 10:00 slot: 23 baseline values
// alternating 90/110 (mean ~100, std ~10), then 200. A2 faces A1 from 2 km
// east and carries flat traffic. FAR faces A1 from ~55 km and is out of reach.
inline std::vector<cellwatch::traffic::TrafficObservation> ScenarioTraffic() {
  const auto start = *cellwatch::core::ParseTelemetryDateTime("2024-01-01 10:00:00");
  std::vector<cellwatch::traffic::TrafficObservation> rows;
  for (int week = 0; week < 24; ++week) {
    const auto ts = start + std::chrono::hours(24 * 7 * week);
    const double a1_cs = week == 23 ? 200.0 : (week % 2 == 0 ? 90.0 : 110.0);
    rows.push_back({.cell_id = "A1", .timestamp = ts, .traffic_cs = a1_cs, .traffic_data = 10.0});
    rows.push_back({.cell_id = "A2", .timestamp = ts, .traffic_cs = 50.0, .traffic_data = 5.0});
    rows.push_back({.cell_id = "FAR", .timestamp = ts, .traffic_cs = 70.0, .traffic_data = 7.0});
  }
  return rows;
}

inline std::vector<cellwatch::geo::CellGeometry> ScenarioGeometry() {
  return {
      {.cell_id = "A1", .site_id = "S1", .latitude = 0.0, .longitude = 0.0, .azimuth_deg = 90.0,
       .max_distance_km = 5.0},
      {.cell_id = "A2", .site_id = "S2", .latitude = 0.0, .longitude = kA2Longitude,
       .azimuth_deg = 270.0, .max_distance_km = 5.0},
      {.cell_id = "FAR", .site_id = "S3", .latitude = 0.0, .longitude = 0.5, .azimuth_deg = 270.0,
       .max_distance_km = 5.0},
  };
}

inline std::string ScenarioTrafficCsv() {
  std::ostringstream out;
  out << "cell_id,datetime,traffic_cs,traffic_data\n";
  for (const auto& row : ScenarioTraffic()) {
    out << row.cell_id << ',' << cellwatch::core::FormatTelemetryDateTime(row.timestamp) << ','
        << row.traffic_cs << ',' << row.traffic_data << '\n';
  }
  return out.str();
}

inline std::string ScenarioGeometryCsv() {
  std::ostringstream out;
  out.precision(17);
  out << "cell_id,site_id,latitude,longitude,azimuth,max_distance_km\n";
  for (const auto& cell : ScenarioGeometry()) {
    out << cell.cell_id << ',' << cell.site_id << ',' << cell.latitude << ',' << cell.longitude
        << ',' << cell.azimuth_deg << ',' << cell.max_distance_km << '\n';
  }
  return out.str();
}

// Parameters that make the final A1 sample an INCREASE that alone qualifies.
inline std::string ScenarioConfigJson(const std::filesystem::path& output_dir) {
  return "{\n"
         "  \"inputs\": {\"traffic_csv\": \"traffic.csv\", \"geometry_csv\": \"geometry.csv\"},\n"
         "  \"classification\": {\"cs_multiplier\": 1.5, \"data_multiplier\": 2.0, "
         "\"window\": 24},\n"
         "  \"sustained\": {\"anomaly_window_hours\": 12, \"min_anomalies\": 1},\n"
         "  \"coverage\": {\"half_beamwidth_deg\": 60},\n"
         "  \"output_dir\": \"" +
         output_dir.generic_string() + "\"\n}\n";
}

inline void WriteScenarioFiles(const std::filesystem::path& dir,
                               const std::filesystem::path& output_dir) {
  WriteFileOrFail(dir / "traffic.csv", ScenarioTrafficCsv());
  WriteFileOrFail(dir / "geometry.csv", ScenarioGeometryCsv());
  WriteFileOrFail(dir / "analysis.json", ScenarioConfigJson(output_dir));
}

// In-memory source for pipeline tests.
class FakeTelemetrySource final : public cellwatch::io::ITelemetrySource {
public:
  FakeTelemetrySource(std::vector<cellwatch::traffic::TrafficObservation> traffic,
                      std::vector<cellwatch::geo::CellGeometry> geometry)
      : traffic_(std::move(traffic)), geometry_(std::move(geometry)) {}

  std::string Describe() const override {
    return "fake";
  }

  bool LoadTraffic(std::vector<cellwatch::traffic::TrafficObservation>& rows,
                   std::string& error) override {
    if (!traffic_error_.empty()) {
      error = traffic_error_;
      return false;
    }
    rows = traffic_;
    return true;
  }

  bool LoadGeometry(std::vector<cellwatch::geo::CellGeometry>& rows, std::string& error) override {
    (void)error;
    rows = geometry_;
    return true;
  }

  void FailTrafficWith(std::string error) {
    traffic_error_ = std::move(error);
  }

private:
  std::vector<cellwatch::traffic::TrafficObservation> traffic_;
  std::vector<cellwatch::geo::CellGeometry> geometry_;
  std::string traffic_error_;
};

} // namespace cellwatch::tests::common

#endif // CELLWATCH_TESTS_COMMON_ANALYSIS_FIXTURES_HPP_
