#include "common/temp_dir.hpp"
#include "common/traffic_fixtures.hpp"
#include "io/csv_telemetry_source.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>
#include <vector>

using cellwatch::geo::CellGeometry;
using cellwatch::io::CsvTelemetrySource;
using cellwatch::io::ParseGeometryCsv;
using cellwatch::io::ParseTrafficCsv;
using cellwatch::tests::common::Ts;
using cellwatch::traffic::TrafficObservation;

TEST_CASE("Traffic CSV resolves columns by name", "[io][csv][traffic]") {
  std::istringstream input("traffic_data,cell_id,extra,datetime,traffic_cs\r\n"
                           "12.5, A1 ,x,2024-01-01 10:00:00,3\r\n"
                           "\r\n"
                           "0,B7,y,2024-01-01T11:00:00,0.25\n");
  std::vector<TrafficObservation> rows;
  std::string error;
  REQUIRE(ParseTrafficCsv(input, "traffic.csv", rows, error));
  REQUIRE(rows.size() == 2U);
  REQUIRE(rows[0].cell_id == "A1");
  REQUIRE(rows[0].timestamp == Ts("2024-01-01 10:00:00"));
  REQUIRE(rows[0].traffic_cs == 3.0);
  REQUIRE(rows[0].traffic_data == 12.5);
  REQUIRE(rows[1].timestamp == Ts("2024-01-01 11:00:00"));
  REQUIRE(rows[1].traffic_cs == 0.25);
}

TEST_CASE("Traffic CSV reports line-numbered errors", "[io][csv][traffic]") {
  std::vector<TrafficObservation> rows;
  std::string error;

  SECTION("missing column") {
    std::istringstream input("cell_id,datetime,traffic_cs\nA,2024-01-01 00:00:00,1\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("traffic_data") != std::string::npos);
  }
  SECTION("bad number") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\n"
                             "A,2024-01-01 00:00:00,1,2\n"
                             "A,2024-01-01 01:00:00,abc,2\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("line 3") != std::string::npos);
    REQUIRE(error.find("traffic_cs") != std::string::npos);
  }
  SECTION("bad datetime") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\n"
                             "A,2024-02-31 00:00:00,1,2\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("datetime") != std::string::npos);
  }
  SECTION("negative traffic") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\n"
                             "A,2024-01-01 00:00:00,1,-2\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find(">= 0") != std::string::npos);
  }
  SECTION("short row") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\nA,2024-01-01 00:00:00\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("line 2") != std::string::npos);
  }
  SECTION("extra column") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\n"
                             "A,B,2024-01-01 00:00:00,1,2\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("line 2: expected 4 columns, got 5") != std::string::npos);
  }
  SECTION("unterminated quote") {
    std::istringstream input("cell_id,datetime,traffic_cs,traffic_data\n"
                             "\"A,2024-01-01 00:00:00,1,2\n");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
    REQUIRE(error.find("line 2") != std::string::npos);
  }
  SECTION("empty file") {
    std::istringstream input("");
    REQUIRE_FALSE(ParseTrafficCsv(input, "t.csv", rows, error));
  }
}

TEST_CASE("Geometry CSV parses every column", "[io][csv][geometry]") {
  std::istringstream input("\xEF\xBB\xBF" "cell_id,site_id,latitude,longitude,azimuth,max_distance_km\n"
                           "A1,S1,45.5,-73.25,120,3.5\n");
  std::vector<CellGeometry> rows;
  std::string error;
  REQUIRE(ParseGeometryCsv(input, "g.csv", rows, error));
  REQUIRE(rows.size() == 1U);
  REQUIRE(rows[0] == CellGeometry{.cell_id = "A1", .site_id = "S1", .latitude = 45.5,
                                  .longitude = -73.25, .azimuth_deg = 120.0,
                                  .max_distance_km = 3.5});
}

TEST_CASE("Quoted identifiers may contain commas", "[io][csv]") {
  std::istringstream traffic("cell_id,datetime,traffic_cs,traffic_data\n"
                             "\"A,1\",2024-01-01 00:00:00,1,2\n");
  std::vector<TrafficObservation> traffic_rows;
  std::string error;
  REQUIRE(ParseTrafficCsv(traffic, "t.csv", traffic_rows, error));
  REQUIRE(traffic_rows.size() == 1U);
  REQUIRE(traffic_rows[0].cell_id == "A,1");

  std::istringstream geometry("cell_id,site_id,latitude,longitude,azimuth,max_distance_km\n"
                              "\"A,1\",\"S \"\"north\"\"\",1,2,90,5\n");
  std::vector<CellGeometry> geometry_rows;
  REQUIRE(ParseGeometryCsv(geometry, "g.csv", geometry_rows, error));
  REQUIRE(geometry_rows.size() == 1U);
  REQUIRE(geometry_rows[0].cell_id == "A,1");
  REQUIRE(geometry_rows[0].site_id == "S \"north\"");
}

TEST_CASE("CsvTelemetrySource reads files from disk", "[io][csv]") {
  const auto root = cellwatch::tests::common::CreateUniqueTempDir("cellwatch-csv-source");
  cellwatch::tests::common::WriteFileOrFail(
      root / "traffic.csv", "cell_id,datetime,traffic_cs,traffic_data\nA,2024-01-01 00:00:00,1,2\n");
  cellwatch::tests::common::WriteFileOrFail(
      root / "geometry.csv",
      "cell_id,site_id,latitude,longitude,azimuth,max_distance_km\nA,S,0,0,0,1\n");

  CsvTelemetrySource source(root / "traffic.csv", root / "geometry.csv");
  REQUIRE(source.Describe() == "csv");

  std::vector<TrafficObservation> traffic;
  std::vector<CellGeometry> geometry;
  std::string error;
  REQUIRE(source.LoadTraffic(traffic, error));
  REQUIRE(source.LoadGeometry(geometry, error));
  REQUIRE(traffic.size() == 1U);
  REQUIRE(geometry.size() == 1U);

  CsvTelemetrySource missing(root / "nope.csv", root / "geometry.csv");
  REQUIRE_FALSE(missing.LoadTraffic(traffic, error));
  REQUIRE(error.find("nope.csv") != std::string::npos);

  cellwatch::tests::common::RemovePathBestEffort(root);
}
