#include "common/temp_dir.hpp"
#include "config/analysis_config.hpp"
#include "config/validator.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using cellwatch::config::AnalysisConfig;
using cellwatch::config::LoadAnalysisConfigFile;
using cellwatch::config::ParseAnalysisConfigText;
using cellwatch::config::ValidateAnalysisConfigText;
using cellwatch::config::ValidationOptions;
using cellwatch::config::ValidationReport;

namespace {

bool HasIssue(const ValidationReport& report, const std::string& path) {
  return std::any_of(report.issues.begin(), report.issues.end(),
                     [&](const auto& issue) { return issue.path == path; });
}

} // namespace

TEST_CASE("Config defaults apply when keys are absent", "[config]") {
  AnalysisConfig config;
  std::string error;
  REQUIRE(ParseAnalysisConfigText("{}", config, error));
  REQUIRE(config.classification.cs_multiplier == 2.0);
  REQUIRE(config.classification.data_multiplier == 2.0);
  REQUIRE(config.classification.classification_window == 4U);
  REQUIRE(config.sustained.anomaly_window_hours == 24U);
  REQUIRE(config.sustained.min_anomalies == 3U);
  REQUIRE(config.coverage.half_beamwidth_deg == 60.0);
  REQUIRE(config.output_dir.string() == "out");
}

TEST_CASE("Config values populate the typed model", "[config]") {
  AnalysisConfig config;
  std::string error;
  REQUIRE(ParseAnalysisConfigText(R"({
    "inputs": {"traffic_csv": "t.csv", "geometry_csv": "/abs/g.csv"},
    "classification": {"cs_multiplier": 1.5, "data_multiplier": 3, "window": 24},
    "sustained": {"anomaly_window_hours": 12, "min_anomalies": 1},
    "coverage": {"half_beamwidth_deg": 45},
    "output_dir": "results"
  })",
                                  config, error));
  REQUIRE(config.inputs.traffic_csv.string() == "t.csv");
  REQUIRE(config.classification.cs_multiplier == 1.5);
  REQUIRE(config.classification.data_multiplier == 3.0);
  REQUIRE(config.classification.classification_window == 24U);
  REQUIRE(config.sustained.anomaly_window_hours == 12U);
  REQUIRE(config.sustained.min_anomalies == 1U);
  REQUIRE(config.coverage.half_beamwidth_deg == 45.0);
  REQUIRE(config.output_dir.string() == "results");
}

TEST_CASE("Config parse rejects broken JSON", "[config]") {
  AnalysisConfig config;
  std::string error;
  REQUIRE_FALSE(ParseAnalysisConfigText("{\"inputs\": ", config, error));
  REQUIRE_FALSE(ParseAnalysisConfigText("[1, 2]", config, error));
  REQUIRE(error.find("object") != std::string::npos);
}

TEST_CASE("Relative input paths resolve against the config directory", "[config]") {
  const auto root = cellwatch::tests::common::CreateUniqueTempDir("cellwatch-config-load");
  cellwatch::tests::common::WriteFileOrFail(
      root / "analysis.json",
      R"({"inputs": {"traffic_csv": "data/t.csv", "geometry_csv": "/opt/g.csv"}})");

  AnalysisConfig config;
  std::string error;
  REQUIRE(LoadAnalysisConfigFile(root / "analysis.json", config, error));
  REQUIRE(config.inputs.traffic_csv.string() == (root / "data/t.csv").string());
  REQUIRE(config.inputs.geometry_csv.string() == "/opt/g.csv");

  cellwatch::tests::common::RemovePathBestEffort(root);
}

TEST_CASE("Validator accepts a complete config", "[config][validator]") {
  ValidationReport report;
  std::string error;
  REQUIRE(ValidateAnalysisConfigText(R"({
    "inputs": {"traffic_csv": "t.csv", "geometry_csv": "g.csv"},
    "classification": {"cs_multiplier": 2, "data_multiplier": 2, "window": 1},
    "sustained": {"anomaly_window_hours": 24, "min_anomalies": 3},
    "coverage": {"half_beamwidth_deg": 180},
    "output_dir": "out"
  })",
                                     {}, report, error));
  REQUIRE(report.valid);
  REQUIRE(report.issues.empty());
}

TEST_CASE("Validator reports every issue with its path", "[config][validator]") {
  ValidationReport report;
  std::string error;
  REQUIRE(ValidateAnalysisConfigText(R"({
    "inputs": {"traffic_csv": ""},
    "classification": {"cs_multiplier": -1, "window": 2.5, "windw": 3},
    "sustained": {"anomaly_window_hours": 0, "min_anomalies": "3"},
    "coverage": {"half_beamwidth_deg": 0},
    "output_dir": 7,
    "extra": true
  })",
                                     {}, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "inputs.traffic_csv"));
  REQUIRE(HasIssue(report, "inputs.geometry_csv"));
  REQUIRE(HasIssue(report, "classification.cs_multiplier"));
  REQUIRE(HasIssue(report, "classification.window"));
  REQUIRE(HasIssue(report, "classification.windw"));
  REQUIRE(HasIssue(report, "sustained.anomaly_window_hours"));
  REQUIRE(HasIssue(report, "sustained.min_anomalies"));
  REQUIRE(HasIssue(report, "coverage.half_beamwidth_deg"));
  REQUIRE(HasIssue(report, "output_dir"));
  REQUIRE(HasIssue(report, "extra"));
}

TEST_CASE("Validator relaxes inputs supplied on the command line", "[config][validator]") {
  ValidationReport report;
  std::string error;
  ValidationOptions options;
  options.require_traffic_csv = false;
  options.require_geometry_csv = false;
  REQUIRE(ValidateAnalysisConfigText("{}", options, report, error));
  REQUIRE(report.valid);

  REQUIRE(ValidateAnalysisConfigText("{}", {}, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "inputs.traffic_csv"));
}

TEST_CASE("Validator flags unreachable sustained thresholds", "[config][validator]") {
  ValidationReport report;
  std::string error;
  ValidationOptions options{.require_traffic_csv = false, .require_geometry_csv = false};
  REQUIRE(ValidateAnalysisConfigText(
      R"({"sustained": {"anomaly_window_hours": 4, "min_anomalies": 5}})", options, report,
      error));
  REQUIRE(HasIssue(report, "sustained.min_anomalies"));
}

TEST_CASE("Validator reports JSON syntax errors under $", "[config][validator]") {
  ValidationReport report;
  std::string error;
  REQUIRE(ValidateAnalysisConfigText("{\"a\": }", {}, report, error));
  REQUIRE_FALSE(report.valid);
  REQUIRE(HasIssue(report, "$"));
}
