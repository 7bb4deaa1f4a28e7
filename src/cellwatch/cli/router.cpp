#include "cellwatch/cli/router.hpp"

#include "config/analysis_config.hpp"
#include "config/validator.hpp"
#include "core/csv_utils.hpp"
#include "core/errors/exit_codes.hpp"
#include "geo/cell_geometry.hpp"
#include "geo/geometry.hpp"
#include "io/csv_telemetry_source.hpp"
#include "io/result_writer.hpp"
#include "neighbors/facing_resolver.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cellwatch::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitInputInvalid = core::errors::ToInt(core::errors::ExitCode::kInputInvalid);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  cellwatch analyze <config.json> [--traffic <csv>] [--geometry <csv>] [--out <dir>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  cellwatch neighbors <geometry.csv> <cell_id> [--half-beamwidth <deg>]\n"
      << "  cellwatch validate <config.json>\n"
      << "  cellwatch version\n";
}

bool ValidateConfigPath(const fs::path& config_path, std::string& error) {
  if (config_path.empty()) {
    error = "config path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (!fs::exists(config_path, ec) || ec) {
    error = "config file not found: " + config_path.string();
    return false;
  }
  if (!fs::is_regular_file(config_path, ec) || ec) {
    error = "config path must point to a regular file: " + config_path.string();
    return false;
  }
  return true;
}

void PrintIssues(const fs::path& config_path, const config::ValidationReport& report) {
  std::cerr << "invalid config: " << config_path.string() << '\n';
  for (const auto& issue : report.issues) {
    std::cerr << "  - " << issue.path << ": " << issue.message << '\n';
  }
}

std::string MakeAnalysisId(std::chrono::system_clock::time_point now) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "analysis-" + std::to_string(millis);
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "cellwatch 0.1.0\n";
  return kExitSuccess;
}

int CommandValidate(const std::vector<std::string_view>& args) {
  if (args.size() != 1) {
    std::cerr << "error: validate requires exactly 1 argument: <config.json>\n";
    return kExitUsage;
  }

  std::string error;
  const fs::path config_path(args.front());
  if (!ValidateConfigPath(config_path, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::ValidationReport report;
  if (!config::ValidateAnalysisConfigFile(config_path, config::ValidationOptions{}, report,
                                          error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  if (!report.valid) {
    PrintIssues(config_path, report);
    return kExitConfigInvalid;
  }

  std::cout << "valid: " << config_path.string() << '\n';
  return kExitSuccess;
}

// `analyze` contract:
// - exactly one config path
// - optional input/output overrides and log level
// Unknown flags or extra positional args are usage errors.
bool ParseAnalyzeOptions(const std::vector<std::string_view>& args, AnalyzeOptions& options,
                         std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--traffic" || token == "--geometry" || token == "--out") {
      if (i + 1 >= args.size()) {
        error = "missing value for " + std::string(token);
        return false;
      }
      const fs::path value(args[i + 1]);
      if (token == "--traffic") {
        options.traffic_csv = value;
      } else if (token == "--geometry") {
        options.geometry_csv = value;
      } else {
        options.output_dir = value;
      }
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (!token.empty() && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    if (!options.config_path.empty()) {
      error = "analyze accepts exactly 1 config path";
      return false;
    }
    options.config_path = fs::path(token);
  }

  if (options.config_path.empty()) {
    error = "analyze requires exactly 1 argument: <config.json>";
    return false;
  }
  return true;
}

int CommandAnalyze(const std::vector<std::string_view>& args) {
  AnalyzeOptions options;
  std::string error;
  if (!ParseAnalyzeOptions(args, options, error)) {
    std::cerr << "error: " << error << '\n';
    PrintUsage(std::cerr);
    return kExitUsage;
  }
  return ExecuteAnalysis(options, nullptr);
}

int CommandNeighbors(const std::vector<std::string_view>& args) {
  std::vector<std::string_view> positional;
  neighbors::FacingOptions facing;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token == "--half-beamwidth") {
      if (i + 1 >= args.size()) {
        std::cerr << "error: missing value for --half-beamwidth\n";
        return kExitUsage;
      }
      double parsed = 0.0;
      if (!core::csv::ParseDouble(args[i + 1], parsed) || parsed <= 0.0 || parsed > 180.0) {
        std::cerr << "error: --half-beamwidth must be a number in (0, 180]\n";
        return kExitUsage;
      }
      facing.half_beamwidth_deg = parsed;
      ++i;
      continue;
    }
    if (!token.empty() && token.front() == '-') {
      std::cerr << "error: unknown option: " << token << '\n';
      return kExitUsage;
    }
    positional.push_back(token);
  }
  if (positional.size() != 2U) {
    std::cerr << "error: neighbors requires exactly 2 arguments: <geometry.csv> <cell_id>\n";
    return kExitUsage;
  }

  const fs::path geometry_path(positional[0]);
  const std::string target(positional[1]);

  std::ifstream input(geometry_path, std::ios::binary);
  if (!input) {
    std::cerr << "error: unable to open geometry csv: " << geometry_path.string() << '\n';
    return kExitFailure;
  }

  std::string error;
  std::vector<geo::CellGeometry> rows;
  geo::GeometryTable table;
  if (!io::ParseGeometryCsv(input, geometry_path.string(), rows, error) ||
      !geo::GeometryTable::Build(std::move(rows), table, error)) {
    std::cerr << "error: invalid geometry: " << error << '\n';
    return kExitInputInvalid;
  }

  const neighbors::FacingCellsResult result = neighbors::FindFacingCells(table, target, facing);
  if (result.status == neighbors::ResolveStatus::kTargetNotFound) {
    std::cerr << "error: cell not found in geometry: " << target << '\n';
    return kExitFailure;
  }

  const geo::CellGeometry* target_cell = table.Find(target);
  std::cout << "neighbor_cell,site_id,distance_km,bearing_deg\n";
  std::cout << std::fixed << std::setprecision(3);
  for (const auto& neighbor : result.neighbors) {
    const double distance_km =
        geo::GreatCircleDistanceKm(target_cell->Position(), neighbor.Position());
    const double bearing = geo::Bearing(target_cell->latitude, target_cell->longitude,
                                        neighbor.latitude, neighbor.longitude);
    std::cout << neighbor.cell_id << ',' << neighbor.site_id << ',' << distance_km << ','
              << bearing << '\n';
  }
  return kExitSuccess;
}

} // namespace

int ExecuteAnalysis(const AnalyzeOptions& options, pipeline::AnalysisResult* result) {
  core::logging::Logger logger(options.log_level);
  logger.SetAnalysisId(MakeAnalysisId(std::chrono::system_clock::now()));
  logger.Info("analysis requested", {{"config_path", options.config_path.string()}});

  std::string error;
  if (!ValidateConfigPath(options.config_path, error)) {
    logger.Error("config path validation failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  config::ValidationOptions validation;
  validation.require_traffic_csv = !options.traffic_csv.has_value();
  validation.require_geometry_csv = !options.geometry_csv.has_value();
  config::ValidationReport report;
  if (!config::ValidateAnalysisConfigFile(options.config_path, validation, report, error)) {
    logger.Error("config validation failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }
  if (!report.valid) {
    logger.Error("config is invalid", {{"issues", std::to_string(report.issues.size())}});
    PrintIssues(options.config_path, report);
    return kExitConfigInvalid;
  }

  config::AnalysisConfig analysis_config;
  if (!config::LoadAnalysisConfigFile(options.config_path, analysis_config, error)) {
    logger.Error("failed to load config", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }
  if (options.traffic_csv.has_value()) {
    analysis_config.inputs.traffic_csv = *options.traffic_csv;
  }
  if (options.geometry_csv.has_value()) {
    analysis_config.inputs.geometry_csv = *options.geometry_csv;
  }
  if (options.output_dir.has_value()) {
    analysis_config.output_dir = *options.output_dir;
  }

  logger.Info("analysis configured",
              {{"traffic_csv", analysis_config.inputs.traffic_csv.string()},
               {"geometry_csv", analysis_config.inputs.geometry_csv.string()},
               {"output_dir", analysis_config.output_dir.string()}});

  io::CsvTelemetrySource source(analysis_config.inputs.traffic_csv,
                                analysis_config.inputs.geometry_csv);
  pipeline::AnalysisResult analysis;
  if (!pipeline::RunAnalysis(source, analysis_config, logger, analysis, error)) {
    logger.Error("analysis failed", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitInputInvalid;
  }

  io::ArtifactPaths paths;
  if (!io::WriteAnalysisArtifacts(analysis, analysis_config, analysis_config.output_dir, paths,
                                  error)) {
    logger.Error("failed to write analysis artifacts", {{"error", error}});
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  logger.Info("analysis completed",
              {{"anomalous_cells", std::to_string(analysis.selection.anomalous_cells.size())},
               {"summary", paths.summary_json.string()}});

  std::cout << "analysis complete: " << analysis_config.output_dir.string() << '\n'
            << "anomalous cells: " << analysis.selection.anomalous_cells.size() << '\n'
            << "neighbor relations: " << analysis.aggregation.relations.size() << '\n'
            << "combined_traffic: " << paths.combined_traffic_csv.string() << '\n'
            << "neighbor_map: " << paths.neighbor_map_csv.string() << '\n'
            << "involved_geometry: " << paths.involved_geometry_csv.string() << '\n'
            << "summary: " << paths.summary_json.string() << '\n';

  if (result != nullptr) {
    *result = std::move(analysis);
  }
  return kExitSuccess;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  if (command == "validate") {
    return CommandValidate(args);
  }

  if (command == "analyze") {
    return CommandAnalyze(args);
  }

  if (command == "neighbors") {
    return CommandNeighbors(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace cellwatch::cli
