#include "config/analysis_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <initializer_list>
#include <optional>

namespace fs = std::filesystem;

namespace cellwatch::config {

namespace {

using JsonValue = core::json::Value;

std::optional<std::size_t> ReadCountField(const JsonValue& root,
                                          std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr) {
    return std::nullopt;
  }
  std::size_t parsed = 0;
  if (!core::json::AsPositiveCount(*value, parsed)) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<double> ReadNumberField(const JsonValue& root,
                                      std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr || value->type != JsonValue::Type::kNumber ||
      !std::isfinite(value->number_value)) {
    return std::nullopt;
  }
  return value->number_value;
}

std::optional<std::string> ReadStringField(const JsonValue& root,
                                           std::initializer_list<std::string_view> path) {
  const JsonValue* value = core::json::FindPath(root, path);
  if (value == nullptr || value->type != JsonValue::Type::kString ||
      value->string_value.empty()) {
    return std::nullopt;
  }
  return value->string_value;
}

void ParseConfigRoot(const JsonValue& root, AnalysisConfig& config) {
  if (const auto traffic = ReadStringField(root, {"inputs", "traffic_csv"})) {
    config.inputs.traffic_csv = *traffic;
  }
  if (const auto geometry = ReadStringField(root, {"inputs", "geometry_csv"})) {
    config.inputs.geometry_csv = *geometry;
  }

  if (const auto cs = ReadNumberField(root, {"classification", "cs_multiplier"})) {
    config.classification.cs_multiplier = *cs;
  }
  if (const auto data = ReadNumberField(root, {"classification", "data_multiplier"})) {
    config.classification.data_multiplier = *data;
  }
  if (const auto window = ReadCountField(root, {"classification", "window"})) {
    config.classification.classification_window = *window;
  }

  if (const auto hours = ReadCountField(root, {"sustained", "anomaly_window_hours"})) {
    config.sustained.anomaly_window_hours = *hours;
  }
  if (const auto min_anomalies = ReadCountField(root, {"sustained", "min_anomalies"})) {
    config.sustained.min_anomalies = *min_anomalies;
  }

  if (const auto half = ReadNumberField(root, {"coverage", "half_beamwidth_deg"})) {
    config.coverage.half_beamwidth_deg = *half;
  }

  if (const auto output_dir = ReadStringField(root, {"output_dir"})) {
    config.output_dir = *output_dir;
  }
}

fs::path ResolveAgainst(const fs::path& base_dir, const fs::path& path) {
  if (path.empty() || path.is_absolute() || base_dir.empty()) {
    return path;
  }
  return base_dir / path;
}

} // namespace

bool ParseAnalysisConfigText(std::string_view json_text, AnalysisConfig& config,
                             std::string& error) {
  config = AnalysisConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  ParseConfigRoot(root, config);
  return true;
}

bool LoadAnalysisConfigFile(const fs::path& config_path, AnalysisConfig& config,
                            std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    return false;
  }
  if (!ParseAnalysisConfigText(contents, config, error)) {
    error = config_path.string() + ": " + error;
    return false;
  }

  const fs::path base_dir = config_path.parent_path();
  config.inputs.traffic_csv = ResolveAgainst(base_dir, config.inputs.traffic_csv);
  config.inputs.geometry_csv = ResolveAgainst(base_dir, config.inputs.geometry_csv);
  return true;
}

} // namespace cellwatch::config
