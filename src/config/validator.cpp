#include "config/validator.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <set>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace cellwatch::config {

namespace {

using JsonValue = core::json::Value;

void AddIssue(ValidationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsObject(const JsonValue* value) {
  return value != nullptr && value->type == JsonValue::Type::kObject;
}

bool IsPositiveInteger(const JsonValue& value) {
  std::size_t ignored = 0;
  return core::json::AsPositiveCount(value, ignored);
}

void RejectUnknownKeys(const JsonValue& object_value, const std::string& prefix,
                       const std::set<std::string>& allowed, ValidationReport& report) {
  for (const auto& [key, value] : object_value.object_value) {
    (void)value;
    if (allowed.count(key) == 0U) {
      AddIssue(report, prefix.empty() ? key : prefix + "." + key, "is not a recognized key");
    }
  }
}

// Returns the section object, or nullptr when absent or reported as invalid.
const JsonValue* RequireSectionObject(const JsonValue& root, const std::string& key,
                                      ValidationReport& report) {
  const JsonValue* section = core::json::FindMember(root, key);
  if (section == nullptr) {
    return nullptr;
  }
  if (!IsObject(section)) {
    AddIssue(report, key, "must be an object");
    return nullptr;
  }
  return section;
}

void ValidatePathString(const JsonValue* section, const std::string& section_name,
                        const std::string& key, bool required, std::string_view flag_hint,
                        ValidationReport& report) {
  const std::string path = section_name.empty() ? key : section_name + "." + key;
  const JsonValue* value = section == nullptr ? nullptr : core::json::FindMember(*section, key);
  if (value == nullptr) {
    if (required) {
      AddIssue(report, path, "is required (or pass " + std::string(flag_hint) + ")");
    }
    return;
  }
  if (value->type != JsonValue::Type::kString) {
    AddIssue(report, path, "must be a string");
    return;
  }
  if (value->string_value.empty()) {
    AddIssue(report, path, "must not be empty");
  }
}

void ValidateInputs(const JsonValue& root, const ValidationOptions& options,
                    ValidationReport& report) {
  const JsonValue* inputs = RequireSectionObject(root, "inputs", report);
  if (inputs == nullptr && core::json::FindMember(root, "inputs") != nullptr) {
    return;
  }
  ValidatePathString(inputs, "inputs", "traffic_csv", options.require_traffic_csv, "--traffic",
                     report);
  ValidatePathString(inputs, "inputs", "geometry_csv", options.require_geometry_csv,
                     "--geometry", report);
  if (inputs != nullptr) {
    RejectUnknownKeys(*inputs, "inputs", {"traffic_csv", "geometry_csv"}, report);
  }
}

void ValidateClassification(const JsonValue& root, ValidationReport& report) {
  const JsonValue* section = RequireSectionObject(root, "classification", report);
  if (section == nullptr) {
    return;
  }

  for (const char* key : {"cs_multiplier", "data_multiplier"}) {
    const JsonValue* value = core::json::FindMember(*section, key);
    if (value == nullptr) {
      continue;
    }
    if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value) ||
        value->number_value < 0.0) {
      AddIssue(report, std::string("classification.") + key, "must be a number >= 0");
    }
  }

  if (const JsonValue* window = core::json::FindMember(*section, "window"); window != nullptr) {
    if (!IsPositiveInteger(*window)) {
      AddIssue(report, "classification.window", "must be a positive integer");
    }
  }

  RejectUnknownKeys(*section, "classification", {"cs_multiplier", "data_multiplier", "window"},
                    report);
}

void ValidateSustained(const JsonValue& root, ValidationReport& report) {
  const JsonValue* section = RequireSectionObject(root, "sustained", report);
  if (section == nullptr) {
    return;
  }

  for (const char* key : {"anomaly_window_hours", "min_anomalies"}) {
    const JsonValue* value = core::json::FindMember(*section, key);
    if (value != nullptr && !IsPositiveInteger(*value)) {
      AddIssue(report, std::string("sustained.") + key, "must be a positive integer");
    }
  }

  const JsonValue* hours = core::json::FindMember(*section, "anomaly_window_hours");
  const JsonValue* min_anomalies = core::json::FindMember(*section, "min_anomalies");
  const double hours_value = hours != nullptr && IsPositiveInteger(*hours) ? hours->number_value
                                                                           : 24.0;
  if (min_anomalies != nullptr && IsPositiveInteger(*min_anomalies) &&
      min_anomalies->number_value > hours_value) {
    AddIssue(report, "sustained.min_anomalies",
             "must not exceed sustained.anomaly_window_hours (the threshold could never be met)");
  }

  RejectUnknownKeys(*section, "sustained", {"anomaly_window_hours", "min_anomalies"}, report);
}

void ValidateCoverage(const JsonValue& root, ValidationReport& report) {
  const JsonValue* section = RequireSectionObject(root, "coverage", report);
  if (section == nullptr) {
    return;
  }

  if (const JsonValue* half = core::json::FindMember(*section, "half_beamwidth_deg");
      half != nullptr) {
    if (half->type != JsonValue::Type::kNumber || !std::isfinite(half->number_value) ||
        half->number_value <= 0.0 || half->number_value > 180.0) {
      AddIssue(report, "coverage.half_beamwidth_deg", "must be a number in (0, 180]");
    }
  }

  RejectUnknownKeys(*section, "coverage", {"half_beamwidth_deg"}, report);
}

void ValidateConfigObject(const JsonValue& root, const ValidationOptions& options,
                          ValidationReport& report) {
  if (root.type != JsonValue::Type::kObject) {
    AddIssue(report, "$", "config root must be a JSON object");
    return;
  }

  ValidateInputs(root, options, report);
  ValidateClassification(root, report);
  ValidateSustained(root, report);
  ValidateCoverage(root, report);
  ValidatePathString(&root, "", "output_dir", false, "--out", report);

  RejectUnknownKeys(root, "",
                    {"inputs", "classification", "sustained", "coverage", "output_dir"}, report);
}

} // namespace

bool ValidateAnalysisConfigText(std::string_view json_text, const ValidationOptions& options,
                                ValidationReport& report, std::string& error) {
  (void)error;
  report = ValidationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$",
             parse_error + " (fix JSON syntax and rerun 'cellwatch validate <config.json>')");
    report.valid = false;
    return true;
  }

  ValidateConfigObject(root, options, report);
  report.valid = report.issues.empty();
  return true;
}

bool ValidateAnalysisConfigFile(const fs::path& config_path, const ValidationOptions& options,
                                ValidationReport& report, std::string& error) {
  std::string contents;
  if (!core::ReadTextFile(config_path, contents, error)) {
    error = "unable to read config file: " + config_path.string();
    return false;
  }

  if (contents.empty()) {
    report = ValidationReport{};
    AddIssue(report, "$", "config file is empty; provide a JSON object");
    report.valid = false;
    return true;
  }

  return ValidateAnalysisConfigText(contents, options, report, error);
}

} // namespace cellwatch::config
