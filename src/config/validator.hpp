#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace cellwatch::config {

struct ValidationIssue {
  std::string path;
  std::string message;
};

struct ValidationReport {
  bool valid = false;
  std::vector<ValidationIssue> issues;
};

// Which input paths must appear in the file. `analyze` relaxes these when the
// path is supplied by a CLI flag instead.
struct ValidationOptions {
  bool require_traffic_csv = true;
  bool require_geometry_csv = true;
};

// Validates config JSON text.
//
// Contract:
// - Returns true when validation completed (even if the config is invalid).
// - Populates `report.valid` and `report.issues`; every issue carries the
//   dotted JSON path it refers to.
// - On parse errors, emits one issue under path `$`.
// - Unknown keys are reported so typos do not silently fall back to defaults.
bool ValidateAnalysisConfigText(std::string_view json_text, const ValidationOptions& options,
                                ValidationReport& report, std::string& error);

// Loads and validates a config file.
//
// Contract:
// - Returns false if file I/O fails and sets `error`.
// - Otherwise returns true and populates `report`.
bool ValidateAnalysisConfigFile(const std::filesystem::path& config_path,
                                const ValidationOptions& options, ValidationReport& report,
                                std::string& error);

} // namespace cellwatch::config
