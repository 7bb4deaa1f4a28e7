#pragma once

#include "neighbors/facing_resolver.hpp"
#include "traffic/classifier.hpp"
#include "traffic/sustained_filter.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace cellwatch::config {

// Typed analysis parameters.
//
// Design notes:
// - The model is lenient: a key with an unexpected type keeps its default.
//   `ValidateAnalysisConfigText` is the strict gate and runs first in the CLI.
// - Relative input paths are resolved against the directory of the config
//   file when loaded with `LoadAnalysisConfigFile`. `output_dir` stays
//   relative to the working directory.
struct AnalysisConfig {
  struct Inputs {
    std::filesystem::path traffic_csv;
    std::filesystem::path geometry_csv;
  } inputs;

  traffic::ClassifierParams classification;
  traffic::SustainedParams sustained;
  neighbors::FacingOptions coverage;

  std::filesystem::path output_dir = "out";
};

// Parses config JSON text into `config`.
//
// Contract:
// - Missing keys keep their defaults.
// - Returns false for JSON syntax errors or a non-object root.
bool ParseAnalysisConfigText(std::string_view json_text, AnalysisConfig& config,
                             std::string& error);

// Reads and parses a config file, resolving relative input paths against the
// file's parent directory.
bool LoadAnalysisConfigFile(const std::filesystem::path& config_path, AnalysisConfig& config,
                            std::string& error);

} // namespace cellwatch::config
