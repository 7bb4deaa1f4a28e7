#pragma once

#include "core/logging/logger.hpp"
#include "pipeline/analysis_pipeline.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace cellwatch::cli {

// Options for one `cellwatch analyze` invocation. CLI flags override the
// matching config file values.
struct AnalyzeOptions {
  std::filesystem::path config_path;
  std::optional<std::filesystem::path> traffic_csv;
  std::optional<std::filesystem::path> geometry_csv;
  std::optional<std::filesystem::path> output_dir;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Runs validate -> load -> analyze -> write through the same path as
// `cellwatch analyze`, so schedulers embedding the library get identical
// exit codes. `result` is optional and receives the in-memory tables.
int ExecuteAnalysis(const AnalyzeOptions& options, pipeline::AnalysisResult* result);

// Routes `cellwatch` subcommands and returns process exit codes with a stable
// contract for schedulers:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => config file failed validation
//   11 => traffic or geometry input rejected
int Dispatch(int argc, char** argv);

} // namespace cellwatch::cli
