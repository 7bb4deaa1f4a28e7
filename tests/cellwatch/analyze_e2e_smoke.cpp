#include "common/analysis_fixtures.hpp"
#include "common/assertions.hpp"
#include "common/cli_dispatch.hpp"
#include "common/temp_dir.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace cellwatch::tests::common;

int main() {
  const fs::path temp_root = CreateUniqueTempDir("cellwatch-analyze-e2e");
  const fs::path config_out = temp_root / "from-config";
  const fs::path flag_out = temp_root / "from-flag";
  WriteScenarioFiles(temp_root, config_out);

  const DispatchOutput first = DispatchCaptured({
      "cellwatch",
      "analyze",
      (temp_root / "analysis.json").string(),
  });
  AssertExitCode(first.exit_code, 0, "analyze with config output_dir");
  AssertContains(first.out, "anomalous cells: 1");
  AssertContains(first.err, "msg=\"analysis completed\"");

  const std::string neighbor_map = ReadFileToString(config_out / "neighbor_map.csv");
  if (neighbor_map != "anomaly_cell,neighbor_cell\nA1,A2\n") {
    Fail("unexpected neighbor map:\n" + neighbor_map);
  }
  const std::string combined = ReadFileToString(config_out / "combined_traffic.csv");
  AssertContains(combined, "A1,2024-06-10 10:00:00,200,");
  AssertContains(combined, ",INCREASE,STABLE,anomaly\n");
  AssertNotContains(combined, "FAR,");
  AssertContains(ReadFileToString(config_out / "involved_geometry.csv"), "\nA2,S2,");
  AssertContains(ReadFileToString(config_out / "summary.json"), "\"min_anomalies\": 1");

  // Flags override the config file; a debug log level adds per-cell lines.
  const DispatchOutput second = DispatchCaptured({
      "cellwatch",
      "analyze",
      (temp_root / "analysis.json").string(),
      "--out",
      flag_out.string(),
      "--traffic",
      (temp_root / "traffic.csv").string(),
      "--log-level",
      "debug",
  });
  AssertExitCode(second.exit_code, 0, "analyze with --out override");
  AssertContains(second.err, "level=DEBUG");
  AssertContains(second.err, "msg=\"anomalous cell\"");
  if (!fs::exists(flag_out / "summary.json")) {
    Fail("--out override did not receive artifacts");
  }

  RemovePathBestEffort(temp_root);
  return 0;
}
